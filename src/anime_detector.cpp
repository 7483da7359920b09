#include "anime_detector.hpp"
#include "config.hpp"
#include "device_manager.hpp"
#include <onnxruntime_cxx_api.h>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace screencap {

LetterboxInfo letterbox(const cv::Mat& frame, int size, cv::Mat& out) {
    LetterboxInfo info;
    info.scale = std::min(static_cast<float>(size) / frame.cols,
                          static_cast<float>(size) / frame.rows);

    const int new_w = static_cast<int>(std::round(frame.cols * info.scale));
    const int new_h = static_cast<int>(std::round(frame.rows * info.scale));
    info.pad_x = (size - new_w) / 2;
    info.pad_y = (size - new_h) / 2;

    cv::Mat resized;
    if (new_w != frame.cols || new_h != frame.rows) {
        cv::resize(frame, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_LINEAR);
    } else {
        resized = frame;
    }

    cv::copyMakeBorder(resized, out,
                       info.pad_y, size - new_h - info.pad_y,
                       info.pad_x, size - new_w - info.pad_x,
                       cv::BORDER_CONSTANT, cv::Scalar(114, 114, 114));
    return info;
}

YoloOutputLayout yolo_layout_from_shape(const std::vector<int64_t>& shape) {
    if (shape.size() != 3 || shape[0] != 1) {
        throw std::runtime_error("Unexpected YOLO output rank: " + std::to_string(shape.size()));
    }

    // Detection heads have far more anchors than channels
    YoloOutputLayout layout;
    layout.anchors_major = shape[1] > shape[2];
    layout.num_channels = layout.anchors_major ? shape[2] : shape[1];
    layout.num_anchors = layout.anchors_major ? shape[1] : shape[2];

    if (layout.num_channels < 5) {
        throw std::runtime_error("YOLO output has no class scores (channels: " +
                                 std::to_string(layout.num_channels) + ")");
    }
    return layout;
}

std::vector<Detection> decode_yolo_output(const float* data,
                                          const YoloOutputLayout& layout,
                                          float confidence_threshold,
                                          float nms_threshold,
                                          const LetterboxInfo& letterbox_info,
                                          const cv::Size& frame_size) {
    const int64_t channels = layout.num_channels;
    const int64_t anchors = layout.num_anchors;

    auto value = [&](int64_t anchor, int64_t channel) {
        return layout.anchors_major ? data[anchor * channels + channel]
                                    : data[channel * anchors + anchor];
    };

    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    std::vector<int> class_ids;

    for (int64_t a = 0; a < anchors; ++a) {
        int best_class = 0;
        float best_score = value(a, 4);
        for (int64_t c = 5; c < channels; ++c) {
            const float score = value(a, c);
            if (score > best_score) {
                best_score = score;
                best_class = static_cast<int>(c - 4);
            }
        }
        if (best_score < confidence_threshold) {
            continue;
        }

        const float cx = value(a, 0);
        const float cy = value(a, 1);
        const float w = value(a, 2);
        const float h = value(a, 3);

        const float x1 = (cx - w / 2.0f - letterbox_info.pad_x) / letterbox_info.scale;
        const float y1 = (cy - h / 2.0f - letterbox_info.pad_y) / letterbox_info.scale;
        const float x2 = (cx + w / 2.0f - letterbox_info.pad_x) / letterbox_info.scale;
        const float y2 = (cy + h / 2.0f - letterbox_info.pad_y) / letterbox_info.scale;

        boxes.emplace_back(cv::Point(cvRound(x1), cvRound(y1)),
                           cv::Point(cvRound(x2), cvRound(y2)));
        scores.push_back(best_score);
        class_ids.push_back(best_class);
    }

    std::vector<int> keep;
    // Scores were filtered above; NMSBoxes drops scores equal to its threshold
    cv::dnn::NMSBoxes(boxes, scores, 0.0f, nms_threshold, keep);

    std::vector<Detection> detections;
    detections.reserve(keep.size());
    for (int idx : keep) {
        detections.push_back({boxes[idx], scores[idx], class_ids[idx]});
    }
    return clip_detections(std::move(detections), frame_size);
}

class AnimeDetector::Impl {
public:
    explicit Impl(const ScreenCapConfig& config)
        : config_(config.anime)
        , num_threads_(config.num_threads) {
        const auto model_path = config.anime_model_path();
        if (!std::filesystem::exists(model_path)) {
            throw std::runtime_error("Anime detection model not found: " + model_path.string() +
                                     " (export your YOLOv8 weights to ONNX and place them in " +
                                     config.model_path().string() + ")");
        }

        device_type_ = DeviceManager::instance().select_device(config.use_gpu);
        load_model(model_path.string());
    }

    std::vector<Detection> detect(const cv::Mat& frame) {
        if (frame.empty()) {
            return {};
        }

        cv::Mat canvas;
        const LetterboxInfo info = letterbox(frame, input_size_, canvas);

        // NCHW, RGB, [0, 1]
        cv::Mat blob = cv::dnn::blobFromImage(canvas, 1.0 / 255.0, cv::Size(), cv::Scalar(),
                                              true, false, CV_32F);

        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        const std::array<int64_t, 4> input_shape{1, 3, input_size_, input_size_};
        auto input_tensor = Ort::Value::CreateTensor<float>(
            memory_info, blob.ptr<float>(), blob.total(),
            input_shape.data(), input_shape.size());

        auto output_tensors = ort_session_->Run(Ort::RunOptions{nullptr},
                                                input_name_ptrs_.data(),
                                                &input_tensor,
                                                1,
                                                output_name_ptrs_.data(),
                                                1);

        const auto shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();
        const auto layout = yolo_layout_from_shape(shape);

        return decode_yolo_output(output_tensors[0].GetTensorData<float>(), layout,
                                  config_.confidence_threshold, config_.nms_threshold,
                                  info, frame.size());
    }

private:
    void load_model(const std::string& model_path) {
        auto start_time = std::chrono::high_resolution_clock::now();

        ort_env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "ScreenCapAnime");

        Ort::SessionOptions session_options;
        if (num_threads_ > 0) {
            session_options.SetIntraOpNumThreads(num_threads_);
        }
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        if (device_type_ == "CUDA") {
            const auto providers = Ort::GetAvailableProviders();
            if (std::find(providers.begin(), providers.end(), "CUDAExecutionProvider") != providers.end()) {
                OrtCUDAProviderOptions cuda_options{};
                session_options.AppendExecutionProvider_CUDA(cuda_options);
            } else {
                std::cout << "ONNX Runtime built without CUDA, using CPU" << std::endl;
                device_type_ = "CPU";
            }
        }

        std::cout << "Loading anime detection model from: " << model_path << std::endl;
#ifdef _WIN32
        std::wstring wide_path(model_path.begin(), model_path.end());
        ort_session_ = std::make_unique<Ort::Session>(*ort_env_, wide_path.c_str(), session_options);
#else
        ort_session_ = std::make_unique<Ort::Session>(*ort_env_, model_path.c_str(), session_options);
#endif

        get_model_info();

        auto end_time = std::chrono::high_resolution_clock::now();
        std::cout << "Anime detector ready in "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count()
                  << "ms (device: " << device_type_ << ", input: " << input_size_ << "x" << input_size_
                  << ", confidence >= " << config_.confidence_threshold << ")" << std::endl;
    }

    void get_model_info() {
        Ort::AllocatorWithDefaultOptions allocator;

        if (ort_session_->GetInputCount() < 1 || ort_session_->GetOutputCount() < 1) {
            throw std::runtime_error("Anime detection model must have an image input and a detection output");
        }

        input_names_.clear();
        output_names_.clear();
        input_names_.emplace_back(ort_session_->GetInputNameAllocated(0, allocator).get());
        output_names_.emplace_back(ort_session_->GetOutputNameAllocated(0, allocator).get());

        // Create pointers after all strings are stored
        input_name_ptrs_ = {input_names_[0].c_str()};
        output_name_ptrs_ = {output_names_[0].c_str()};

        auto input_shape = ort_session_->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (input_shape.size() != 4) {
            throw std::runtime_error("Anime detection model input must be NCHW, got rank " +
                                     std::to_string(input_shape.size()));
        }

        // Static exports fix the input size; dynamic ones take the configured size
        input_size_ = config_.input_size;
        if (input_shape[2] > 0 && input_shape[2] != input_size_) {
            std::cout << "Model input is fixed at " << input_shape[2]
                      << ", overriding configured size " << input_size_ << std::endl;
            input_size_ = static_cast<int>(input_shape[2]);
        }

        std::cout << "Input: " << input_names_[0] << ", output: " << output_names_[0] << std::endl;
    }

    AnimeConfig config_;
    int num_threads_ = 0;
    int input_size_ = 640;
    std::string device_type_;

    std::unique_ptr<Ort::Env> ort_env_;
    std::unique_ptr<Ort::Session> ort_session_;
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<const char*> input_name_ptrs_;
    std::vector<const char*> output_name_ptrs_;
};

AnimeDetector::AnimeDetector(const ScreenCapConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

AnimeDetector::~AnimeDetector() = default;

std::vector<Detection> AnimeDetector::detect(const cv::Mat& frame) {
    return pimpl_->detect(frame);
}

} // namespace screencap
