#include "realistic_face_detector.hpp"
#include "config.hpp"
#include "device_manager.hpp"
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace screencap {

class RealisticFaceDetector::Impl {
public:
    explicit Impl(const ScreenCapConfig& config) : config_(config.realistic) {
        if (config_.model == FaceModel::Cascade) {
            load_cascade(config.cascade_path());
        } else {
            load_yunet(config.cnn_face_model_path(),
                       DeviceManager::instance().select_device(config.use_gpu));
        }
    }

    std::vector<Detection> detect(const cv::Mat& frame) {
        if (frame.empty()) {
            return {};
        }

        auto detections = config_.model == FaceModel::Cascade
            ? detect_cascade(frame)
            : detect_yunet(frame);
        return clip_detections(std::move(detections), frame.size());
    }

    std::string name() const {
        return config_.model == FaceModel::Cascade ? "Realistic (Cascade)" : "Realistic (CNN)";
    }

private:
    void load_cascade(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Face cascade not found: " + path.string());
        }
        if (!cascade_.load(path.string())) {
            throw std::runtime_error("Failed to load face cascade: " + path.string());
        }
        std::cout << "Loaded face cascade from: " << path.string() << std::endl;
    }

    void load_yunet(const std::filesystem::path& path, const std::string& device) {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Face detection model not found: " + path.string());
        }

        int backend = cv::dnn::DNN_BACKEND_OPENCV;
        int target = cv::dnn::DNN_TARGET_CPU;
        if (device == "CUDA") {
            backend = cv::dnn::DNN_BACKEND_CUDA;
            target = cv::dnn::DNN_TARGET_CUDA;
        }

        yunet_ = cv::FaceDetectorYN::create(path.string(), "", cv::Size(320, 320),
                                            config_.score_threshold, config_.nms_threshold,
                                            5000, backend, target);
        if (yunet_.empty()) {
            throw std::runtime_error("Failed to load face detection model: " + path.string());
        }
        std::cout << "Loaded YuNet face model from: " << path.string()
                  << " (device: " << device << ")" << std::endl;
    }

    std::vector<Detection> detect_cascade(const cv::Mat& frame) {
        cv::Mat gray;
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        cv::equalizeHist(gray, gray);

        std::vector<cv::Rect> faces;
        cascade_.detectMultiScale(gray, faces,
                                  config_.scale_factor,
                                  config_.min_neighbors,
                                  0,
                                  cv::Size(config_.min_face_size, config_.min_face_size));

        std::vector<Detection> detections;
        detections.reserve(faces.size());
        for (const auto& face : faces) {
            detections.push_back({face, 1.0f, 0});
        }
        return detections;
    }

    std::vector<Detection> detect_yunet(const cv::Mat& frame) {
        if (frame.size() != yunet_input_size_) {
            yunet_->setInputSize(frame.size());
            yunet_input_size_ = frame.size();
        }

        cv::Mat faces;
        yunet_->detect(frame, faces);

        // One row per face: x, y, w, h, five landmarks, score
        std::vector<Detection> detections;
        detections.reserve(static_cast<size_t>(faces.rows));
        for (int i = 0; i < faces.rows; ++i) {
            cv::Rect box(cvRound(faces.at<float>(i, 0)), cvRound(faces.at<float>(i, 1)),
                         cvRound(faces.at<float>(i, 2)), cvRound(faces.at<float>(i, 3)));
            const int min_size = config_.min_face_size;
            if (box.width < min_size || box.height < min_size) {
                continue;
            }
            detections.push_back({box, faces.at<float>(i, 14), 0});
        }
        return detections;
    }

    RealisticConfig config_;
    cv::CascadeClassifier cascade_;
    cv::Ptr<cv::FaceDetectorYN> yunet_;
    cv::Size yunet_input_size_{0, 0};
};

RealisticFaceDetector::RealisticFaceDetector(const ScreenCapConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

RealisticFaceDetector::~RealisticFaceDetector() = default;

std::vector<Detection> RealisticFaceDetector::detect(const cv::Mat& frame) {
    return pimpl_->detect(frame);
}

std::string RealisticFaceDetector::name() const {
    return pimpl_->name();
}

} // namespace screencap
