#pragma once

#include <gtest/gtest.h>
#include "face_detector.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace screencap {
namespace testing_support {

// Fresh directory under the system temp dir, named after the running test
inline std::filesystem::path make_temp_dir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = std::string("screencap_") + info->test_suite_name() + "_" + info->name();
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

// MJPG in an AVI container, which OpenCV can write and read without FFmpeg
inline bool write_test_video(const std::filesystem::path& path, int num_frames,
                             cv::Size size = cv::Size(320, 240), double fps = 10.0) {
    cv::VideoWriter writer;
    int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
    if (!writer.open(path.string(), fourcc, fps, size)) {
        return false;
    }

    for (int i = 0; i < num_frames; ++i) {
        cv::Mat frame = cv::Mat::zeros(size.height, size.width, CV_8UC3);

        int color_shift = num_frames > 1 ? (i * 255) / (num_frames - 1) : 0;
        cv::rectangle(frame, cv::Point(0, 0), cv::Point(size.width, size.height),
                      cv::Scalar(color_shift, 255 - color_shift, 128), -1);
        cv::putText(frame, std::to_string(i), cv::Point(10, 30),
                    cv::FONT_HERSHEY_SIMPLEX, 1, cv::Scalar(255, 255, 255), 2);

        writer << frame;
    }
    writer.release();
    return true;
}

inline size_t count_files(const std::filesystem::path& dir) {
    if (!std::filesystem::is_directory(dir)) {
        return 0;
    }
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) ++count;
    }
    return count;
}

// Returns whatever `script` says for the n-th call (n counts from 0)
class ScriptedDetector : public FaceDetector {
public:
    using Script = std::function<std::vector<Detection>(int call, const cv::Mat& frame)>;

    explicit ScriptedDetector(Script script, std::string prefix = "test_face")
        : script_(std::move(script)), prefix_(std::move(prefix)) {}

    std::vector<Detection> detect(const cv::Mat& frame) override {
        return script_(calls_++, frame);
    }
    std::string name() const override { return "scripted"; }
    std::string crop_prefix() const override { return prefix_; }

    int calls() const { return calls_; }

private:
    Script script_;
    std::string prefix_;
    int calls_ = 0;
};

// Frame n gets n % 3 small boxes
inline std::vector<Detection> modulo_boxes(int call, const cv::Mat& frame) {
    std::vector<Detection> boxes;
    for (int i = 0; i < call % 3; ++i) {
        boxes.push_back({cv::Rect(10 + i * 40, 10, 32, 32) & cv::Rect(0, 0, frame.cols, frame.rows),
                         0.9f, 0});
    }
    return boxes;
}

} // namespace testing_support
} // namespace screencap
