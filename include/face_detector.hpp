#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

namespace screencap {

struct ScreenCapConfig;

struct Detection {
    cv::Rect box;              // pixels, clipped to the frame
    float confidence = 1.0f;
    int class_id = 0;
};

// A detection delegate: returns the faces or characters found in a BGR frame.
class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    virtual std::vector<Detection> detect(const cv::Mat& frame) = 0;

    virtual std::string name() const = 0;

    // File name prefix for the crops this detector produces
    virtual std::string crop_prefix() const = 0;
};

// Builds the delegate for config.mode. Throws if its model cannot be loaded.
std::unique_ptr<FaceDetector> create_detector(const ScreenCapConfig& config);

// Clips every box to frame_size and drops the ones left empty.
std::vector<Detection> clip_detections(std::vector<Detection> detections,
                                       const cv::Size& frame_size);

} // namespace screencap
