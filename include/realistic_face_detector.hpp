#pragma once

#include "face_detector.hpp"
#include <memory>
#include <string>
#include <vector>

namespace screencap {

// Human faces through OpenCV: a Haar cascade or the YuNet CNN,
// selected by config.realistic.model.
class RealisticFaceDetector : public FaceDetector {
public:
    explicit RealisticFaceDetector(const ScreenCapConfig& config);
    ~RealisticFaceDetector() override;

    std::vector<Detection> detect(const cv::Mat& frame) override;
    std::string name() const override;
    std::string crop_prefix() const override { return "realistic_face"; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace screencap
