#pragma once

#include "face_detector.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace screencap {

struct LetterboxInfo {
    float scale = 1.0f;
    int pad_x = 0;
    int pad_y = 0;
};

// Resizes `frame` into a size x size canvas keeping the aspect ratio,
// padding with grey (114) on both sides.
LetterboxInfo letterbox(const cv::Mat& frame, int size, cv::Mat& out);

struct YoloOutputLayout {
    int64_t num_channels = 0;   // 4 box values + class scores
    int64_t num_anchors = 0;
    bool anchors_major = false; // [1, anchors, channels] instead of [1, channels, anchors]
};

// Infers the layout of a YOLOv8 detection head from its output shape.
YoloOutputLayout yolo_layout_from_shape(const std::vector<int64_t>& shape);

// Decodes raw YOLOv8 predictions (cx, cy, w, h, class scores...) into boxes in
// frame coordinates: confidence filter, class-agnostic NMS, then clipping.
std::vector<Detection> decode_yolo_output(const float* data,
                                          const YoloOutputLayout& layout,
                                          float confidence_threshold,
                                          float nms_threshold,
                                          const LetterboxInfo& letterbox_info,
                                          const cv::Size& frame_size);

// Anime characters through a YOLOv8 model exported to ONNX, run by ONNX Runtime.
class AnimeDetector : public FaceDetector {
public:
    explicit AnimeDetector(const ScreenCapConfig& config);
    ~AnimeDetector() override;

    std::vector<Detection> detect(const cv::Mat& frame) override;
    std::string name() const override { return "Anime (YOLOv8)"; }
    std::string crop_prefix() const override { return "anime_face"; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace screencap
