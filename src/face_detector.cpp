#include "face_detector.hpp"
#include "config.hpp"
#include "realistic_face_detector.hpp"
#include "anime_detector.hpp"
#include <algorithm>

namespace screencap {

std::unique_ptr<FaceDetector> create_detector(const ScreenCapConfig& config) {
    switch (config.mode) {
        case DetectionMode::Realistic:
            return std::make_unique<RealisticFaceDetector>(config);
        case DetectionMode::Anime:
            return std::make_unique<AnimeDetector>(config);
    }
    throw ConfigError("Unsupported detection mode");
}

std::vector<Detection> clip_detections(std::vector<Detection> detections,
                                       const cv::Size& frame_size) {
    const cv::Rect bounds(0, 0, frame_size.width, frame_size.height);
    for (auto& det : detections) {
        det.box &= bounds;
    }

    detections.erase(
        std::remove_if(detections.begin(), detections.end(),
            [](const Detection& det) { return det.box.empty(); }),
        detections.end());
    return detections;
}

} // namespace screencap
