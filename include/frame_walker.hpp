#pragma once

#include "face_detector.hpp"
#include "output_layout.hpp"
#include <opencv2/core.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace screencap {

class VideoOpenError : public std::runtime_error {
public:
    explicit VideoOpenError(const std::string& what) : std::runtime_error(what) {}
};

struct WalkResult {
    int frames_processed = 0;
    int crops_written = 0;
    std::vector<int> detections_per_frame;
};

// Decodes a video front to back. Every frame becomes a screenshot and goes
// through the detector; every returned box becomes a crop.
class FrameWalker {
public:
    // Called after a frame and its crops are on disk
    using FrameCallback = std::function<void(int frame_index, const std::vector<Detection>& detections)>;

    FrameWalker(FaceDetector& detector, int jpeg_quality = 95, bool show_progress = true);
    ~FrameWalker();

    // Throws VideoOpenError before anything is written, OutputWriteError
    // when a directory or image cannot be written.
    WalkResult walk(const std::filesystem::path& video_path,
                    const OutputLayout& layout,
                    FrameCallback on_frame = nullptr);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace screencap
