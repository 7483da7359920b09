#pragma once

#include "config.hpp"
#include "face_detector.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace screencap {

enum class VideoStatus {
    Ok,
    Skipped,   // could not be opened, or its output folder is taken
    Failed     // output could not be written
};

std::string to_string(VideoStatus status);

struct VideoResult {
    std::filesystem::path video_path;
    std::filesystem::path output_dir;
    VideoStatus status = VideoStatus::Ok;
    int frames = 0;
    int crops = 0;
    std::string error;
    std::chrono::milliseconds processing_time{0};
};

struct BatchReport {
    std::string mode;
    std::vector<VideoResult> videos;

    int total_frames() const;
    int total_crops() const;
    size_t count(VideoStatus status) const;
};

nlohmann::json to_json(const VideoResult& result);
nlohmann::json to_json(const BatchReport& report);

// Regular files in `dir` whose extension matches one of `extensions`
// (case-insensitive), sorted by filename. Empty when `dir` does not exist.
std::vector<std::filesystem::path> list_video_files(const std::filesystem::path& dir,
                                                    const std::vector<std::string>& extensions);

class VideoProcessor {
public:
    // Builds the detector for config.mode; a missing or broken model throws here,
    // before any video is touched.
    explicit VideoProcessor(const ScreenCapConfig& config);
    VideoProcessor(const ScreenCapConfig& config, std::unique_ptr<FaceDetector> detector);
    ~VideoProcessor();

    std::vector<std::filesystem::path> list_videos() const;

    // Unreadable videos come back Skipped, unwritable output Failed.
    // Detector errors propagate.
    VideoResult process_video(const std::filesystem::path& video_path);

    // Videos sharing a file stem would share output/<stem>/; only the first
    // one is processed and the others come back Skipped.
    BatchReport batch_process(const std::vector<std::filesystem::path>& video_paths);

    // Every video of the input directory
    BatchReport process_all();

    const FaceDetector& detector() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace screencap
