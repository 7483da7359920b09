#include "video_processor.hpp"
#include "frame_walker.hpp"
#include "output_layout.hpp"
#include "progress_bar.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <stdexcept>

namespace screencap {

std::string to_string(VideoStatus status) {
    switch (status) {
        case VideoStatus::Ok: return "ok";
        case VideoStatus::Skipped: return "skipped";
        case VideoStatus::Failed: return "failed";
    }
    return "unknown";
}

int BatchReport::total_frames() const {
    int total = 0;
    for (const auto& video : videos) {
        total += video.frames;
    }
    return total;
}

int BatchReport::total_crops() const {
    int total = 0;
    for (const auto& video : videos) {
        total += video.crops;
    }
    return total;
}

size_t BatchReport::count(VideoStatus status) const {
    return static_cast<size_t>(std::count_if(videos.begin(), videos.end(),
        [status](const VideoResult& video) { return video.status == status; }));
}

nlohmann::json to_json(const VideoResult& result) {
    nlohmann::json j;
    j["video_path"] = result.video_path.string();
    j["output_dir"] = result.output_dir.string();
    j["status"] = to_string(result.status);
    j["frames"] = result.frames;
    j["crops"] = result.crops;
    j["processing_time_ms"] = result.processing_time.count();
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
    return j;
}

nlohmann::json to_json(const BatchReport& report) {
    nlohmann::json j;
    j["mode"] = report.mode;
    j["total_frames"] = report.total_frames();
    j["total_crops"] = report.total_crops();
    j["videos"] = nlohmann::json::array();
    for (const auto& video : report.videos) {
        j["videos"].push_back(to_json(video));
    }
    return j;
}

std::vector<std::filesystem::path> list_video_files(const std::filesystem::path& dir,
                                                    const std::vector<std::string>& extensions) {
    auto lowercase = [](std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    };

    std::vector<std::string> wanted;
    wanted.reserve(extensions.size());
    for (const auto& ext : extensions) {
        wanted.push_back(lowercase(ext));
    }

    std::vector<std::filesystem::path> videos;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return videos;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const auto ext = lowercase(entry.path().extension().string());
        if (std::find(wanted.begin(), wanted.end(), ext) != wanted.end()) {
            videos.push_back(entry.path());
        }
    }

    std::sort(videos.begin(), videos.end(),
        [](const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
            return lhs.filename() < rhs.filename();
        });
    return videos;
}

class VideoProcessor::Impl {
public:
    Impl(const ScreenCapConfig& config, std::unique_ptr<FaceDetector> detector)
        : config_(config)
        , detector_(std::move(detector)) {
        if (!detector_) {
            throw std::invalid_argument("VideoProcessor requires a detector");
        }

        std::cout << "VideoProcessor initialized with:" << std::endl;
        std::cout << "  Mode: " << to_string(config_.mode) << std::endl;
        std::cout << "  Detector: " << detector_->name() << std::endl;
        std::cout << "  Input: " << config_.input_path().string() << std::endl;
        std::cout << "  Output: " << config_.output_path().string() << std::endl;
        std::cout << "  JPEG quality: " << config_.jpeg_quality << std::endl;
    }

    std::vector<std::filesystem::path> list_videos() const {
        return list_video_files(config_.input_path(), config_.video_extensions);
    }

    VideoResult process_video(const std::filesystem::path& video_path) {
        auto start_time = std::chrono::high_resolution_clock::now();

        VideoResult result;
        result.video_path = video_path;

        const auto layout = make_output_layout(config_.output_path(), video_path);
        FrameWalker walker(*detector_, config_.jpeg_quality, config_.show_progress);

        try {
            auto walk = walker.walk(video_path, layout);
            result.output_dir = layout.video_dir;
            result.frames = walk.frames_processed;
            result.crops = walk.crops_written;
        } catch (const VideoOpenError& e) {
            result.status = VideoStatus::Skipped;
            result.error = e.what();
            std::cerr << "Skipping " << video_path.filename().string() << ": " << e.what() << std::endl;
        } catch (const OutputWriteError& e) {
            result.status = VideoStatus::Failed;
            result.output_dir = layout.video_dir;
            result.error = e.what();
            std::cerr << "Stopped processing " << video_path.filename().string() << ": " << e.what() << std::endl;
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        result.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);
        return result;
    }

    BatchReport batch_process(const std::vector<std::filesystem::path>& video_paths) {
        BatchReport report;
        report.mode = to_string(config_.mode);

        if (video_paths.empty()) {
            std::cout << "No videos found in the input directory." << std::endl;
            return report;
        }

        ProgressBar overall("Overall Progress", video_paths.size(), "Video", config_.show_progress);

        // output folder -> video that wrote into it
        std::map<std::filesystem::path, std::filesystem::path> claimed;

        for (const auto& video_path : video_paths) {
            std::cout << "\nProcessing video: " << video_path.filename().string() << std::endl;

            const auto video_dir = make_output_layout(config_.output_path(), video_path).video_dir;
            auto owner = claimed.find(video_dir);
            if (owner != claimed.end()) {
                VideoResult result;
                result.video_path = video_path;
                result.status = VideoStatus::Skipped;
                result.error = "Output folder " + video_dir.string() + " is already used by " +
                               owner->second.filename().string();
                std::cerr << "Skipping " << video_path.filename().string() << ": " << result.error << std::endl;
                report.videos.push_back(std::move(result));
                overall.update();
                continue;
            }

            auto result = process_video(video_path);
            if (result.status != VideoStatus::Skipped) {
                claimed.emplace(video_dir, video_path);
            }
            if (result.status == VideoStatus::Ok) {
                std::cout << "Processing completed: " << result.frames << " frames, "
                          << result.crops << " crops. Results saved in "
                          << result.output_dir.string() << std::endl;
            }
            report.videos.push_back(std::move(result));
            overall.update();
        }
        overall.close();

        std::cout << "Processed " << report.count(VideoStatus::Ok) << " of " << video_paths.size()
                  << " videos (" << report.count(VideoStatus::Skipped) << " skipped, "
                  << report.count(VideoStatus::Failed) << " failed)" << std::endl;
        return report;
    }

    BatchReport process_all() {
        return batch_process(list_videos());
    }

    const FaceDetector& detector() const { return *detector_; }

private:
    ScreenCapConfig config_;
    std::unique_ptr<FaceDetector> detector_;
};

VideoProcessor::VideoProcessor(const ScreenCapConfig& config)
    : pimpl_(std::make_unique<Impl>(config, create_detector(config))) {}

VideoProcessor::VideoProcessor(const ScreenCapConfig& config, std::unique_ptr<FaceDetector> detector)
    : pimpl_(std::make_unique<Impl>(config, std::move(detector))) {}

VideoProcessor::~VideoProcessor() = default;

std::vector<std::filesystem::path> VideoProcessor::list_videos() const {
    return pimpl_->list_videos();
}

VideoResult VideoProcessor::process_video(const std::filesystem::path& video_path) {
    return pimpl_->process_video(video_path);
}

BatchReport VideoProcessor::batch_process(const std::vector<std::filesystem::path>& video_paths) {
    return pimpl_->batch_process(video_paths);
}

BatchReport VideoProcessor::process_all() {
    return pimpl_->process_all();
}

const FaceDetector& VideoProcessor::detector() const {
    return pimpl_->detector();
}

} // namespace screencap
