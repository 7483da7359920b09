#include "frame_walker.hpp"
#include "progress_bar.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

namespace screencap {

class FrameWalker::Impl {
public:
    Impl(FaceDetector& detector, int jpeg_quality, bool show_progress)
        : detector_(detector)
        , encode_params_{cv::IMWRITE_JPEG_QUALITY, jpeg_quality}
        , show_progress_(show_progress) {}

    WalkResult walk(const std::filesystem::path& video_path,
                    const OutputLayout& layout,
                    const FrameCallback& on_frame) {
        cv::VideoCapture cap(video_path.string());
        if (!cap.isOpened()) {
            throw VideoOpenError("Failed to open video: " + video_path.string());
        }

        // Container metadata can be missing; the bar then shows a plain count
        const double reported_frames = cap.get(cv::CAP_PROP_FRAME_COUNT);
        const size_t total_frames = reported_frames > 0 ? static_cast<size_t>(reported_frames) : 0;

        create_output_dirs(layout);

        WalkResult result;
        ProgressBar progress("Processing: " + video_path.filename().string(),
                             total_frames, "Frame", show_progress_);

        const std::string prefix = detector_.crop_prefix();
        cv::Mat frame;
        while (cap.read(frame)) {
            if (frame.empty()) {
                break;
            }

            const int frame_index = result.frames_processed;
            write_image(layout.screenshot_path(frame_index), frame);

            const auto detections = detector_.detect(frame);
            for (size_t i = 0; i < detections.size(); ++i) {
                write_image(layout.crop_path(prefix, frame_index, static_cast<int>(i)),
                            frame(detections[i].box));
            }

            result.detections_per_frame.push_back(static_cast<int>(detections.size()));
            result.crops_written += static_cast<int>(detections.size());
            result.frames_processed++;

            if (on_frame) {
                on_frame(frame_index, detections);
            }
            progress.update();
        }

        progress.close();
        cap.release();
        return result;
    }

private:
    void write_image(const std::filesystem::path& path, const cv::Mat& image) const {
        bool written = false;
        try {
            written = cv::imwrite(path.string(), image, encode_params_);
        } catch (const cv::Exception& e) {
            throw OutputWriteError("Failed writing " + path.string() + ": " + e.what());
        }
        if (!written) {
            throw OutputWriteError("Failed writing " + path.string());
        }
    }

    FaceDetector& detector_;
    std::vector<int> encode_params_;
    bool show_progress_;
};

FrameWalker::FrameWalker(FaceDetector& detector, int jpeg_quality, bool show_progress)
    : pimpl_(std::make_unique<Impl>(detector, jpeg_quality, show_progress)) {}

FrameWalker::~FrameWalker() = default;

WalkResult FrameWalker::walk(const std::filesystem::path& video_path,
                             const OutputLayout& layout,
                             FrameCallback on_frame) {
    return pimpl_->walk(video_path, layout, on_frame);
}

} // namespace screencap
