#include "output_layout.hpp"
#include <cstdio>
#include <system_error>

namespace screencap {

std::string screenshot_filename(int frame_index) {
    char filename[64];
    std::snprintf(filename, sizeof(filename), "frame_%06d.jpg", frame_index);
    return filename;
}

std::string crop_filename(const std::string& prefix, int frame_index, int detection_index) {
    char suffix[64];
    std::snprintf(suffix, sizeof(suffix), "_%06d_%d.jpg", frame_index, detection_index);
    return prefix + suffix;
}

std::filesystem::path OutputLayout::screenshot_path(int frame_index) const {
    return screencaps_dir / screenshot_filename(frame_index);
}

std::filesystem::path OutputLayout::crop_path(const std::string& prefix, int frame_index,
                                              int detection_index) const {
    return faces_dir / crop_filename(prefix, frame_index, detection_index);
}

OutputLayout make_output_layout(const std::filesystem::path& output_root,
                                const std::filesystem::path& video_path) {
    OutputLayout layout;
    layout.video_dir = output_root / video_path.stem();
    layout.screencaps_dir = layout.video_dir / "screencaps";
    layout.faces_dir = layout.video_dir / "faces";
    return layout;
}

void create_output_dirs(const OutputLayout& layout) {
    for (const auto& dir : {layout.screencaps_dir, layout.faces_dir}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw OutputWriteError("Cannot create output directory " + dir.string() + ": " + ec.message());
        }
    }
}

} // namespace screencap
