#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace screencap {

class OutputWriteError : public std::runtime_error {
public:
    explicit OutputWriteError(const std::string& what) : std::runtime_error(what) {}
};

// output/<video_stem>/{screencaps,faces}
struct OutputLayout {
    std::filesystem::path video_dir;
    std::filesystem::path screencaps_dir;
    std::filesystem::path faces_dir;

    std::filesystem::path screenshot_path(int frame_index) const;
    std::filesystem::path crop_path(const std::string& prefix, int frame_index, int detection_index) const;
};

OutputLayout make_output_layout(const std::filesystem::path& output_root,
                                const std::filesystem::path& video_path);

// Creates the three directories. Throws OutputWriteError.
void create_output_dirs(const OutputLayout& layout);

// frame_000042.jpg
std::string screenshot_filename(int frame_index);
// realistic_face_000042_0.jpg
std::string crop_filename(const std::string& prefix, int frame_index, int detection_index);

} // namespace screencap
