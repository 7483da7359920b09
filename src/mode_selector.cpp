#include "mode_selector.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace screencap {

std::optional<DetectionMode> prompt_detection_mode(std::istream& in, std::ostream& out) {
    out << "Select mode:" << std::endl;
    out << "1: Realistic (Cascade/CNN)" << std::endl;
    out << "2: Anime (YOLOv8)" << std::endl;
    out << "Enter mode (1 or 2): " << std::flush;

    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }

    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = line.find_last_not_of(" \t\r\n");
    const std::string choice = line.substr(first, last - first + 1);

    if (choice == "1") return DetectionMode::Realistic;
    if (choice == "2") return DetectionMode::Anime;
    return std::nullopt;
}

} // namespace screencap
