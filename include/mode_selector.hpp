#pragma once

#include "config.hpp"
#include <iosfwd>
#include <optional>

namespace screencap {

// Prints the mode menu to `out` and reads one line from `in`.
// Returns nullopt for anything but "1" or "2".
std::optional<DetectionMode> prompt_detection_mode(std::istream& in, std::ostream& out);

} // namespace screencap
