#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace screencap {

struct ScreenCapConfig;

struct MissingDependency {
    std::string name;
    std::string hint;   // how to install or provide it
};

// Libraries every run needs whatever the mode: video decoding and JPEG
// encoding in OpenCV, and ONNX Runtime.
std::vector<MissingDependency> check_runtime_dependencies();

// The model file of the detector config.mode selects.
std::vector<MissingDependency> check_model_files(const ScreenCapConfig& config);

// Both of the above.
std::vector<MissingDependency> check_dependencies(const ScreenCapConfig& config);

void print_missing_dependencies(const std::vector<MissingDependency>& missing, std::ostream& out);

} // namespace screencap
