#include "dependency_check.hpp"
#include "config.hpp"
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio/registry.hpp>
#include <algorithm>
#include <filesystem>
#include <ostream>

namespace screencap {

namespace {

bool has_video_decoder() {
    const auto backends = cv::videoio_registry::getStreamBackends();
    return !backends.empty();
}

bool has_onnx_cpu_provider() {
    try {
        const auto providers = Ort::GetAvailableProviders();
        return std::find(providers.begin(), providers.end(), "CPUExecutionProvider") != providers.end();
    } catch (const Ort::Exception&) {
        return false;
    }
}

} // namespace

std::vector<MissingDependency> check_runtime_dependencies() {
    std::vector<MissingDependency> missing;

    if (!has_video_decoder()) {
        missing.push_back({"OpenCV video decoding (FFmpeg or GStreamer backend)",
                           "apt-get install libopencv-dev ffmpeg, or rebuild OpenCV with -DWITH_FFMPEG=ON"});
    }
    if (!cv::haveImageWriter(".jpg")) {
        missing.push_back({"OpenCV JPEG encoder",
                           "apt-get install libjpeg-dev, then rebuild OpenCV with -DWITH_JPEG=ON"});
    }
    if (!has_onnx_cpu_provider()) {
        missing.push_back({"ONNX Runtime",
                           "install the onnxruntime C/C++ package and make libonnxruntime.so loadable"});
    }
    return missing;
}

std::vector<MissingDependency> check_model_files(const ScreenCapConfig& config) {
    std::vector<MissingDependency> missing;

    if (config.mode == DetectionMode::Realistic) {
        if (config.realistic.model == FaceModel::Cascade) {
            const auto cascade = config.cascade_path();
            if (!std::filesystem::exists(cascade)) {
                missing.push_back({"Face cascade " + config.realistic.cascade_file,
                                   "copy it from the OpenCV data directory (haarcascades/) into " +
                                   config.model_path().string()});
            }
        } else {
            const auto model = config.cnn_face_model_path();
            if (!std::filesystem::exists(model)) {
                missing.push_back({"Face detection model " + config.realistic.cnn_file,
                                   "download it from the OpenCV model zoo (face_detection_yunet) into " +
                                   config.model_path().string()});
            }
        }
    } else {
        const auto model = config.anime_model_path();
        if (!std::filesystem::exists(model)) {
            const auto stem = std::filesystem::path(config.anime.model_file).stem().string();
            missing.push_back({"Anime detection model " + config.anime.model_file,
                               "export the weights with `yolo export model=" + stem +
                               ".pt format=onnx` and place the .onnx file in " +
                               config.model_path().string()});
        }
    }

    return missing;
}

std::vector<MissingDependency> check_dependencies(const ScreenCapConfig& config) {
    auto missing = check_runtime_dependencies();
    auto models = check_model_files(config);
    missing.insert(missing.end(), models.begin(), models.end());
    return missing;
}

void print_missing_dependencies(const std::vector<MissingDependency>& missing, std::ostream& out) {
    if (missing.empty()) {
        return;
    }

    out << "The following dependencies are missing:" << std::endl;
    for (const auto& dep : missing) {
        out << "- " << dep.name << std::endl;
    }
    out << "\nInstall them as follows:" << std::endl;
    for (const auto& dep : missing) {
        out << "  " << dep.name << ": " << dep.hint << std::endl;
    }
}

} // namespace screencap
