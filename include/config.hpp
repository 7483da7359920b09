#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace screencap {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class DetectionMode {
    Realistic,
    Anime
};

enum class FaceModel {
    Cascade,   // Haar cascade, classical CPU detector
    Cnn        // YuNet through cv::FaceDetectorYN
};

std::string to_string(DetectionMode mode);
std::string to_string(FaceModel model);
DetectionMode parse_detection_mode(const std::string& name);
FaceModel parse_face_model(const std::string& name);

struct RealisticConfig {
    FaceModel model = FaceModel::Cascade;
    std::string cascade_file = "haarcascade_frontalface_default.xml";
    std::string cnn_file = "face_detection_yunet_2023mar.onnx";
    double scale_factor = 1.1;
    int min_neighbors = 5;
    int min_face_size = 30;
    float score_threshold = 0.9f;
    float nms_threshold = 0.3f;
};

struct AnimeConfig {
    std::string model_file = "AniRef40000-l-epoch50.onnx";
    float confidence_threshold = 0.5f;
    float nms_threshold = 0.7f;
    int input_size = 640;
};

struct ScreenCapConfig {
    std::filesystem::path root_dir = ".";
    std::string input_dir = "input";
    std::string output_dir = "output";
    std::string model_dir = "model";

    DetectionMode mode = DetectionMode::Realistic;
    RealisticConfig realistic;
    AnimeConfig anime;

    bool use_gpu = true;
    int num_threads = static_cast<int>(std::thread::hardware_concurrency());
    int jpeg_quality = 95;
    bool show_progress = true;
    std::vector<std::string> video_extensions{".mp4", ".avi", ".mkv"};

    // Directories resolved against root_dir
    std::filesystem::path input_path() const;
    std::filesystem::path output_path() const;
    std::filesystem::path model_path() const;

    std::filesystem::path anime_model_path() const;
    std::filesystem::path cascade_path() const;
    std::filesystem::path cnn_face_model_path() const;

    // Throws ConfigError on out-of-range values
    void validate() const;
};

// Overlays the keys present in `j` on top of `config`.
void apply_json(const nlohmann::json& j, ScreenCapConfig& config);
nlohmann::json to_json(const ScreenCapConfig& config);

// Reads a JSON file and overlays it on `config`. Throws ConfigError.
void load_config_file(const std::filesystem::path& path, ScreenCapConfig& config);

} // namespace screencap
