#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace screencap {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

template <typename T>
void read_if_present(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

std::string to_string(DetectionMode mode) {
    switch (mode) {
        case DetectionMode::Realistic: return "Realistic";
        case DetectionMode::Anime: return "Anime";
    }
    return "Unknown";
}

std::string to_string(FaceModel model) {
    switch (model) {
        case FaceModel::Cascade: return "cascade";
        case FaceModel::Cnn: return "cnn";
    }
    return "unknown";
}

DetectionMode parse_detection_mode(const std::string& name) {
    const std::string value = lowercase(name);
    if (value == "realistic" || value == "1") return DetectionMode::Realistic;
    if (value == "anime" || value == "2") return DetectionMode::Anime;
    throw ConfigError("Unknown detection mode: " + name);
}

FaceModel parse_face_model(const std::string& name) {
    const std::string value = lowercase(name);
    if (value == "cascade") return FaceModel::Cascade;
    if (value == "cnn" || value == "yunet") return FaceModel::Cnn;
    throw ConfigError("Unknown face model: " + name);
}

std::filesystem::path ScreenCapConfig::input_path() const {
    return root_dir / input_dir;
}

std::filesystem::path ScreenCapConfig::output_path() const {
    return root_dir / output_dir;
}

std::filesystem::path ScreenCapConfig::model_path() const {
    return root_dir / model_dir;
}

std::filesystem::path ScreenCapConfig::anime_model_path() const {
    return model_path() / anime.model_file;
}

std::filesystem::path ScreenCapConfig::cascade_path() const {
    auto local = model_path() / realistic.cascade_file;
    if (std::filesystem::exists(local)) {
        return local;
    }

    // Stock OpenCV installs ship the cascades in their data directory
    const std::vector<std::filesystem::path> data_dirs = {
        "/usr/share/opencv4/haarcascades",
        "/usr/local/share/opencv4/haarcascades",
        "/usr/share/opencv/haarcascades",
        "/usr/local/share/opencv/haarcascades"
    };
    for (const auto& dir : data_dirs) {
        auto candidate = dir / realistic.cascade_file;
        if (std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
    return local;
}

std::filesystem::path ScreenCapConfig::cnn_face_model_path() const {
    return model_path() / realistic.cnn_file;
}

void ScreenCapConfig::validate() const {
    if (input_dir.empty() || output_dir.empty() || model_dir.empty()) {
        throw ConfigError("input_dir, output_dir and model_dir must not be empty");
    }
    if (anime.confidence_threshold < 0.0f || anime.confidence_threshold > 1.0f) {
        throw ConfigError("anime.confidence_threshold must be within [0, 1]");
    }
    if (anime.nms_threshold <= 0.0f || anime.nms_threshold > 1.0f) {
        throw ConfigError("anime.nms_threshold must be within (0, 1]");
    }
    if (anime.input_size <= 0 || anime.input_size % 32 != 0) {
        throw ConfigError("anime.input_size must be a positive multiple of 32");
    }
    if (realistic.scale_factor <= 1.0) {
        throw ConfigError("realistic.scale_factor must be greater than 1");
    }
    if (realistic.min_neighbors < 0 || realistic.min_face_size < 0) {
        throw ConfigError("realistic.min_neighbors and realistic.min_face_size must not be negative");
    }
    if (realistic.score_threshold < 0.0f || realistic.score_threshold > 1.0f) {
        throw ConfigError("realistic.score_threshold must be within [0, 1]");
    }
    if (realistic.nms_threshold <= 0.0f || realistic.nms_threshold > 1.0f) {
        throw ConfigError("realistic.nms_threshold must be within (0, 1]");
    }
    if (jpeg_quality < 0 || jpeg_quality > 100) {
        throw ConfigError("jpeg_quality must be within [0, 100]");
    }
    if (num_threads < 0) {
        throw ConfigError("num_threads must not be negative");
    }
    if (video_extensions.empty()) {
        throw ConfigError("video_extensions must list at least one extension");
    }
}

void apply_json(const nlohmann::json& j, ScreenCapConfig& config) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    std::string root;
    read_if_present(j, "root_dir", root);
    if (!root.empty()) {
        config.root_dir = root;
    }
    read_if_present(j, "input_dir", config.input_dir);
    read_if_present(j, "output_dir", config.output_dir);
    read_if_present(j, "model_dir", config.model_dir);

    // "mode" is chosen per run (prompt or --mode) and not read from files

    read_if_present(j, "use_gpu", config.use_gpu);
    read_if_present(j, "num_threads", config.num_threads);
    read_if_present(j, "jpeg_quality", config.jpeg_quality);
    read_if_present(j, "show_progress", config.show_progress);
    read_if_present(j, "video_extensions", config.video_extensions);

    if (auto it = j.find("realistic"); it != j.end() && it->is_object()) {
        auto& r = config.realistic;
        std::string model;
        read_if_present(*it, "model", model);
        if (!model.empty()) {
            r.model = parse_face_model(model);
        }
        read_if_present(*it, "cascade_file", r.cascade_file);
        read_if_present(*it, "cnn_file", r.cnn_file);
        read_if_present(*it, "scale_factor", r.scale_factor);
        read_if_present(*it, "min_neighbors", r.min_neighbors);
        read_if_present(*it, "min_face_size", r.min_face_size);
        read_if_present(*it, "score_threshold", r.score_threshold);
        read_if_present(*it, "nms_threshold", r.nms_threshold);
    }

    if (auto it = j.find("anime"); it != j.end() && it->is_object()) {
        auto& a = config.anime;
        read_if_present(*it, "model_file", a.model_file);
        read_if_present(*it, "confidence_threshold", a.confidence_threshold);
        read_if_present(*it, "nms_threshold", a.nms_threshold);
        read_if_present(*it, "input_size", a.input_size);
    }
}

nlohmann::json to_json(const ScreenCapConfig& config) {
    nlohmann::json j;
    j["root_dir"] = config.root_dir.string();
    j["input_dir"] = config.input_dir;
    j["output_dir"] = config.output_dir;
    j["model_dir"] = config.model_dir;
    j["mode"] = to_string(config.mode);
    j["use_gpu"] = config.use_gpu;
    j["num_threads"] = config.num_threads;
    j["jpeg_quality"] = config.jpeg_quality;
    j["show_progress"] = config.show_progress;
    j["video_extensions"] = config.video_extensions;

    j["realistic"] = {
        {"model", to_string(config.realistic.model)},
        {"cascade_file", config.realistic.cascade_file},
        {"cnn_file", config.realistic.cnn_file},
        {"scale_factor", config.realistic.scale_factor},
        {"min_neighbors", config.realistic.min_neighbors},
        {"min_face_size", config.realistic.min_face_size},
        {"score_threshold", config.realistic.score_threshold},
        {"nms_threshold", config.realistic.nms_threshold}
    };

    j["anime"] = {
        {"model_file", config.anime.model_file},
        {"confidence_threshold", config.anime.confidence_threshold},
        {"nms_threshold", config.anime.nms_threshold},
        {"input_size", config.anime.input_size}
    };
    return j;
}

void load_config_file(const std::filesystem::path& path, ScreenCapConfig& config) {
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigError("Cannot open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed config file " + path.string() + ": " + e.what());
    }

    apply_json(j, config);
    std::cout << "Loaded configuration from " << path.string() << std::endl;
}

} // namespace screencap
