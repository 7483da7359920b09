#include <gtest/gtest.h>
#include "config.hpp"
#include "test_helpers.hpp"
#include <fstream>

using json = nlohmann::json;

namespace screencap {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_dir_ = testing_support::make_temp_dir();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(work_dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = work_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path work_dir_;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    ScreenCapConfig config;

    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.mode, DetectionMode::Realistic);
    EXPECT_EQ(config.realistic.model, FaceModel::Cascade);
    EXPECT_FLOAT_EQ(config.anime.confidence_threshold, 0.5f);
    EXPECT_EQ(config.anime.input_size, 640);
    EXPECT_EQ(config.video_extensions, (std::vector<std::string>{".mp4", ".avi", ".mkv"}));
}

TEST_F(ConfigTest, FixedLayoutUnderRoot) {
    ScreenCapConfig config;
    config.root_dir = "/data/run";

    EXPECT_EQ(config.input_path(), std::filesystem::path("/data/run/input"));
    EXPECT_EQ(config.output_path(), std::filesystem::path("/data/run/output"));
    EXPECT_EQ(config.model_path(), std::filesystem::path("/data/run/model"));
    EXPECT_EQ(config.anime_model_path(), std::filesystem::path("/data/run/model/AniRef40000-l-epoch50.onnx"));
    EXPECT_EQ(config.cnn_face_model_path(),
              std::filesystem::path("/data/run/model/face_detection_yunet_2023mar.onnx"));
}

TEST_F(ConfigTest, CascadeInModelDirWins) {
    ScreenCapConfig config;
    config.root_dir = work_dir_;
    std::filesystem::create_directories(config.model_path());
    auto local = write_file("model/haarcascade_frontalface_default.xml", "<opencv_storage/>");

    EXPECT_EQ(config.cascade_path(), local);
}

TEST_F(ConfigTest, ParseDetectionMode) {
    EXPECT_EQ(parse_detection_mode("realistic"), DetectionMode::Realistic);
    EXPECT_EQ(parse_detection_mode("ANIME"), DetectionMode::Anime);
    EXPECT_EQ(parse_detection_mode("1"), DetectionMode::Realistic);
    EXPECT_EQ(parse_detection_mode("2"), DetectionMode::Anime);
    EXPECT_THROW(parse_detection_mode("3"), ConfigError);
    EXPECT_THROW(parse_detection_mode(""), ConfigError);
}

TEST_F(ConfigTest, ParseFaceModel) {
    EXPECT_EQ(parse_face_model("cascade"), FaceModel::Cascade);
    EXPECT_EQ(parse_face_model("CNN"), FaceModel::Cnn);
    EXPECT_EQ(parse_face_model("yunet"), FaceModel::Cnn);
    EXPECT_THROW(parse_face_model("dlib"), ConfigError);
    // No HOG detector is available; "hog" must not silently run the cascade
    EXPECT_THROW(parse_face_model("hog"), ConfigError);
}

TEST_F(ConfigTest, JsonOverlaysOnlyPresentKeys) {
    ScreenCapConfig config;
    json j = {
        {"jpeg_quality", 80},
        {"use_gpu", false},
        {"anime", {{"confidence_threshold", 0.35}}},
        {"realistic", {{"model", "cnn"}, {"min_face_size", 48}}}
    };

    apply_json(j, config);

    EXPECT_EQ(config.jpeg_quality, 80);
    EXPECT_FALSE(config.use_gpu);
    EXPECT_FLOAT_EQ(config.anime.confidence_threshold, 0.35f);
    EXPECT_FLOAT_EQ(config.anime.nms_threshold, 0.7f);
    EXPECT_EQ(config.realistic.model, FaceModel::Cnn);
    EXPECT_EQ(config.realistic.min_face_size, 48);
    EXPECT_EQ(config.realistic.min_neighbors, 5);
    EXPECT_EQ(config.output_dir, "output");
}

TEST_F(ConfigTest, ModeIsNotReadFromJson) {
    ScreenCapConfig config;
    apply_json(json{{"mode", "Anime"}}, config);

    EXPECT_EQ(config.mode, DetectionMode::Realistic);
}

TEST_F(ConfigTest, WrongTypeIsConfigError) {
    ScreenCapConfig config;

    EXPECT_THROW(apply_json(json{{"jpeg_quality", "high"}}, config), ConfigError);
    EXPECT_THROW(apply_json(json{{"anime", {{"input_size", "large"}}}}, config), ConfigError);
    EXPECT_THROW(apply_json(json::array({1, 2}), config), ConfigError);
    EXPECT_THROW(apply_json(json{{"realistic", {{"model", "dlib"}}}}, config), ConfigError);
}

TEST_F(ConfigTest, ValidateRejectsOutOfRange) {
    auto expect_invalid = [](auto mutate) {
        ScreenCapConfig config;
        mutate(config);
        EXPECT_THROW(config.validate(), ConfigError);
    };

    expect_invalid([](ScreenCapConfig& c) { c.anime.confidence_threshold = 1.5f; });
    expect_invalid([](ScreenCapConfig& c) { c.anime.nms_threshold = 0.0f; });
    expect_invalid([](ScreenCapConfig& c) { c.anime.input_size = 600; });
    expect_invalid([](ScreenCapConfig& c) { c.realistic.scale_factor = 1.0; });
    expect_invalid([](ScreenCapConfig& c) { c.realistic.min_neighbors = -1; });
    expect_invalid([](ScreenCapConfig& c) { c.realistic.score_threshold = -0.1f; });
    expect_invalid([](ScreenCapConfig& c) { c.jpeg_quality = 101; });
    expect_invalid([](ScreenCapConfig& c) { c.num_threads = -2; });
    expect_invalid([](ScreenCapConfig& c) { c.video_extensions.clear(); });
    expect_invalid([](ScreenCapConfig& c) { c.output_dir.clear(); });
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = write_file("screencap.json", R"({
        "num_threads": 2,
        "video_extensions": [".mp4", ".webm"],
        "anime": { "model_file": "custom.onnx", "input_size": 320 }
    })");
    ScreenCapConfig config;

    load_config_file(path, config);

    EXPECT_EQ(config.num_threads, 2);
    EXPECT_EQ(config.video_extensions, (std::vector<std::string>{".mp4", ".webm"}));
    EXPECT_EQ(config.anime.model_file, "custom.onnx");
    EXPECT_EQ(config.anime.input_size, 320);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, MissingOrMalformedFile) {
    ScreenCapConfig config;

    EXPECT_THROW(load_config_file(work_dir_ / "absent.json", config), ConfigError);
    EXPECT_THROW(load_config_file(write_file("bad.json", "{ \"jpeg_quality\": "), config), ConfigError);
}

TEST_F(ConfigTest, WrittenConfigReadsBack) {
    ScreenCapConfig original;
    original.jpeg_quality = 70;
    original.realistic.model = FaceModel::Cnn;
    original.anime.nms_threshold = 0.45f;

    ScreenCapConfig restored;
    apply_json(to_json(original), restored);

    EXPECT_EQ(restored.jpeg_quality, 70);
    EXPECT_EQ(restored.realistic.model, FaceModel::Cnn);
    EXPECT_FLOAT_EQ(restored.anime.nms_threshold, 0.45f);
    EXPECT_EQ(to_json(original)["mode"], "Realistic");
}

} // namespace screencap
