#include <gtest/gtest.h>
#include "config.hpp"
#include "dependency_check.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace screencap {

class DependencyCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = testing_support::make_temp_dir();
        config_.root_dir = root_;
        std::filesystem::create_directories(config_.model_path());
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    static bool mentions(const std::vector<MissingDependency>& missing, const std::string& text) {
        return std::any_of(missing.begin(), missing.end(), [&](const MissingDependency& dep) {
            return dep.name.find(text) != std::string::npos;
        });
    }

    std::filesystem::path root_;
    ScreenCapConfig config_;
};

TEST_F(DependencyCheckTest, AnimeModelMissing) {
    config_.mode = DetectionMode::Anime;

    auto missing = check_dependencies(config_);

    ASSERT_TRUE(mentions(missing, "AniRef40000-l-epoch50.onnx"));
    auto it = std::find_if(missing.begin(), missing.end(), [](const MissingDependency& dep) {
        return dep.name.find("Anime detection model") != std::string::npos;
    });
    ASSERT_NE(it, missing.end());
    EXPECT_NE(it->hint.find("yolo export model=AniRef40000-l-epoch50.pt format=onnx"), std::string::npos);
}

TEST_F(DependencyCheckTest, AnimeModelPresent) {
    config_.mode = DetectionMode::Anime;
    std::ofstream(config_.anime_model_path(), std::ios::binary) << "weights";

    auto missing = check_dependencies(config_);

    EXPECT_FALSE(mentions(missing, "Anime detection model"));
}

TEST_F(DependencyCheckTest, RealisticModeIgnoresAnimeModel) {
    config_.mode = DetectionMode::Realistic;

    auto missing = check_dependencies(config_);

    EXPECT_FALSE(mentions(missing, "Anime detection model"));
}

TEST_F(DependencyCheckTest, CnnFaceModelMissing) {
    config_.mode = DetectionMode::Realistic;
    config_.realistic.model = FaceModel::Cnn;

    auto missing = check_dependencies(config_);

    EXPECT_TRUE(mentions(missing, "face_detection_yunet_2023mar.onnx"));
}

TEST_F(DependencyCheckTest, LocalCascadeSatisfiesRealisticMode) {
    config_.mode = DetectionMode::Realistic;
    std::ofstream(config_.model_path() / config_.realistic.cascade_file) << "<opencv_storage/>";

    auto missing = check_dependencies(config_);

    EXPECT_FALSE(mentions(missing, "Face cascade"));
}

TEST_F(DependencyCheckTest, RuntimeCheckNeedsNoMode) {
    // Nothing in model/, so every detector's model file is missing
    auto runtime = check_runtime_dependencies();

    EXPECT_FALSE(mentions(runtime, "model"));
    EXPECT_FALSE(mentions(runtime, "cascade"));
}

TEST_F(DependencyCheckTest, ModelCheckListsOnlyModelFiles) {
    config_.mode = DetectionMode::Anime;

    auto models = check_model_files(config_);

    ASSERT_EQ(models.size(), 1u);
    EXPECT_NE(models[0].name.find("Anime detection model"), std::string::npos);
}

TEST_F(DependencyCheckTest, FullCheckIsRuntimeThenModels) {
    config_.mode = DetectionMode::Anime;

    auto runtime = check_runtime_dependencies();
    auto all = check_dependencies(config_);

    ASSERT_EQ(all.size(), runtime.size() + 1);
    for (size_t i = 0; i < runtime.size(); ++i) {
        EXPECT_EQ(all[i].name, runtime[i].name);
    }
    EXPECT_NE(all.back().name.find("Anime detection model"), std::string::npos);
}

TEST(DependencyReportTest, ListsNamesThenHints) {
    std::vector<MissingDependency> missing = {
        {"ONNX Runtime", "install onnxruntime"},
        {"Anime detection model x.onnx", "export it"}
    };
    std::ostringstream out;

    print_missing_dependencies(missing, out);

    EXPECT_EQ(out.str(),
              "The following dependencies are missing:\n"
              "- ONNX Runtime\n"
              "- Anime detection model x.onnx\n"
              "\nInstall them as follows:\n"
              "  ONNX Runtime: install onnxruntime\n"
              "  Anime detection model x.onnx: export it\n");
}

TEST(DependencyReportTest, NothingMissingPrintsNothing) {
    std::ostringstream out;
    print_missing_dependencies({}, out);

    EXPECT_TRUE(out.str().empty());
}

} // namespace screencap
