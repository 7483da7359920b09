#include <gtest/gtest.h>
#include "output_layout.hpp"
#include "test_helpers.hpp"
#include <fstream>

namespace screencap {

TEST(OutputLayoutTest, FileNames) {
    EXPECT_EQ(screenshot_filename(0), "frame_000000.jpg");
    EXPECT_EQ(screenshot_filename(42), "frame_000042.jpg");
    EXPECT_EQ(crop_filename("realistic_face", 7, 0), "realistic_face_000007_0.jpg");
    EXPECT_EQ(crop_filename("anime_face", 123456, 3), "anime_face_123456_3.jpg");

    // Lexicographic order follows frame order
    EXPECT_LT(screenshot_filename(9), screenshot_filename(10));
    EXPECT_LT(screenshot_filename(99), screenshot_filename(100));
}

TEST(OutputLayoutTest, FolderPerVideoStem) {
    auto layout = make_output_layout("/run/output", "/run/input/My Clip.final.mp4");

    EXPECT_EQ(layout.video_dir, std::filesystem::path("/run/output/My Clip.final"));
    EXPECT_EQ(layout.screencaps_dir, std::filesystem::path("/run/output/My Clip.final/screencaps"));
    EXPECT_EQ(layout.faces_dir, std::filesystem::path("/run/output/My Clip.final/faces"));
    EXPECT_EQ(layout.screenshot_path(3), layout.screencaps_dir / "frame_000003.jpg");
    EXPECT_EQ(layout.crop_path("anime_face", 3, 1), layout.faces_dir / "anime_face_000003_1.jpg");
}

class OutputDirsTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_dir_ = testing_support::make_temp_dir();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(work_dir_, ec);
    }

    std::filesystem::path work_dir_;
};

TEST_F(OutputDirsTest, CreatesBothSubfolders) {
    auto layout = make_output_layout(work_dir_ / "output", "clip.mp4");

    create_output_dirs(layout);
    EXPECT_TRUE(std::filesystem::is_directory(layout.screencaps_dir));
    EXPECT_TRUE(std::filesystem::is_directory(layout.faces_dir));

    // Existing folders are reused
    EXPECT_NO_THROW(create_output_dirs(layout));
}

TEST_F(OutputDirsTest, BlockedPathThrows) {
    std::ofstream(work_dir_ / "output") << "not a directory";
    auto layout = make_output_layout(work_dir_ / "output", "clip.mp4");

    EXPECT_THROW(create_output_dirs(layout), OutputWriteError);
}

} // namespace screencap
