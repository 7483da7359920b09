#include "anime_detector.hpp"
#include "device_manager.hpp"
#include "frame_walker.hpp"
#include "output_layout.hpp"
#include <benchmark/benchmark.h>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <thread>

namespace screencap {

namespace {

// Reports a fixed box in the middle of every frame
class CenterBoxDetector : public FaceDetector {
public:
    std::vector<Detection> detect(const cv::Mat& frame) override {
        cv::Rect box(frame.cols / 4, frame.rows / 4, frame.cols / 2, frame.rows / 2);
        return {{box, 1.0f, 0}};
    }
    std::string name() const override { return "center-box"; }
    std::string crop_prefix() const override { return "bench_face"; }
};

} // namespace

class WalkerFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        work_dir_ = std::filesystem::temp_directory_path() / "screencap_benchmark";
        std::filesystem::create_directories(work_dir_);
        video_path_ = work_dir_ / "benchmark_video.avi";
        create_synthetic_video();
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        std::error_code ec;
        std::filesystem::remove_all(work_dir_, ec);
    }

protected:
    void create_synthetic_video() {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        if (!writer.open(video_path_.string(), fourcc, 30.0, cv::Size(1280, 720))) {
            throw std::runtime_error("Failed to create benchmark video file");
        }

        std::mt19937 gen(42);
        std::uniform_int_distribution<> dis(0, 255);

        // 60 frames, 2 seconds at 30fps
        for (int i = 0; i < 60; ++i) {
            cv::Mat frame = cv::Mat::zeros(720, 1280, CV_8UC3);
            for (int y = 0; y < frame.rows; y += 40) {
                for (int x = 0; x < frame.cols; x += 40) {
                    cv::Scalar color(dis(gen), dis(gen), dis(gen));
                    cv::rectangle(frame, cv::Point(x, y), cv::Point(x + 38, y + 38), color, -1);
                }
            }

            int circle_x = (i * 20) % frame.cols;
            int circle_y = 360 + static_cast<int>(100 * std::sin(i * 0.1));
            cv::circle(frame, cv::Point(circle_x, circle_y), 60, cv::Scalar(255, 255, 255), -1);

            writer << frame;
        }
        writer.release();
    }

    std::filesystem::path work_dir_;
    std::filesystem::path video_path_;
};

BENCHMARK_DEFINE_F(WalkerFixture, WalkWithCrops)(benchmark::State& state) {
    CenterBoxDetector detector;
    FrameWalker walker(detector, static_cast<int>(state.range(0)), false);
    const auto layout = make_output_layout(work_dir_ / "output", video_path_);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = walker.walk(video_path_, layout);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["frames"] = static_cast<double>(result.frames_processed);
        state.counters["crops"] = static_cast<double>(result.crops_written);
        state.counters["frames_per_second"] = result.frames_processed / elapsed_seconds.count();
    }
    state.SetLabel("jpeg quality " + std::to_string(state.range(0)));
}

static void BM_Letterbox(benchmark::State& state) {
    cv::Mat frame(1080, 1920, CV_8UC3);
    cv::randu(frame, cv::Scalar(0, 0, 0), cv::Scalar(255, 255, 255));
    cv::Mat canvas;

    for (auto _ : state) {
        auto info = letterbox(frame, static_cast<int>(state.range(0)), canvas);
        benchmark::DoNotOptimize(info);
    }
}

static void BM_DecodeYoloOutput(benchmark::State& state) {
    // YOLOv8 head at 640: 8400 anchors, a single "character" class
    YoloOutputLayout layout{5, 8400, false};
    std::vector<float> output(static_cast<size_t>(layout.num_channels * layout.num_anchors));

    std::mt19937 gen(7);
    std::uniform_real_distribution<float> coord(0.0f, 640.0f);
    std::uniform_real_distribution<float> size(10.0f, 200.0f);
    std::uniform_real_distribution<float> score(0.0f, 0.6f);
    for (int64_t a = 0; a < layout.num_anchors; ++a) {
        output[0 * layout.num_anchors + a] = coord(gen);
        output[1 * layout.num_anchors + a] = coord(gen);
        output[2 * layout.num_anchors + a] = size(gen);
        output[3 * layout.num_anchors + a] = size(gen);
        output[4 * layout.num_anchors + a] = score(gen);
    }

    LetterboxInfo info{1.0f, 0, 0};
    for (auto _ : state) {
        auto detections = decode_yolo_output(output.data(), layout, 0.5f, 0.7f, info, cv::Size(640, 640));
        state.counters["detections"] = static_cast<double>(detections.size());
    }
}

BENCHMARK_REGISTER_F(WalkerFixture, WalkWithCrops)->Arg(75)->Arg(95)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Letterbox)->Arg(320)->Arg(640)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_DecodeYoloOutput)->Unit(benchmark::kMicrosecond);

} // namespace screencap

int main(int argc, char** argv) {
    std::cout << "ScreenCap - Performance Benchmarks" << std::endl;
    std::cout << "==================================" << std::endl;

    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;

    auto devices = screencap::DeviceManager::instance().get_available_devices();
    std::cout << "  Inference Devices: ";
    for (size_t i = 0; i < devices.size(); ++i) {
        std::cout << devices[i];
        if (i < devices.size() - 1) std::cout << ", ";
    }
    std::cout << std::endl << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
