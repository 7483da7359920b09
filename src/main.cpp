#include "config.hpp"
#include "dependency_check.hpp"
#include "mode_selector.hpp"
#include "video_processor.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Extracts screenshots and face/character crops from every video in <root>/input.\n"
              << "Options:\n"
              << "  --root DIR           Working directory holding input/, output/ and model/ (default: .)\n"
              << "  --config FILE        JSON configuration (default: <root>/screencap.json if present)\n"
              << "  --mode MODE          realistic or anime; skips the interactive prompt\n"
              << "  --face-model NAME    Realistic detector: cascade or cnn (default: cascade)\n"
              << "  --cpu                Force CPU inference\n"
              << "  --report FILE        Write a JSON run report\n"
              << "  --no-progress        Disable progress bars\n"
              << "  --check              Only run the dependency check\n"
              << "  -h, --help           Show this help\n";
}

namespace {

void ensure_working_dirs(const screencap::ScreenCapConfig& config) {
    for (const auto& dir : {config.input_path(), config.model_path()}) {
        std::filesystem::create_directories(dir);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string root_dir;
    std::string config_file;
    std::string mode_name;
    std::string face_model;
    std::string report_file;
    bool force_cpu = false;
    bool no_progress = false;
    bool check_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--root") {
            if (++i < argc) root_dir = argv[i];
        } else if (arg == "--config") {
            if (++i < argc) config_file = argv[i];
        } else if (arg == "--mode") {
            if (++i < argc) mode_name = argv[i];
        } else if (arg == "--face-model") {
            if (++i < argc) face_model = argv[i];
        } else if (arg == "--report") {
            if (++i < argc) report_file = argv[i];
        } else if (arg == "--cpu") {
            force_cpu = true;
        } else if (arg == "--no-progress") {
            no_progress = true;
        } else if (arg == "--check") {
            check_only = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        screencap::ScreenCapConfig config;
        if (!root_dir.empty()) {
            config.root_dir = root_dir;
        }

        if (!config_file.empty()) {
            screencap::load_config_file(config_file, config);
        } else if (std::filesystem::exists(config.root_dir / "screencap.json")) {
            screencap::load_config_file(config.root_dir / "screencap.json", config);
        }
        if (!root_dir.empty()) {
            config.root_dir = root_dir;
        }
        if (!face_model.empty()) {
            config.realistic.model = screencap::parse_face_model(face_model);
        }
        if (force_cpu) {
            config.use_gpu = false;
        }
        if (no_progress) {
            config.show_progress = false;
        }
        config.validate();

        ensure_working_dirs(config);

        auto missing = screencap::check_runtime_dependencies();
        if (!missing.empty()) {
            screencap::print_missing_dependencies(missing, std::cout);
            return 1;
        }

        if (!mode_name.empty()) {
            config.mode = screencap::parse_detection_mode(mode_name);
        } else {
            auto mode = screencap::prompt_detection_mode(std::cin, std::cout);
            if (!mode) {
                std::cout << "Invalid input. Exiting." << std::endl;
                return 1;
            }
            config.mode = *mode;
        }

        missing = screencap::check_model_files(config);
        if (!missing.empty()) {
            screencap::print_missing_dependencies(missing, std::cout);
            return 1;
        }
        if (check_only) {
            std::cout << "All dependencies for " << screencap::to_string(config.mode)
                      << " mode are available." << std::endl;
            return 0;
        }

        std::cout << "Starting processing in " << screencap::to_string(config.mode) << " mode..." << std::endl;

        auto start_time = std::chrono::high_resolution_clock::now();

        screencap::VideoProcessor processor(config);
        auto report = processor.process_all();

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        if (!report_file.empty()) {
            json report_json = screencap::to_json(report);
            report_json["config"] = screencap::to_json(config);
            report_json["total_time_ms"] = total_time.count();

            std::ofstream file(report_file);
            if (!file.good()) {
                std::cerr << "Error: cannot write report to " << report_file << std::endl;
                return 1;
            }
            file << report_json.dump(2);
            std::cout << "Report saved to: " << report_file << std::endl;
        }

        std::cout << "All videos have been processed." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
