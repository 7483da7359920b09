#pragma once

#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>

namespace screencap {

// Single-line console progress bar:
//   Processing: clip.mp4:  45%|#########           | 45/100 [00:03, 14.9 Frame/s]
// When total is 0 (unknown length) only the count and rate are shown.
class ProgressBar {
public:
    ProgressBar(std::string description, size_t total, std::string unit,
                bool enabled = true, std::ostream& out = std::cerr);
    ~ProgressBar();

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    void update(size_t n = 1);
    void close();

    size_t count() const { return count_; }

private:
    void render(bool force);

    std::string description_;
    size_t total_;
    std::string unit_;
    bool enabled_;
    std::ostream& out_;

    size_t count_ = 0;
    bool closed_ = false;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_render_;
};

} // namespace screencap
