#include "progress_bar.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>
#include <utility>

namespace screencap {

namespace {

constexpr int kBarWidth = 20;
constexpr auto kRedrawInterval = std::chrono::milliseconds(100);

std::string format_elapsed(double seconds) {
    const int total = static_cast<int>(seconds);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d", total / 60, total % 60);
    return buffer;
}

} // namespace

ProgressBar::ProgressBar(std::string description, size_t total, std::string unit,
                         bool enabled, std::ostream& out)
    : description_(std::move(description))
    , total_(total)
    , unit_(std::move(unit))
    , enabled_(enabled)
    , out_(out)
    , start_(std::chrono::steady_clock::now())
    , last_render_(start_) {
    render(true);
}

ProgressBar::~ProgressBar() {
    close();
}

void ProgressBar::update(size_t n) {
    count_ += n;
    render(total_ > 0 && count_ >= total_);
}

void ProgressBar::close() {
    if (closed_) {
        return;
    }
    render(true);
    if (enabled_) {
        out_ << std::endl;
    }
    closed_ = true;
}

void ProgressBar::render(bool force) {
    if (!enabled_ || closed_) {
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if (!force && now - last_render_ < kRedrawInterval) {
        return;
    }
    last_render_ = now;

    const double elapsed = std::chrono::duration<double>(now - start_).count();
    const double rate = elapsed > 0.0 ? count_ / elapsed : 0.0;

    std::ostringstream line;
    line << "\r" << description_ << ": ";
    if (total_ > 0) {
        const double fraction = std::min(1.0, static_cast<double>(count_) / total_);
        const int filled = static_cast<int>(fraction * kBarWidth);
        line << static_cast<int>(fraction * 100.0) << "%|"
             << std::string(filled, '#') << std::string(kBarWidth - filled, ' ') << "| "
             << count_ << "/" << total_;
    } else {
        line << count_;
    }

    char rate_text[32];
    std::snprintf(rate_text, sizeof(rate_text), "%.1f", rate);
    line << " [" << format_elapsed(elapsed) << ", " << rate_text << " " << unit_ << "/s]";

    out_ << line.str() << std::flush;
}

} // namespace screencap
