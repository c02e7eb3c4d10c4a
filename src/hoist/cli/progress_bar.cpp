// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/cli/progress_bar.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace hoist::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, double speed_bps) noexcept {
    if (total_ == 0 || finished_) return;

    current_ = std::min(current, total_);
    double percent = static_cast<double>(current_) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw on a whole-percent change
    int whole = static_cast<int>(percent);
    if (whole == last_percent_) return;
    last_percent_ = whole;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);
    line += fmt::format(" {:3d}% ({}/{})", whole, format_bytes(current_), format_bytes(total_));

    if (speed_bps > 0.0) {
        line += " @ ";
        line += format_speed(speed_bps);

        std::uint64_t remaining = total_ - current_;
        if (remaining > 0) {
            line += " ETA: ";
            line += format_time(static_cast<std::uint64_t>(static_cast<double>(remaining) / speed_bps));
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');

    std::cout << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    update(total_, 0.0);
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) const {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(double bps) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;

    if (bps >= GB) return fmt::format("{:.1f} GiB/s", bps / GB);
    if (bps >= MB) return fmt::format("{:.1f} MiB/s", bps / MB);
    if (bps >= KB) return fmt::format("{:.1f} KiB/s", bps / KB);
    return fmt::format("{:.0f} B/s", bps);
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    const auto value = static_cast<double>(bytes);
    if (bytes >= TB) return fmt::format("{:.2f} TiB", value / TB);
    if (bytes >= GB) return fmt::format("{:.2f} GiB", value / GB);
    if (bytes >= MB) return fmt::format("{:.1f} MiB", value / MB);
    if (bytes >= KB) return fmt::format("{:.0f} KiB", value / KB);
    return fmt::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h {:02d}m {}s", hours, minutes, secs);
    }
    if (minutes > 0) {
        return fmt::format("{}m {}s", minutes, secs);
    }
    return fmt::format("{}s", secs);
}

} // namespace hoist::cli
