// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tailgate/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tailgate::cli {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    // Nothing meaningful to draw for empty content
    if (total_ == 0) return;

    try {
        double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
        percent = std::clamp(percent, 0.0, 100.0);

        const int pct_int = static_cast<int>(percent);
        if (pct_int == last_percent_) return;
        last_percent_ = pct_int;

        std::string line = "\r";
        if (!label_.empty()) {
            line += label_;
            line += ": ";
        }

        line += render_bar(percent);
        line += " ";
        if (pct_int < 10) line += " ";
        if (pct_int < 100) line += " ";
        line += std::to_string(pct_int) + "%";

        line += " (";
        line += format_bytes(current);
        line += "/";
        line += format_bytes(total_);
        line += ")";

        if (speed_bps > 0) {
            line += " @ ";
            line += format_speed(speed_bps);

            std::uint64_t remaining = current < total_ ? total_ - current : 0;
            if (remaining > 0) {
                line += " ETA: ";
                line += format_time(remaining / speed_bps);
            }
        }

        // Clear rest of line
        line += std::string(10, ' ');

        std::cout << line << std::flush;
    } catch (const std::exception&) {
        // Drawing is cosmetic; a failed redraw is retried on the next update
        last_percent_ = -1;
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    last_percent_ = -1;
    update(total_, 0);
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(bar_width - filled), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) {
        return fixed(static_cast<double>(bps) / GB, 1) + " GB/s";
    } else if (bps >= MB) {
        return fixed(static_cast<double>(bps) / MB, 1) + " MB/s";
    } else if (bps >= KB) {
        return fixed(static_cast<double>(bps) / KB, 1) + " KB/s";
    }
    return std::to_string(bps) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    } else if (bytes >= GB) {
        return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    } else if (bytes >= MB) {
        return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    } else if (bytes >= KB) {
        return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes;
        return ss.str() + "m " + std::to_string(secs) + "s";
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace tailgate::cli
