// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tailgate {

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 2;
    std::uint32_t patch = 0;

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
} version;

constexpr std::string_view BUILD_DATE = __DATE__;
constexpr std::string_view BUILD_TIME = __TIME__;

// "Tailgate 0.2.0 (built <date> <time>)"
[[nodiscard]] inline std::string version_banner() {
    std::string banner = "Tailgate " + version.to_string() + " (built ";
    banner += BUILD_DATE;
    banner += ' ';
    banner += BUILD_TIME;
    banner += ')';
    return banner;
}

} // namespace tailgate
