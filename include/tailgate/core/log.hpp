// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace tailgate::log {

constexpr std::string_view LOGGER_NAME = "tailgate";

// Shared project logger (stderr, colored); created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> logger() noexcept;

void set_level(spdlog::level::level_enum level) noexcept;

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "off")
// Returns false and leaves the level untouched for unknown names
[[nodiscard]] bool set_level(std::string_view name) noexcept;

} // namespace tailgate::log
