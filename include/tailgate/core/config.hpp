// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace tailgate::core {

// Trailer layout: <hash><size:20><offset:20>
constexpr std::size_t COUNTER_WIDTH = 20;
constexpr std::size_t TRAILER_FIXED_SIZE = 2 * COUNTER_WIDTH;      // 40 bytes
constexpr std::size_t MAX_HASH_SIZE = 4096;                         // Longest accepted hash field

constexpr std::string_view WORKING_SUFFIX = "downloading";

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;               // 256 KB
constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;              // 256 KB

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

} // namespace tailgate::core
