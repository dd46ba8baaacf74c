// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tailgate/core/downloading.hpp>
#include <tailgate/disk/file.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace tailgate::core {

// Lowercase hex SHA-256 of everything from the file cursor to end of file
[[nodiscard]] std::expected<std::string, std::error_code> sha256_hex(disk::File& file) noexcept;

// Lowercase hex SHA-256 of an in-memory buffer
[[nodiscard]] std::string sha256_hex(std::string_view data);

// Verify callback for Downloading::complete(). Read failures are logged and
// produce an empty digest.
[[nodiscard]] VerifyFn sha256_verifier();

} // namespace tailgate::core
