// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tailgate/core/config.hpp>
#include <tailgate/disk/file.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>
#include <optional>
#include <system_error>

namespace tailgate::core {

// Download metadata stored as a trailer at the end of the working file:
//
//   [0, size)                 content
//   [size, size+H)            hash text
//   [size+H, size+H+20)       size, zero-padded decimal
//   [size+H+20, size+H+40)    offset, zero-padded decimal
struct Metadata {
    std::string hash;
    std::uint64_t size{0};
    std::uint64_t offset{0};
    std::uint64_t len{0};       // size + trailer length

    // Fresh metadata for a new download (offset 0). No I/O.
    [[nodiscard]] static Metadata create(std::string hash, std::uint64_t size);

    // Decode the trailer of an open file
    [[nodiscard]] static std::expected<Metadata, std::error_code>
    from_file(const disk::File& file) noexcept;

    // Rewrite the whole trailer and resize the file to `len`
    [[nodiscard]] std::error_code update(disk::File& file) const noexcept;

    // Reset progress when both hash and size differ from the request.
    // Returns true if progress was reset.
    bool amend(std::string_view new_hash, std::uint64_t new_size);

    // Trailer length for a hash of the given byte length
    [[nodiscard]] static constexpr std::uint64_t trailer_size(std::size_t hash_len) noexcept {
        return static_cast<std::uint64_t>(hash_len) + TRAILER_FIXED_SIZE;
    }

    // Byte position of the offset field
    [[nodiscard]] std::uint64_t offset_field_position() const noexcept;

    [[nodiscard]] bool complete() const noexcept { return offset == size; }
};

// 20-digit zero-padded decimal field
[[nodiscard]] std::string encode_counter(std::uint64_t value);

// Parses one counter field; nullopt unless the text is only decimal digits
// and fits in 64 bits
[[nodiscard]] std::optional<std::uint64_t> parse_counter(std::string_view text) noexcept;

} // namespace tailgate::core

