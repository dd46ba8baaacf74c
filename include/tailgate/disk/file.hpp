// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tailgate/disk/error.hpp>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <expected>

namespace tailgate::disk {

enum class OpenMode : std::uint8_t {
    read,               // Existing file, read only
    read_write_create,  // Read+write, created if absent, never truncated
};

// Owning POSIX file handle
//
// Positional reads/writes (pread/pwrite) never move the cursor; read_some()
// and seek() operate on the cursor and exist for streaming consumers such as
// hash verifiers.
class File {
public:
    [[nodiscard]] static std::expected<File, std::error_code>
    open(std::string_view path, OpenMode mode) noexcept;

    ~File();

    // Non-copyable, movable
    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&&) noexcept;
    File& operator=(File&&) noexcept;

    // Current physical length
    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    // Truncate or extend (zero-filled) to exactly `length` bytes
    [[nodiscard]] std::error_code set_len(std::uint64_t length) noexcept;

    // Write all `size` bytes at `offset`
    [[nodiscard]] std::error_code
    write(std::uint64_t offset, const void* data, std::size_t size) noexcept;

    // Read exactly `size` bytes at `offset`; short_read if EOF comes first
    [[nodiscard]] std::error_code
    read(std::uint64_t offset, void* buffer, std::size_t size) const noexcept;

    // Sequential read from the cursor; 0 at end of file
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read_some(void* buffer, std::size_t size) noexcept;

    // Move the cursor to an absolute position
    [[nodiscard]] std::error_code seek(std::uint64_t position) noexcept;

    // Flush buffers to disk
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    File() = default;

    int fd_{-1};
    std::string path_;
};

// Map an errno value into the disk category
[[nodiscard]] std::error_code errno_to_error_code(int err) noexcept;

} // namespace tailgate::disk
