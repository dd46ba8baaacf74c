// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tailgate/core/metadata.hpp>
#include <tailgate/disk/file.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace tailgate::core {

// Computes the actual content hash of the working file. The file is already
// truncated to the content length and rewound to its start. Runs on the
// calling thread.
using VerifyFn = std::function<std::string(disk::File&)>;

// Progress after a write: the new offset, or nullopt once every content byte
// has been received and the download is ready for complete()
using WriteProgress = std::optional<std::uint64_t>;

// Resumable download session over a single "<name>.downloading" file that
// carries its own metadata trailer.
//
// A session exclusively owns the working file handle. Chunks must arrive in
// append order starting from meta().offset; the session does not detect
// out-of-order or duplicated data. Two sessions must never be opened on the
// same working path at once.
class Downloading {
public:
    // Create the working file for `final_path`, or resume an existing one.
    // Stored progress is kept unless both hash and size differ from the
    // request, in which case it restarts from zero.
    [[nodiscard]] static std::expected<Downloading, std::error_code>
    open(std::string_view final_path, std::string hash, std::uint64_t size) noexcept;

    // Non-copyable, movable
    Downloading(const Downloading&) = delete;
    Downloading& operator=(const Downloading&) = delete;
    Downloading(Downloading&&) noexcept = default;
    Downloading& operator=(Downloading&&) noexcept = default;
    ~Downloading() = default;

    // Append a chunk at the current offset and persist the new offset
    [[nodiscard]] std::expected<WriteProgress, std::error_code>
    write(const void* data, std::size_t size) noexcept;

    [[nodiscard]] std::expected<WriteProgress, std::error_code>
    write(std::span<const std::byte> chunk) noexcept {
        return write(chunk.data(), chunk.size());
    }

    // Drop the trailer, verify, and move the file to its final path. On a
    // hash mismatch the trailer is restored and the session stays usable.
    [[nodiscard]] std::error_code complete(const VerifyFn& verify) noexcept;

    [[nodiscard]] const Metadata& meta() const noexcept { return meta_; }
    [[nodiscard]] const std::string& working_path() const noexcept { return working_path_; }
    [[nodiscard]] const std::string& final_path() const noexcept { return final_path_; }
    [[nodiscard]] bool completed() const noexcept { return completed_; }

    // "<stem>.<ext>.downloading" next to `final_path`; a name without an
    // extension becomes "<name>..downloading". Empty if `final_path` has no
    // file name.
    [[nodiscard]] static std::string working_path(std::string_view final_path);

private:
    Downloading(std::string working_path, std::string final_path,
                disk::File file, Metadata meta) noexcept;

    std::string working_path_;
    std::string final_path_;
    disk::File file_;
    Metadata meta_;
    bool completed_{false};
};

} // namespace tailgate::core
