// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tailgate/core/downloading.hpp>
#include <tailgate/core/config.hpp>
#include <tailgate/core/error.hpp>
#include <tailgate/core/log.hpp>
#include <filesystem>
#include <utility>

namespace tailgate::core {

namespace fs = std::filesystem;

std::string Downloading::working_path(std::string_view final_path) {
    // Trailing separators do not belong to the file name
    while (final_path.size() > 1 && final_path.back() == '/') {
        final_path.remove_suffix(1);
    }

    const auto slash = final_path.rfind('/');
    const std::string_view dir = slash == std::string_view::npos
        ? std::string_view{}
        : final_path.substr(0, slash + 1);
    const std::string_view name = slash == std::string_view::npos
        ? final_path
        : final_path.substr(slash + 1);

    if (name.empty() || name == "." || name == ".." || name == "/") {
        return {};
    }

    // A leading dot starts a hidden name, not an extension
    const auto dot = name.rfind('.');
    const bool has_extension = dot != std::string_view::npos && dot != 0;

    std::string result;
    result.reserve(dir.size() + name.size() + WORKING_SUFFIX.size() + 2);
    result += dir;
    result += name;
    result += has_extension ? "." : "..";
    result += WORKING_SUFFIX;
    return result;
}

//=============================================================================
// Downloading
//=============================================================================

Downloading::Downloading(std::string working_path, std::string final_path,
                         disk::File file, Metadata meta) noexcept
    : working_path_(std::move(working_path))
    , final_path_(std::move(final_path))
    , file_(std::move(file))
    , meta_(std::move(meta)) {}

std::expected<Downloading, std::error_code>
Downloading::open(std::string_view final_path, std::string hash, std::uint64_t size) noexcept {
    auto logger = log::logger();

    if (hash.size() > MAX_HASH_SIZE) {
        logger->error("Hash of {} bytes exceeds the {} byte limit", hash.size(), MAX_HASH_SIZE);
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    try {
        std::string target(final_path);

        std::error_code ec;
        if (fs::exists(target, ec)) {
            logger->warn("Refusing to download over existing file {}", target);
            return std::unexpected(make_error_code(DownloadErrc::destination_exists));
        }
        if (ec) {
            return std::unexpected(ec);
        }

        // A trailing separator names a directory, which rename() cannot replace
        std::string working = working_path(target);
        if (working.empty() || target.back() == '/') {
            return std::unexpected(make_error_code(DownloadErrc::invalid_path));
        }

        auto file = disk::File::open(working, disk::OpenMode::read_write_create);
        if (!file) {
            logger->error("Cannot open {}: {}", working, file.error().message());
            return std::unexpected(file.error());
        }

        auto current_len = file->size();
        if (!current_len) {
            return std::unexpected(current_len.error());
        }

        Metadata meta;
        if (*current_len < TRAILER_FIXED_SIZE) {
            meta = Metadata::create(std::move(hash), size);
            logger->debug("Starting {} ({} bytes, hash {})", working, meta.size, meta.hash);
        } else {
            auto decoded = Metadata::from_file(*file);
            if (!decoded) {
                logger->error("Cannot read metadata of {}: {}", working, decoded.error().message());
                return std::unexpected(decoded.error());
            }
            meta = std::move(*decoded);

            if (meta.amend(hash, size)) {
                logger->info("Discarding stale progress of {}, restarting for hash {}", working, meta.hash);
            } else {
                logger->debug("Resuming {} at {}/{}", working, meta.offset, meta.size);
            }
        }

        if (auto update_ec = meta.update(*file)) {
            return std::unexpected(update_ec);
        }

        return Downloading(std::move(working), std::move(target), std::move(*file), std::move(meta));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<WriteProgress, std::error_code>
Downloading::write(const void* data, std::size_t size) noexcept {
    if (completed_) {
        return std::unexpected(make_error_code(DownloadErrc::session_closed));
    }
    if (size > meta_.size - meta_.offset) {
        return std::unexpected(make_error_code(DownloadErrc::write_overflow));
    }

    const std::uint64_t next = meta_.offset + size;

    if (size > 0) {
        if (auto ec = file_.write(meta_.offset, data, size)) {
            log::logger()->error("Write to {} at {} failed: {}", working_path_, meta_.offset, ec.message());
            return std::unexpected(ec);
        }
    }

    // Only the offset field changes per chunk; hash and size stay as written
    std::string field;
    try {
        field = encode_counter(next);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
    if (auto ec = file_.write(meta_.offset_field_position(), field.data(), field.size())) {
        log::logger()->error("Cannot record offset of {}: {}", working_path_, ec.message());
        return std::unexpected(ec);
    }

    meta_.offset = next;

    if (next != meta_.size) {
        return WriteProgress{next};
    }
    return WriteProgress{std::nullopt};
}

std::error_code Downloading::complete(const VerifyFn& verify) noexcept {
    auto logger = log::logger();

    if (completed_) {
        return make_error_code(DownloadErrc::session_closed);
    }
    if (!meta_.complete()) {
        return make_error_code(DownloadErrc::not_yet_complete);
    }
    if (!verify) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    // Put the trailer back so the file stays resumable after a failure
    auto restore = [&](std::error_code cause) {
        if (auto ec = meta_.update(file_)) {
            logger->error("Cannot restore metadata of {}: {}", working_path_, ec.message());
        }
        return cause;
    };

    if (auto ec = file_.set_len(meta_.size)) {
        return restore(ec);
    }
    if (auto ec = file_.seek(0)) {
        return restore(ec);
    }

    std::string actual;
    try {
        actual = verify(file_);
    } catch (const std::exception& e) {
        logger->error("Verification of {} threw: {}", working_path_, e.what());
        return restore(make_error_code(DownloadErrc::verification_failed));
    } catch (...) {
        logger->error("Verification of {} threw a non-standard exception", working_path_);
        return restore(make_error_code(DownloadErrc::verification_failed));
    }

    if (actual != meta_.hash) {
        logger->warn("Verification of {} failed: expected {}, got {}", working_path_, meta_.hash, actual);
        return restore(make_error_code(DownloadErrc::verification_failed));
    }

    if (auto ec = file_.flush()) {
        return restore(ec);
    }

    std::error_code ec;
    fs::rename(working_path_, final_path_, ec);
    if (ec) {
        logger->error("Cannot move {} to {}: {}", working_path_, final_path_, ec.message());
        return restore(ec);
    }

    file_.close();
    completed_ = true;
    logger->info("Completed {} ({} bytes)", final_path_, meta_.size);
    return {};
}

} // namespace tailgate::core
