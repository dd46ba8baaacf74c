// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tailgate/core/metadata.hpp>
#include <tailgate/core/error.hpp>
#include <tailgate/core/log.hpp>
#include <array>
#include <charconv>
#include <new>
#include <utility>

namespace tailgate::core {

std::string encode_counter(std::uint64_t value) {
    std::array<char, COUNTER_WIDTH> digits{};
    auto [end, ec] = std::to_chars(digits.data(), digits.data() + digits.size(), value);
    (void)ec;  // 20 digits always hold a 64-bit value

    const auto used = static_cast<std::size_t>(end - digits.data());
    std::string field(COUNTER_WIDTH - used, '0');
    field.append(digits.data(), used);
    return field;
}

std::optional<std::uint64_t> parse_counter(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

//=============================================================================
// Metadata
//=============================================================================

Metadata Metadata::create(std::string hash, std::uint64_t size) {
    Metadata meta;
    meta.len = size + trailer_size(hash.size());
    meta.hash = std::move(hash);
    meta.size = size;
    meta.offset = 0;
    return meta;
}

std::expected<Metadata, std::error_code>
Metadata::from_file(const disk::File& file) noexcept {
    auto total = file.size();
    if (!total) {
        return std::unexpected(total.error());
    }
    if (*total < TRAILER_FIXED_SIZE) {
        return std::unexpected(make_error_code(DownloadErrc::metadata_missing));
    }

    std::array<char, TRAILER_FIXED_SIZE> counters{};
    if (auto ec = file.read(*total - TRAILER_FIXED_SIZE, counters.data(), counters.size())) {
        return std::unexpected(ec);
    }

    const std::string_view fields(counters.data(), counters.size());
    auto size = parse_counter(fields.substr(0, COUNTER_WIDTH));
    auto offset = parse_counter(fields.substr(COUNTER_WIDTH, COUNTER_WIDTH));
    if (!size || !offset) {
        return std::unexpected(make_error_code(DownloadErrc::metadata_parse_error));
    }

    // A size that leaves no room for the trailer, or progress past the end,
    // means the counters belong to some other file layout
    if (*size > *total - TRAILER_FIXED_SIZE || *offset > *size) {
        return std::unexpected(make_error_code(DownloadErrc::metadata_parse_error));
    }

    Metadata meta;
    meta.size = *size;
    meta.offset = *offset;
    meta.len = *total;

    const std::uint64_t hash_len = *total - *size - TRAILER_FIXED_SIZE;
    if (hash_len > MAX_HASH_SIZE) {
        return std::unexpected(make_error_code(DownloadErrc::metadata_parse_error));
    }

    try {
        meta.hash.resize(static_cast<std::size_t>(hash_len));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::metadata_parse_error));
    }

    if (hash_len > 0) {
        if (auto ec = file.read(meta.size, meta.hash.data(), meta.hash.size())) {
            return std::unexpected(ec);
        }
    }

    return meta;
}

std::error_code Metadata::update(disk::File& file) const noexcept {
    std::string trailer;
    try {
        trailer.reserve(static_cast<std::size_t>(trailer_size(hash.size())));
        trailer += hash;
        trailer += encode_counter(size);
        trailer += encode_counter(offset);
    } catch (const std::bad_alloc&) {
        return make_error_code(disk::DiskErrc::write_error);
    }

    if (auto ec = file.set_len(len)) {
        log::logger()->error("Failed to resize {} to {} bytes: {}", file.path(), len, ec.message());
        return ec;
    }

    if (auto ec = file.write(size, trailer.data(), trailer.size())) {
        log::logger()->error("Failed to write trailer of {}: {}", file.path(), ec.message());
        return ec;
    }

    return {};
}

bool Metadata::amend(std::string_view new_hash, std::uint64_t new_size) {
    // Both must differ; a change in only one keeps the stored progress
    if (hash != new_hash && size != new_size) {
        offset = 0;
        size = new_size;
        hash.assign(new_hash);
        len = size + trailer_size(hash.size());
        return true;
    }
    return false;
}

std::uint64_t Metadata::offset_field_position() const noexcept {
    return len - COUNTER_WIDTH;
}

} // namespace tailgate::core
