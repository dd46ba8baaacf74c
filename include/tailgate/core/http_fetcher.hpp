// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tailgate/core/config.hpp>
#include <tailgate/core/downloading.hpp>
#include <tailgate/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace tailgate::core {

// What a HEAD request tells us about the resource
struct HttpResponse {
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
};

// Transfer tuning
struct FetchConfig {
    std::size_t buffer_size{WRITE_BUFFER_SIZE};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    bool follow_redirects{FOLLOW_REDIRECTS};
};

// Called after every chunk with (offset, size); return false to cancel
using FetchProgress = std::function<bool(std::uint64_t, std::uint64_t)>;

// Streams a URL into a Downloading session with libcurl, resuming from the
// session's offset with a Range request.
class HttpFetcher {
public:
    HttpFetcher() = default;
    explicit HttpFetcher(FetchConfig config) noexcept : config_(config) {}

    // HEAD request for size and range support
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) const noexcept;

    // Download the rest of the content into `session`. Returns the session
    // offset reached; equal to the declared size once everything arrived.
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    fetch(const std::string& url, Downloading& session,
          const FetchProgress& progress = {}) const noexcept;

    [[nodiscard]] const FetchConfig& config() const noexcept { return config_; }
    void config(const FetchConfig& cfg) noexcept { config_ = cfg; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Map an HTTP status to a download error; empty for success statuses
    [[nodiscard]] static std::error_code status_to_error(long http_code) noexcept;

private:
    FetchConfig config_;
};

} // namespace tailgate::core
