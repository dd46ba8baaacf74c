// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tailgate/core/http_fetcher.hpp>
#include <tailgate/core/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <map>
#include <string>

namespace tailgate::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Header callback: lowercase names, trimmed values
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// State shared with the body callback for one GET
struct TransferContext {
    CURL* curl{nullptr};
    Downloading* session{nullptr};
    const FetchProgress* progress{nullptr};
    std::uint64_t start_offset{0};
    bool status_checked{false};
    std::error_code error;
};

// Body callback: every buffer goes straight into the session.
// Returning less than the buffer size aborts the transfer.
std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const std::size_t bytes = size * nmemb;

    if (!ctx->status_checked) {
        ctx->status_checked = true;

        long http_code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);

        if (auto ec = HttpFetcher::status_to_error(http_code)) {
            ctx->error = ec;
            return 0;
        }
        // A full-body reply to a ranged request would land at the wrong offset
        if (ctx->start_offset > 0 && http_code == 200) {
            ctx->error = make_error_code(DownloadErrc::resume_failed);
            return 0;
        }
    }

    auto result = ctx->session->write(ptr, bytes);
    if (!result) {
        ctx->error = result.error();
        return 0;
    }

    if (ctx->progress && *ctx->progress) {
        const auto& meta = ctx->session->meta();
        if (!(*ctx->progress)(meta.offset, meta.size)) {
            ctx->error = make_error_code(DownloadErrc::cancelled);
            return 0;
        }
    }

    return bytes;
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                  return {};
        case CURLE_RANGE_ERROR:         return make_error_code(DownloadErrc::resume_failed);
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_LOGIN_DENIED:        return make_error_code(DownloadErrc::permission_denied);
        case CURLE_REMOTE_FILE_NOT_FOUND:
        case CURLE_FILE_COULDNT_READ_FILE:
                                        return make_error_code(DownloadErrc::not_found);
        default:                        return make_error_code(DownloadErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const FetchConfig& config) noexcept {
    if (config.follow_redirects) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

} // namespace

//=============================================================================
// HttpFetcher
//=============================================================================

std::error_code HttpFetcher::status_to_error(long http_code) noexcept {
    if (http_code < 400) {
        return {};
    }
    switch (http_code) {
        case 401:
        case 403: return make_error_code(DownloadErrc::permission_denied);
        case 404: return make_error_code(DownloadErrc::not_found);
        case 416: return make_error_code(DownloadErrc::invalid_range);
        default:  break;
    }
    return http_code >= 500 ? make_error_code(DownloadErrc::server_error)
                            : make_error_code(DownloadErrc::network_error);
}

std::expected<HttpResponse, std::error_code>
HttpFetcher::head(const std::string& url) const noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    try {
        HttpResponse response{};
        std::map<std::string, std::string> headers;

        curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        apply_common_options(curl.ptr, config_);

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &headers);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            log::logger()->warn("HEAD {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        if (auto ec = status_to_error(http_code)) {
            log::logger()->warn("HEAD {} returned HTTP {}", url, http_code);
            return std::unexpected(ec);
        }

        // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is not filled in for HEAD
        auto cl_it = headers.find("content-length");
        if (cl_it != headers.end() && !cl_it->second.empty()) {
            char* end = nullptr;
            unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
            if (end == cl_it->second.c_str() + cl_it->second.size()) {
                response.content_length = static_cast<std::uint64_t>(val);
            }
        }

        auto ar_it = headers.find("accept-ranges");
        response.accepts_ranges = ar_it != headers.end()
            && ar_it->second.find("bytes") != std::string::npos;

        return response;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<std::uint64_t, std::error_code>
HttpFetcher::fetch(const std::string& url, Downloading& session,
                   const FetchProgress& progress) const noexcept {
    if (session.completed()) {
        return std::unexpected(make_error_code(DownloadErrc::session_closed));
    }

    const auto& meta = session.meta();
    if (meta.complete()) {
        return meta.offset;
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    try {
        TransferContext ctx;
        ctx.curl = curl.ptr;
        ctx.session = &session;
        ctx.progress = &progress;
        ctx.start_offset = meta.offset;

        curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());

        // Open-ended range from the resume point
        std::string range;
        if (meta.offset > 0) {
            range = std::to_string(meta.offset) + "-";
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
            log::logger()->info("Resuming {} at byte {}", url, meta.offset);
        }

        apply_common_options(curl.ptr, config_);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.stall_timeout_sec));
        curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(config_.buffer_size));

        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

        CURLcode result = curl_easy_perform(curl.ptr);

        // Errors raised inside the body callback are more specific than
        // CURLE_WRITE_ERROR
        if (ctx.error) {
            log::logger()->warn("Transfer of {} stopped at {}: {}", url, session.meta().offset,
                                ctx.error.message());
            return std::unexpected(ctx.error);
        }
        if (result != CURLE_OK) {
            log::logger()->warn("GET {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }

        // Error replies without a body never reach the write callback
        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        if (auto ec = status_to_error(http_code)) {
            return std::unexpected(ec);
        }

        return session.meta().offset;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

void HttpFetcher::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpFetcher::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace tailgate::core
