// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace tailgate::core {

enum class DownloadErrc {
    success = 0,
    // Session and trailer conditions
    destination_exists,
    metadata_missing,
    metadata_parse_error,
    write_overflow,
    not_yet_complete,
    verification_failed,
    session_closed,
    invalid_path,
    // Transfer conditions (fetch layer only)
    network_error,
    not_found,
    server_error,
    permission_denied,
    invalid_range,
    resume_failed,
    size_unknown,
    cancelled,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "tailgate::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::destination_exists:   return "Destination file already exists";
            case DownloadErrc::metadata_missing:     return "File does not contain download metadata";
            case DownloadErrc::metadata_parse_error: return "Failed to parse download metadata";
            case DownloadErrc::write_overflow:       return "Write exceeds declared file size";
            case DownloadErrc::not_yet_complete:     return "Download is not complete yet";
            case DownloadErrc::verification_failed:  return "File verification failed";
            case DownloadErrc::session_closed:       return "Download session already completed";
            case DownloadErrc::invalid_path:         return "Invalid destination path";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::permission_denied:    return "Permission denied";
            case DownloadErrc::invalid_range:        return "Invalid byte range";
            case DownloadErrc::resume_failed:        return "Server does not support resuming";
            case DownloadErrc::size_unknown:         return "Content length unknown";
            case DownloadErrc::cancelled:            return "Download cancelled";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace tailgate::core

namespace std {

template<>
struct is_error_code_enum<tailgate::core::DownloadErrc> : true_type {};

} // namespace std
