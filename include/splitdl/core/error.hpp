// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace splitdl::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    server_error,
    http_error,
    permission_denied,
    invalid_url,
    invalid_range,
    invalid_config,
    cancelled,
    too_many_redirects,
    ssl_error,
    dns_error,
    connection_lost,
    write_aborted,
    incomplete_body,
    retries_exhausted,
    segment_failed,
    stream_failed,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "splitdl::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:            return "Success";
            case DownloadErrc::network_error:      return "Network error";
            case DownloadErrc::timeout:            return "Operation timed out";
            case DownloadErrc::refused:            return "Connection refused";
            case DownloadErrc::not_found:          return "Resource not found (404)";
            case DownloadErrc::server_error:       return "Server error (5xx)";
            case DownloadErrc::http_error:         return "Unexpected HTTP status";
            case DownloadErrc::permission_denied:  return "Permission denied";
            case DownloadErrc::invalid_url:        return "Invalid URL";
            case DownloadErrc::invalid_range:      return "Invalid byte range";
            case DownloadErrc::invalid_config:     return "Invalid configuration";
            case DownloadErrc::cancelled:          return "Transfer interrupted";
            case DownloadErrc::too_many_redirects: return "Too many redirects";
            case DownloadErrc::ssl_error:          return "SSL/TLS error";
            case DownloadErrc::dns_error:          return "DNS resolution failed";
            case DownloadErrc::connection_lost:    return "Connection lost";
            case DownloadErrc::write_aborted:      return "Transfer aborted by writer";
            case DownloadErrc::incomplete_body:    return "Response body shorter than requested range";
            case DownloadErrc::retries_exhausted:  return "Retries exhausted";
            case DownloadErrc::segment_failed:     return "Segment transfer failed";
            case DownloadErrc::stream_failed:      return "Stream transfer failed";
            default:                               return "Unknown error";
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

// Map a non-success HTTP status onto the download category
[[nodiscard]] inline std::error_code status_to_error(std::int32_t status) noexcept {
    if (status == 404) return make_error_code(DownloadErrc::not_found);
    if (status == 401 || status == 403) return make_error_code(DownloadErrc::permission_denied);
    if (status == 416) return make_error_code(DownloadErrc::invalid_range);
    if (status >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::http_error);
}

} // namespace splitdl::core

namespace std {

template<>
struct is_error_code_enum<splitdl::core::DownloadErrc> : true_type {};

} // namespace std
