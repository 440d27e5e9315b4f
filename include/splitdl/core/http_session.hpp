// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace splitdl::core {

struct EngineConfig;

// HTTP response headers (names lower-cased)
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::uint64_t content_length{0};  // 0 when the header is absent
    bool has_content_length{false};
    bool accepts_ranges{false};
    std::string content_type;
    std::string content_disposition;

    [[nodiscard]] const std::string* header(const std::string& lower_name) const noexcept {
        auto it = headers.find(lower_name);
        return it == headers.end() ? nullptr : &it->second;
    }
};

// Inclusive byte interval for a Range request
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return last - first + 1; }
};

// Receives body bytes with the response status; return false to abort the transfer
using DataSink = std::function<bool(std::int32_t status, std::string_view chunk)>;

// Network seam used by the engine
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Metadata-only request, redirects followed
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;

    // GET, optionally ranged. Body bytes reach the sink only for 2xx responses.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        std::optional<ByteRange> range,
        const DataSink& sink,
        std::stop_token stoken) noexcept = 0;
};

// libcurl transport; one easy handle per request so it is safe to share across threads
class HttpSession final : public HttpTransport {
public:
    explicit HttpSession(std::chrono::seconds timeout = std::chrono::seconds{30});

    // Network operations bounded by config.timeout_seconds
    explicit HttpSession(const EngineConfig& config);

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        std::optional<ByteRange> range,
        const DataSink& sink,
        std::stop_token stoken) noexcept override;

    [[nodiscard]] std::chrono::seconds timeout() const noexcept { return timeout_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Fill content_length / accepts_ranges / content_type from the header map
    static void apply_headers(HttpResponse& response);

private:
    std::chrono::seconds timeout_;
};

// RAII wrapper around curl_global_init / curl_global_cleanup
class CurlGlobal {
public:
    CurlGlobal() noexcept { HttpSession::global_init(); }
    ~CurlGlobal() { HttpSession::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace splitdl::core
