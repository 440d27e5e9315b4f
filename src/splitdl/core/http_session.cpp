// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/http_session.hpp>
#include <splitdl/core/config.hpp>
#include <splitdl/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace splitdl::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(other.ptr) { other.ptr = nullptr; }
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = other.ptr;
            other.ptr = nullptr;
        }
        return *this;
    }
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new response (redirect hop); keep only the final one
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    (*headers)[to_lower(name)] = std::string(value);
    return total;
}

struct GetContext {
    CURL* curl{nullptr};
    const DataSink* sink{nullptr};
    std::stop_token stoken;
    bool status_checked{false};
    bool forward{false};
    std::int32_t status{0};
    bool sink_aborted{false};
};

// Write callback for GET requests; non-2xx bodies are drained and dropped
std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<GetContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (!ctx->status_checked) {
        long http_code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
        ctx->status = static_cast<std::int32_t>(http_code);
        ctx->forward = http_code >= 200 && http_code < 300;
        ctx->status_checked = true;
    }

    if (!ctx->forward || !ctx->sink || !*ctx->sink) {
        return bytes;
    }

    try {
        if (!(*ctx->sink)(ctx->status, std::string_view(ptr, bytes))) {
            ctx->sink_aborted = true;
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::warn("Data sink threw: {}", e.what());
        ctx->sink_aborted = true;
        return 0;
    }
    return bytes;
}

// Aborts the transfer once a stop is requested
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<GetContext*>(userdata);
    return ctx->stoken.stop_requested() ? 1 : 0;
}

std::error_code curl_to_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OPERATION_TIMEDOUT:      return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:   return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:         return make_error_code(DownloadErrc::refused);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:      return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:      return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:             return make_error_code(DownloadErrc::connection_lost);
        case CURLE_ABORTED_BY_CALLBACK:     return make_error_code(DownloadErrc::cancelled);
        case CURLE_WRITE_ERROR:             return make_error_code(DownloadErrc::write_aborted);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:    return make_error_code(DownloadErrc::invalid_url);
        default:                            return make_error_code(DownloadErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const std::string& url, std::chrono::seconds timeout) {
    static const std::string user_agent = "splitdl/" + splitdl::version.to_string();

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(std::chrono::seconds timeout)
    : timeout_(timeout) {}

HttpSession::HttpSession(const EngineConfig& config)
    : timeout_(std::chrono::seconds{config.timeout_seconds}) {}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};

    try {
        apply_common_options(curl.ptr, url, timeout_);
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);

        // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T doesn't work for HEAD
        apply_headers(response);
    } catch (const std::exception& e) {
        spdlog::warn("HEAD {} failed: {}", url, e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    if (response.status_code >= 400) {
        return std::unexpected(status_to_error(response.status_code));
    }
    return response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url,
                 std::optional<ByteRange> range,
                 const DataSink& sink,
                 std::stop_token stoken) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    GetContext ctx;
    ctx.curl = curl.ptr;
    ctx.sink = &sink;
    ctx.stoken = std::move(stoken);

    try {
        apply_common_options(curl.ptr, url, timeout_);

        std::string range_str;
        if (range) {
            range_str = std::to_string(range->first) + "-" + std::to_string(range->last);
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range_str.c_str());
        }

        // Stall bound: less than 1 B/s for the whole timeout window
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout_.count()));

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            if (ctx.sink_aborted) {
                return std::unexpected(make_error_code(DownloadErrc::write_aborted));
            }
            return std::unexpected(curl_to_error(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);
        apply_headers(response);
    } catch (const std::exception& e) {
        spdlog::warn("GET {} failed: {}", url, e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    return response;
}

void HttpSession::apply_headers(HttpResponse& response) {
    response.content_length = 0;
    response.has_content_length = false;
    // Digits only; signs, blanks and overflow leave the size unknown
    if (const auto* cl = response.header("content-length"); cl && !cl->empty() &&
        std::all_of(cl->begin(), cl->end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        std::uint64_t val = 0;
        auto [ptr, ec] = std::from_chars(cl->data(), cl->data() + cl->size(), val);
        if (ec == std::errc{} && ptr == cl->data() + cl->size()) {
            response.content_length = val;
            response.has_content_length = true;
        }
    }

    if (const auto* ct = response.header("content-type")) {
        response.content_type = *ct;
    }

    if (const auto* cd = response.header("content-disposition")) {
        response.content_disposition = *cd;
    }

    response.accepts_ranges = false;
    if (const auto* ar = response.header("accept-ranges")) {
        std::string value;
        value.reserve(ar->size());
        for (char c : *ar) {
            value += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        response.accepts_ranges = (value == "bytes");
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace splitdl::core
