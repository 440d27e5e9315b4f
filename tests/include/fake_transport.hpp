// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <splitdl/core/http_session.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stop_token>
#include <string_view>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

namespace splitdl::test {

// Deterministic body of `size` bytes
inline std::string make_body(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>('a' + (i * 7 + i / 251) % 26);
    }
    return body;
}

struct FakeResource {
    std::string body;
    bool send_content_length{true};
    bool accept_ranges{true};
    std::string disposition;
    bool head_fails{false};

    // Status for the n-th GET; later calls fall back to 206/200
    std::vector<std::int32_t> get_statuses;
    std::int32_t always_status{0};   // Non-zero: every GET answers with this status
    bool ignore_range{false};        // Answer ranged GETs with 200 and the full body
    std::uint32_t short_replies{0};  // First n GETs deliver only half of what was asked

    std::chrono::milliseconds piece_delay{0};
};

// In-memory HttpTransport
class FakeTransport final : public core::HttpTransport {
public:
    static constexpr std::size_t PIECE_SIZE = 16 * 1024;

    void add(const std::string& url, FakeResource resource) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = std::move(resource);
    }

    [[nodiscard]] std::expected<core::HttpResponse, std::error_code>
    head(const std::string& url) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++head_calls_[url];

        auto it = resources_.find(url);
        if (it == resources_.end()) {
            return std::unexpected(make_error_code(core::DownloadErrc::not_found));
        }
        const auto& res = it->second;
        if (res.head_fails) {
            return std::unexpected(make_error_code(core::DownloadErrc::refused));
        }

        core::HttpResponse response;
        response.status_code = 200;
        if (res.send_content_length) {
            response.headers["content-length"] = std::to_string(res.body.size());
        }
        if (res.accept_ranges) {
            response.headers["accept-ranges"] = "bytes";
        }
        if (!res.disposition.empty()) {
            response.headers["content-disposition"] = res.disposition;
        }
        core::HttpSession::apply_headers(response);
        return response;
    }

    [[nodiscard]] std::expected<core::HttpResponse, std::error_code>
    get(const std::string& url,
        std::optional<core::ByteRange> range,
        const core::DataSink& sink,
        std::stop_token stoken) noexcept override {
        FakeResource res;
        std::uint32_t call = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = resources_.find(url);
            if (it == resources_.end()) {
                core::HttpResponse response;
                response.status_code = 404;
                return response;
            }
            res = it->second;
            call = get_calls_[url]++;
            if (range) ranges_[url].push_back(*range);
        }

        ActiveGuard guard(*this, url);

        core::HttpResponse response;
        if (res.always_status != 0) {
            response.status_code = res.always_status;
        } else if (call < res.get_statuses.size()) {
            response.status_code = res.get_statuses[call];
        } else {
            response.status_code = (range && res.accept_ranges && !res.ignore_range) ? 206 : 200;
        }

        if (response.status_code < 200 || response.status_code >= 300) {
            return response;
        }

        std::string_view body(res.body);
        if (response.status_code == 206 && range) {
            const auto first = std::min<std::uint64_t>(range->first, body.size());
            const auto last = std::min<std::uint64_t>(range->last + 1, body.size());
            body = body.substr(first, last - first);
        }
        if (call < res.short_replies) {
            body = body.substr(0, body.size() / 2);
        }

        response.headers["content-length"] = std::to_string(body.size());
        core::HttpSession::apply_headers(response);

        while (!body.empty()) {
            if (stoken.stop_requested()) {
                return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
            }
            if (res.piece_delay.count() > 0) {
                std::this_thread::sleep_for(res.piece_delay);
            }
            auto piece = body.substr(0, PIECE_SIZE);
            if (!sink(response.status_code, piece)) {
                return std::unexpected(make_error_code(core::DownloadErrc::write_aborted));
            }
            body.remove_prefix(piece.size());
        }
        return response;
    }

    [[nodiscard]] std::uint32_t get_calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = get_calls_.find(url);
        return it == get_calls_.end() ? 0 : it->second;
    }

    [[nodiscard]] std::uint32_t head_calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = head_calls_.find(url);
        return it == head_calls_.end() ? 0 : it->second;
    }

    [[nodiscard]] std::vector<core::ByteRange> ranges(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = ranges_.find(url);
        return it == ranges_.end() ? std::vector<core::ByteRange>{} : it->second;
    }

    // Most distinct URLs with a GET in flight at the same moment
    [[nodiscard]] std::size_t peak_active_urls() const noexcept { return peak_urls_.load(); }

private:
    class ActiveGuard {
    public:
        ActiveGuard(FakeTransport& t, std::string url) : t_(t), url_(std::move(url)) {
            std::lock_guard<std::mutex> lock(t_.mutex_);
            if (t_.active_[url_]++ == 0) {
                const auto distinct = static_cast<std::size_t>(std::count_if(
                    t_.active_.begin(), t_.active_.end(), [](const auto& kv) { return kv.second > 0; }));
                if (distinct > t_.peak_urls_.load()) t_.peak_urls_.store(distinct);
            }
        }
        ~ActiveGuard() {
            std::lock_guard<std::mutex> lock(t_.mutex_);
            --t_.active_[url_];
        }
        ActiveGuard(const ActiveGuard&) = delete;
        ActiveGuard& operator=(const ActiveGuard&) = delete;

    private:
        FakeTransport& t_;
        std::string url_;
    };

    mutable std::mutex mutex_;
    std::map<std::string, FakeResource> resources_;
    std::map<std::string, std::uint32_t> get_calls_;
    std::map<std::string, std::uint32_t> head_calls_;
    std::map<std::string, std::vector<core::ByteRange>> ranges_;
    std::map<std::string, std::uint32_t> active_;
    std::atomic<std::size_t> peak_urls_{0};
};

// Unique scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        static std::atomic<std::uint32_t> counter{0};
        path_ = std::filesystem::temp_directory_path()
              / ("splitdl_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace splitdl::test
