// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace splitdl::core {

constexpr std::uint64_t MIB = 1024 * 1024;

// Progress granularity inside a segment
constexpr std::size_t SUB_CHUNK_SIZE = 8 * 1024;

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::uint32_t MIN_CONNECTIONS = 1;
constexpr std::uint32_t MAX_CONNECTIONS = 32;
constexpr std::uint32_t MIN_THRESHOLD_MB = 1;
constexpr std::uint32_t MAX_THRESHOLD_MB = 10;
constexpr std::uint32_t MIN_TIMEOUT_SEC = 10;
constexpr std::uint32_t MAX_TIMEOUT_SEC = 300;
constexpr std::uint32_t MIN_RETRIES = 1;
constexpr std::uint32_t MAX_RETRIES = 10;
constexpr std::uint32_t MIN_CONCURRENT_FILES = 1;
constexpr std::uint32_t MAX_CONCURRENT_FILES = 10;
constexpr std::uint32_t MAX_BACKOFF_MS = 60'000;
constexpr std::uint32_t MIN_PROGRESS_INTERVAL_MS = 50;
constexpr std::uint32_t MAX_PROGRESS_INTERVAL_MS = 10'000;

// Resolved engine configuration supplied by the caller
struct EngineConfig {
    static constexpr std::uint32_t DEFAULT_CONNECTIONS = 8;
    static constexpr std::uint32_t DEFAULT_THRESHOLD_MB = 1;
    static constexpr std::uint32_t DEFAULT_TIMEOUT_SEC = 30;
    static constexpr std::uint32_t DEFAULT_RETRIES = 3;
    static constexpr std::uint32_t DEFAULT_CONCURRENT_FILES = 3;
    static constexpr std::uint32_t DEFAULT_BACKOFF_MS = 1000;
    static constexpr std::uint32_t DEFAULT_PROGRESS_INTERVAL_MS = 500;

    std::uint32_t connections_per_file{DEFAULT_CONNECTIONS};
    std::uint32_t segment_threshold_mb{DEFAULT_THRESHOLD_MB};  // Also the stream chunk size
    std::uint32_t timeout_seconds{DEFAULT_TIMEOUT_SEC};
    std::uint32_t max_retries{DEFAULT_RETRIES};                // Total attempts per segment
    std::uint32_t max_concurrent_files{DEFAULT_CONCURRENT_FILES};
    std::string output_directory{"."};
    std::uint32_t retry_backoff_ms{DEFAULT_BACKOFF_MS};
    std::uint32_t progress_interval_ms{DEFAULT_PROGRESS_INTERVAL_MS};
    std::string log_level{"info"};

    [[nodiscard]] std::uint64_t segment_threshold_bytes() const noexcept {
        return static_cast<std::uint64_t>(segment_threshold_mb) * MIB;
    }
    [[nodiscard]] std::size_t stream_chunk_size() const noexcept {
        return static_cast<std::size_t>(segment_threshold_bytes());
    }
    [[nodiscard]] std::chrono::milliseconds retry_backoff() const noexcept {
        return std::chrono::milliseconds{retry_backoff_ms};
    }
    [[nodiscard]] std::chrono::milliseconds progress_interval() const noexcept {
        return std::chrono::milliseconds{progress_interval_ms};
    }

    // Check every field against its allowed range
    [[nodiscard]] std::error_code validate() const noexcept;
};

void to_json(nlohmann::json& j, const EngineConfig& cfg);
void from_json(const nlohmann::json& j, EngineConfig& cfg);

// Parse and validate a JSON configuration document
[[nodiscard]] std::expected<EngineConfig, std::error_code> parse_config(std::string_view text) noexcept;

// Read a JSON configuration file (read-only)
[[nodiscard]] std::expected<EngineConfig, std::error_code> load_config(const std::string& path) noexcept;

} // namespace splitdl::core
