// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/config.hpp>
#include <splitdl/core/logging.hpp>
#include <splitdl/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace splitdl::core {

namespace {

bool in_range(std::uint32_t value, std::uint32_t lo, std::uint32_t hi) noexcept {
    return value >= lo && value <= hi;
}

} // namespace

std::error_code EngineConfig::validate() const noexcept {
    if (!in_range(connections_per_file, MIN_CONNECTIONS, MAX_CONNECTIONS) ||
        !in_range(segment_threshold_mb, MIN_THRESHOLD_MB, MAX_THRESHOLD_MB) ||
        !in_range(timeout_seconds, MIN_TIMEOUT_SEC, MAX_TIMEOUT_SEC) ||
        !in_range(max_retries, MIN_RETRIES, MAX_RETRIES) ||
        !in_range(max_concurrent_files, MIN_CONCURRENT_FILES, MAX_CONCURRENT_FILES) ||
        !in_range(progress_interval_ms, MIN_PROGRESS_INTERVAL_MS, MAX_PROGRESS_INTERVAL_MS) ||
        retry_backoff_ms > MAX_BACKOFF_MS) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (output_directory.empty() || !parse_log_level(log_level)) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    return {};
}

void to_json(nlohmann::json& j, const EngineConfig& cfg) {
    j = nlohmann::json{
        {"connections", cfg.connections_per_file},
        {"chunk_size", cfg.segment_threshold_mb},
        {"timeout", cfg.timeout_seconds},
        {"retries", cfg.max_retries},
        {"max_concurrent", cfg.max_concurrent_files},
        {"output_dir", cfg.output_directory},
        {"retry_backoff_ms", cfg.retry_backoff_ms},
        {"progress_interval_ms", cfg.progress_interval_ms},
        {"log_level", cfg.log_level},
    };
}

void from_json(const nlohmann::json& j, EngineConfig& cfg) {
    // Missing keys keep their defaults
    cfg.connections_per_file = j.value("connections", cfg.connections_per_file);
    cfg.segment_threshold_mb = j.value("chunk_size", cfg.segment_threshold_mb);
    cfg.timeout_seconds = j.value("timeout", cfg.timeout_seconds);
    cfg.max_retries = j.value("retries", cfg.max_retries);
    cfg.max_concurrent_files = j.value("max_concurrent", cfg.max_concurrent_files);
    cfg.output_directory = j.value("output_dir", cfg.output_directory);
    cfg.retry_backoff_ms = j.value("retry_backoff_ms", cfg.retry_backoff_ms);
    cfg.progress_interval_ms = j.value("progress_interval_ms", cfg.progress_interval_ms);
    cfg.log_level = j.value("log_level", cfg.log_level);
}

std::expected<EngineConfig, std::error_code> parse_config(std::string_view text) noexcept {
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        EngineConfig cfg = j.get<EngineConfig>();
        if (auto ec = cfg.validate()) {
            return std::unexpected(ec);
        }
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Rejected configuration: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::expected<EngineConfig, std::error_code> load_config(const std::string& path) noexcept {
    try {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return parse_config(ss.str());
    } catch (const std::exception& e) {
        spdlog::warn("Cannot read configuration {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace splitdl::core
