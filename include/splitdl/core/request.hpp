// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace splitdl::core {

// One locator to fetch
struct TransferRequest {
    std::string locator;
    std::optional<std::string> filename;  // Overrides the probed name
    std::string destination{"."};
};

enum class TransferStatus : std::uint8_t {
    succeeded,
    failed,
    interrupted  // Stopped from outside
};

[[nodiscard]] const char* to_string(TransferStatus status) noexcept;

// Terminal result for one request
struct TransferOutcome {
    std::string locator;
    TransferStatus status{TransferStatus::failed};
    std::string file_path;
    std::uint64_t bytes_written{0};
    std::chrono::milliseconds elapsed{0};
    std::error_code error;
    std::string reason;

    [[nodiscard]] bool success() const noexcept { return status == TransferStatus::succeeded; }

    // Average bytes per second over the whole transfer
    [[nodiscard]] double average_speed() const noexcept {
        if (elapsed.count() <= 0) return 0.0;
        return static_cast<double>(bytes_written) * 1000.0 / static_cast<double>(elapsed.count());
    }
};

void to_json(nlohmann::json& j, const TransferOutcome& outcome);

[[nodiscard]] std::vector<TransferRequest>
make_requests(const std::vector<std::string>& locators, const std::string& destination);

// One locator per line; blank lines and '#' comments are skipped
[[nodiscard]] std::vector<std::string> parse_locator_list(std::istream& in);

[[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
read_locator_file(const std::string& path) noexcept;

} // namespace splitdl::core
