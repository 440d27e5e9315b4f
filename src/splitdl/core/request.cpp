// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/request.hpp>
#include <splitdl/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>
#include <istream>

namespace splitdl::core {

const char* to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::succeeded:   return "succeeded";
        case TransferStatus::failed:      return "failed";
        case TransferStatus::interrupted: return "interrupted";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const TransferOutcome& outcome) {
    j = nlohmann::json{
        {"locator", outcome.locator},
        {"status", to_string(outcome.status)},
        {"success", outcome.success()},
        {"file_path", outcome.file_path},
        {"bytes_written", outcome.bytes_written},
        {"elapsed_ms", outcome.elapsed.count()},
        {"average_speed_bps", outcome.average_speed()},
    };
    if (outcome.error) {
        j["error"] = outcome.error.message();
    }
    if (!outcome.reason.empty()) {
        j["reason"] = outcome.reason;
    }
}

std::vector<TransferRequest>
make_requests(const std::vector<std::string>& locators, const std::string& destination) {
    std::vector<TransferRequest> requests;
    requests.reserve(locators.size());
    for (const auto& locator : locators) {
        requests.push_back(TransferRequest{locator, std::nullopt, destination});
    }
    return requests;
}

std::vector<std::string> parse_locator_list(std::istream& in) {
    std::vector<std::string> locators;
    std::string line;
    while (std::getline(in, line)) {
        std::size_t first = 0;
        std::size_t last = line.size();
        while (first < last && std::isspace(static_cast<unsigned char>(line[first]))) ++first;
        while (last > first && std::isspace(static_cast<unsigned char>(line[last - 1]))) --last;

        if (first == last || line[first] == '#') continue;
        locators.push_back(line.substr(first, last - first));
    }
    return locators;
}

std::expected<std::vector<std::string>, std::error_code>
read_locator_file(const std::string& path) noexcept {
    try {
        std::ifstream in(path);
        if (!in) {
            spdlog::error("File not found: {}", path);
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        auto locators = parse_locator_list(in);
        spdlog::info("Found {} URLs in {}", locators.size(), path);
        return locators;
    } catch (const std::exception& e) {
        spdlog::error("Error reading {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace splitdl::core
