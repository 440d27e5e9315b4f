// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/http_session.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace splitdl::core {

// What a metadata-only request tells us about a resource.
// total_size == 0 means unknown: stream only.
struct ResourceMetadata {
    std::uint64_t total_size{0};
    bool supports_ranges{false};
    std::string filename;

    bool operator==(const ResourceMetadata&) const = default;
};

class MetadataProber {
public:
    explicit MetadataProber(HttpTransport& transport) noexcept : transport_(transport) {}

    // Never fails: transport errors degrade to {0, false, name-from-url}
    [[nodiscard]] ResourceMetadata probe(const std::string& locator) noexcept;

    // Error from the most recent probe, empty when it succeeded
    [[nodiscard]] const std::error_code& last_error() const noexcept { return last_error_; }

private:
    HttpTransport& transport_;
    std::error_code last_error_;
};

// Extract and percent-decode the filename from a Content-Disposition value
[[nodiscard]] std::string parse_content_disposition(std::string_view value);

// Disposition name, then last URL path segment, then a time-based name
[[nodiscard]] std::string resolve_filename(std::string_view locator, std::string_view content_disposition);

// "download_<unix seconds>"
[[nodiscard]] std::string generated_filename();

} // namespace splitdl::core
