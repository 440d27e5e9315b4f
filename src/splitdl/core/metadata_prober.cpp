// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/metadata_prober.hpp>
#include <splitdl/core/url.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <vector>

namespace splitdl::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals_prefix(std::string_view s, std::string_view prefix) noexcept {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

// Split on ';' outside double-quoted strings
std::vector<std::string_view> split_params(std::string_view value) {
    std::vector<std::string_view> params;
    bool quoted = false;
    std::size_t start = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (quoted && c == '\\') {
            ++i;  // Escaped character inside a quoted string
        } else if (c == '"') {
            quoted = !quoted;
        } else if (c == ';' && !quoted) {
            params.push_back(value.substr(start, i - start));
            start = i + 1;
        }
    }
    params.push_back(value.substr(start));
    return params;
}

// Drop any directory part a server may have put in the name
std::string sanitize(std::string name) {
    auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name.erase(0, slash + 1);
    }
    if (name == "." || name == "..") {
        name.clear();
    }
    return name;
}

} // namespace

std::string parse_content_disposition(std::string_view value) {
    std::string plain;
    std::string extended;

    // Parameters are ';'-separated: attachment; filename="a b.zip"; filename*=UTF-8''a%20b.zip
    for (auto raw : split_params(value)) {
        auto param = trim(raw);

        if (iequals_prefix(param, "filename*=")) {
            auto v = param.substr(10);
            // charset'lang'encoded-value
            auto quote = v.find('\'');
            if (quote != std::string_view::npos) {
                auto second = v.find('\'', quote + 1);
                if (second != std::string_view::npos) {
                    v = v.substr(second + 1);
                }
            }
            extended = percent_decode(v);
        } else if (iequals_prefix(param, "filename=")) {
            auto v = trim(param.substr(9));
            if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
                v = v.substr(1, v.size() - 2);
            }
            plain = percent_decode(v);
        }
    }

    return sanitize(extended.empty() ? plain : extended);
}

std::string generated_filename() {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "download_" + std::to_string(secs);
}

std::string resolve_filename(std::string_view locator, std::string_view content_disposition) {
    if (!content_disposition.empty()) {
        auto name = parse_content_disposition(content_disposition);
        if (!name.empty()) return name;
    }

    if (auto url = Url::parse(locator)) {
        auto name = sanitize(url->filename());
        if (!name.empty()) return name;
    }

    return generated_filename();
}

ResourceMetadata MetadataProber::probe(const std::string& locator) noexcept {
    ResourceMetadata meta;
    last_error_.clear();

    try {
        auto response = transport_.head(locator);
        if (!response) {
            last_error_ = response.error();
            spdlog::warn("Error getting file info for {}: {}", locator, last_error_.message());
            meta.filename = resolve_filename(locator, {});
            return meta;
        }

        meta.total_size = response->has_content_length ? response->content_length : 0;
        meta.supports_ranges = response->accepts_ranges;
        meta.filename = resolve_filename(locator, response->content_disposition);
        spdlog::debug("Probed {}: size={} ranges={} name={}", locator,
                      meta.total_size, meta.supports_ranges, meta.filename);
    } catch (const std::exception& e) {
        spdlog::warn("Probe of {} failed: {}", locator, e.what());
        last_error_ = make_error_code(DownloadErrc::network_error);
        meta = ResourceMetadata{};
        try {
            meta.filename = generated_filename();
        } catch (const std::exception&) {
            meta.filename = "download";
        }
    }
    return meta;
}

} // namespace splitdl::core
