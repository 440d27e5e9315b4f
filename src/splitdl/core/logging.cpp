// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/logging.hpp>
#include <spdlog/spdlog.h>

namespace splitdl::core {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return std::nullopt;
}

void init_logging(std::string_view level) noexcept {
    auto parsed = parse_log_level(level);
    spdlog::set_level(parsed.value_or(spdlog::level::info));
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace splitdl::core
