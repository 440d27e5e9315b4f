// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string_view>

namespace splitdl::core {

// "trace", "debug", "info", "warn", "error", "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) noexcept;

// Configure the default spdlog logger; unknown names fall back to info
void init_logging(std::string_view level) noexcept;

} // namespace splitdl::core
