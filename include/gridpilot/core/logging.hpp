// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 GridPilot Authors
//
// Library logger. All GridPilot components log through the "gridpilot"
// spdlog logger; applications may replace its sinks or change its level.

#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace gridpilot::log {

/// The shared "gridpilot" logger (stdout colour sink), created on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

/// Set the level of the library logger.
void setLevel(spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
/// Throws std::invalid_argument for anything else.
[[nodiscard]] spdlog::level::level_enum parseLevel(std::string_view name);

}  // namespace gridpilot::log
