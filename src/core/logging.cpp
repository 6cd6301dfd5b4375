// SPDX-License-Identifier: BSD-3-Clause
#include "gridpilot/core/logging.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gridpilot::log {

namespace {

constexpr const char* kLoggerName = "gridpilot";

std::shared_ptr<spdlog::logger> createLogger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

}  // anonymous namespace

std::shared_ptr<spdlog::logger> get() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] { logger = createLogger(); });
    return logger;
}

void setLevel(spdlog::level::level_enum level) {
    get()->set_level(level);
}

spdlog::level::level_enum parseLevel(std::string_view name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    throw std::invalid_argument("Unknown log level: " + std::string(name));
}

}  // namespace gridpilot::log
