// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <molio/utils/logger.hpp>
#include <stdexcept>

namespace molio::utils {

namespace {

constexpr const char* LOGGER_NAME = "molio";

spdlog::level::level_enum level_from_environment() {
  const char* env_value = std::getenv("MOLIO_LOG_LEVEL");
  if (!env_value) {
    return spdlog::level::warn;
  }
  auto level = spdlog::level::from_str(env_value);
  // from_str maps unknown names to off; only honour it when asked for
  if (level == spdlog::level::off && std::string(env_value) != "off") {
    return spdlog::level::warn;
  }
  return level;
}

}  // namespace

std::shared_ptr<spdlog::logger> Logger::get() {
  static std::shared_ptr<spdlog::logger> logger = []() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_level(level_from_environment());
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    return created;
  }();
  return logger;
}

void Logger::set_level(spdlog::level::level_enum level) {
  get()->set_level(level);
}

void Logger::set_level(const std::string& level_name) {
  auto level = spdlog::level::from_str(level_name);
  if (level == spdlog::level::off && level_name != "off") {
    throw std::invalid_argument("Unknown log level: " + level_name);
  }
  set_level(level);
}

void Logger::trace_entering(const std::source_location& location) {
  auto logger = get();
  if (logger->should_log(spdlog::level::trace)) {
    logger->trace("Entering {} ({}:{})", location.function_name(),
                  location.file_name(), location.line());
  }
}

}  // namespace molio::utils
