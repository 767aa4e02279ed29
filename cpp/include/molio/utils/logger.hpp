// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <source_location>
#include <string>

namespace molio::utils {

/**
 * @brief Access point for the library-wide spdlog logger
 *
 * All molio components log through a single logger named "molio". Its level
 * is initialised from the MOLIO_LOG_LEVEL environment variable (one of
 * trace, debug, info, warn, error, critical, off; default: warn) the first
 * time the logger is requested.
 */
class Logger {
 public:
  /**
   * @brief Get the molio logger, creating it on first use
   */
  static std::shared_ptr<spdlog::logger> get();

  /**
   * @brief Change the level of the molio logger
   */
  static void set_level(spdlog::level::level_enum level);

  /**
   * @brief Change the level of the molio logger from its textual name
   * @throws std::invalid_argument if the name is not a spdlog level
   */
  static void set_level(const std::string& level_name);

  /**
   * @brief Log entry into a function at trace level
   */
  static void trace_entering(
      const std::source_location& location = std::source_location::current());
};

}  // namespace molio::utils

#define MOLIO_LOGGER() (*molio::utils::Logger::get())

#define MOLIO_LOG_TRACE_ENTERING() \
  molio::utils::Logger::trace_entering(std::source_location::current())
