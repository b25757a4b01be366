// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file logging.h
 * @brief Named spdlog loggers shared by the agentcard libraries.
 */

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace agentcard::common {

class Logging {
 public:
  /**
   * @brief Returns the logger registered under @p name, creating a stderr logger if needed.
   *
   * Newly created loggers start at the level last passed to SetLevel (warn by default).
   */
  static std::shared_ptr<spdlog::logger> Create(const std::string& name);

  /**
   * @brief Sets the level of every registered logger and of loggers created later.
   */
  static void SetLevel(spdlog::level::level_enum level);
};

} // namespace agentcard::common
