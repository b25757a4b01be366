// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "agentcard/common/logging.h"

#include <atomic>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace agentcard::common {

namespace {

std::atomic<spdlog::level::level_enum> g_level{spdlog::level::warn};
std::mutex g_create_mutex;

} // namespace

std::shared_ptr<spdlog::logger> Logging::Create(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_create_mutex);

  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  auto logger = spdlog::stderr_color_mt(name);
  logger->set_level(g_level.load());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
  return logger;
}

void Logging::SetLevel(spdlog::level::level_enum level) {
  g_level.store(level);
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) { logger->set_level(level); });
}

} // namespace agentcard::common
