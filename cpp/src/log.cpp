// src/log.cpp
#include "tp/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tp {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(LOGGER_NAME))
      return existing;
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
  }();
  return instance;
}

} // namespace tp
