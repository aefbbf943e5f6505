// include/tp/log.hpp
#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace tp {

inline constexpr const char* LOGGER_NAME = "tp";

// Shared logger. Reuses one registered under LOGGER_NAME if the host
// application created it first, else makes a colored stderr logger.
std::shared_ptr<spdlog::logger> logger();

} // namespace tp
