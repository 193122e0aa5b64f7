#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace rangedl {

// Shared "rangedl" logger writing to stderr. Level defaults to RANGEDL_LOG_LEVEL or info.
std::shared_ptr<spdlog::logger> logger();

// Unknown names fall back to info with a warning.
void setLogLevel(const std::string& level);

} // namespace rangedl
