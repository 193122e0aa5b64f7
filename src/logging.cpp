#include "rangedl/logging.hpp"

#include <cstdlib>
#include <mutex>
#include <optional>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rangedl {

namespace {

// from_str answers "off" for names it does not know.
std::optional<spdlog::level::level_enum> parseLevel(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

void applyLevel(spdlog::logger& log, const std::string& name, const char* source) {
    if (const auto level = parseLevel(name)) {
        log.set_level(*level);
        return;
    }
    log.set_level(spdlog::level::info);
    log.warn("Unknown log level '{}' from {}, using info", name, source);
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(flag, [] {
        instance = spdlog::get("rangedl");
        if (!instance) {
            instance = spdlog::stderr_color_mt("rangedl");
        }
        instance->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
        instance->set_level(spdlog::level::info);
        if (const char* env = std::getenv("RANGEDL_LOG_LEVEL")) {
            applyLevel(*instance, env, "RANGEDL_LOG_LEVEL");
        }
    });
    return instance;
}

void setLogLevel(const std::string& level) {
    applyLevel(*logger(), level, "the command line");
}

} // namespace rangedl
