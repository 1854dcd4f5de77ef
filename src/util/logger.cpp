#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace execore::util {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("execore");
    if (!console) {
        console = spdlog::stderr_color_mt("execore");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

bool set_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', keeping current level", name);
        return false;
    }
    spdlog::set_level(level);
    return true;
}

} // namespace execore::util
