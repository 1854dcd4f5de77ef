#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace execore::util {

// Install the colored console logger as spdlog's default logger
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "critical", "off")
bool set_log_level(const std::string& name);

} // namespace execore::util
