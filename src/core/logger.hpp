#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace agora::core {

// Install the "agora" colour console logger as the spdlog default
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical", "off";
// anything else maps to info
spdlog::level::level_enum level_from_string(const std::string& name);

} // namespace agora::core
