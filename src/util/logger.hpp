#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace sandpool::util {

// Install the colored stdout logger as spdlog's default
void init_logger();

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "off" (unknown -> info)
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace sandpool::util
