#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace agentsync::log {

// Shared "agentsync" logger. Created on first use with a colored stdout
// sink if init_logger() was not called.
std::shared_ptr<spdlog::logger> logger();

// Install the "agentsync" logger with console output
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

} // namespace agentsync::log
