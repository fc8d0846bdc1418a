#include "agentsync/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace agentsync::log {

namespace {

constexpr const char* kLoggerName = "agentsync";

std::mutex& init_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<spdlog::logger> create_logger(spdlog::level::level_enum level) {
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        existing->set_level(level);
        return existing;
    }
    auto created = spdlog::stdout_color_mt(kLoggerName);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(level);
    return created;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        return existing;
    }
    std::lock_guard<std::mutex> lock(init_mutex());
    return create_logger(spdlog::level::info);
}

void init_logger(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(init_mutex());
    create_logger(level);
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace agentsync::log
