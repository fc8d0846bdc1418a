#include "agentsync/config.hpp"
#include "agentsync/exceptions.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace agentsync {

namespace {

std::uint64_t read_unsigned(const Json& obj, const char* key, std::uint64_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return fallback;
    }
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
        throw ValidationFailedException(std::string("'") + key +
                                        "' must be a non-negative integer");
    }
    return it->get<std::uint64_t>();
}

Duration read_seconds(const Json& obj, const char* key, Duration fallback) {
    auto fallback_s = std::chrono::duration_cast<std::chrono::seconds>(fallback).count();
    auto secs = read_unsigned(obj, key, static_cast<std::uint64_t>(fallback_s));
    // Duration counts nanoseconds; larger values would overflow it
    constexpr auto max_s = std::chrono::duration_cast<std::chrono::seconds>(Duration::max()).count();
    if (secs > static_cast<std::uint64_t>(max_s)) {
        throw ValidationFailedException(std::string("'") + key + "' is too large: " +
                                        std::to_string(secs));
    }
    return std::chrono::seconds(static_cast<std::int64_t>(secs));
}

std::int64_t seconds_of(Duration d) {
    return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

std::string strategy_name(const ConflictStrategy& s) {
    if (s.kind == StrategyKind::Custom) {
        return "custom:" + s.handler_name;
    }
    return to_string(s.kind);
}

} // anonymous namespace

Config config_from_json(const Json& j) {
    if (!j.is_object()) {
        throw ValidationFailedException("configuration must be a JSON object");
    }

    Config config;
    config.max_agents = static_cast<std::size_t>(
        read_unsigned(j, "max_agents", config.max_agents));
    if (config.max_agents == 0) {
        throw ValidationFailedException("'max_agents' must be greater than zero");
    }
    config.heartbeat_timeout = read_seconds(j, "heartbeat_timeout_s", config.heartbeat_timeout);

    if (auto it = j.find("lifecycle"); it != j.end()) {
        if (!it->is_object()) {
            throw ValidationFailedException("'lifecycle' must be an object");
        }
        auto& lc = config.lifecycle;
        lc.initialization_timeout = read_seconds(*it, "initialization_timeout_s", lc.initialization_timeout);
        lc.startup_timeout  = read_seconds(*it, "startup_timeout_s", lc.startup_timeout);
        lc.shutdown_timeout = read_seconds(*it, "shutdown_timeout_s", lc.shutdown_timeout);
        lc.destroy_timeout  = read_seconds(*it, "destroy_timeout_s", lc.destroy_timeout);
    }

    if (auto it = j.find("resolver"); it != j.end()) {
        if (!it->is_object()) {
            throw ValidationFailedException("'resolver' must be an object");
        }
        if (auto s = it->find("default_strategy"); s != it->end()) {
            if (!s->is_string()) {
                throw ValidationFailedException("'resolver.default_strategy' must be a string");
            }
            config.resolver.default_strategy = parse_conflict_strategy(s->get<std::string>());
        }
        config.resolver.max_history_size = static_cast<std::size_t>(
            read_unsigned(*it, "max_history_size", config.resolver.max_history_size));
    }

    return config;
}

Json config_to_json(const Config& config) {
    return Json{
        {"max_agents", config.max_agents},
        {"heartbeat_timeout_s", seconds_of(config.heartbeat_timeout)},
        {"lifecycle", {
            {"initialization_timeout_s", seconds_of(config.lifecycle.initialization_timeout)},
            {"startup_timeout_s", seconds_of(config.lifecycle.startup_timeout)},
            {"shutdown_timeout_s", seconds_of(config.lifecycle.shutdown_timeout)},
            {"destroy_timeout_s", seconds_of(config.lifecycle.destroy_timeout)},
        }},
        {"resolver", {
            {"default_strategy", strategy_name(config.resolver.default_strategy)},
            {"max_history_size", config.resolver.max_history_size},
        }},
    };
}

} // namespace agentsync
