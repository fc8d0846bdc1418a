#pragma once

#include "agentsync/types.hpp"
#include <cstddef>

namespace agentsync {

// Upper bounds for transitional lifecycle phases
struct LifecycleConfig {
    Duration initialization_timeout = std::chrono::seconds(30);
    Duration startup_timeout = std::chrono::seconds(60);
    Duration shutdown_timeout = std::chrono::seconds(30);
    Duration destroy_timeout = std::chrono::seconds(30);
};

struct ResolverConfig {
    // Strategy used when attempt_resolution() is called without an override
    ConflictStrategy default_strategy{StrategyKind::AutoMerge, {}};

    // Maximum retained history records (0 = unbounded, oldest dropped first)
    std::size_t max_history_size = 0;
};

struct Config {
    // Maximum number of agents the coordinator tracks
    std::size_t max_agents = 1024;

    // An agent without a heartbeat for longer than this is stale
    Duration heartbeat_timeout = std::chrono::seconds(90);

    LifecycleConfig lifecycle;

    ResolverConfig resolver;
};

// Builds a Config from a JSON object such as
//   {"max_agents": 64, "heartbeat_timeout_s": 30,
//    "resolver": {"default_strategy": "keep_local", "max_history_size": 500},
//    "lifecycle": {"startup_timeout_s": 10}}
// Missing keys keep their defaults. Throws ValidationFailedException on
// malformed values.
Config config_from_json(const Json& j);

Json config_to_json(const Config& config);

} // namespace agentsync
