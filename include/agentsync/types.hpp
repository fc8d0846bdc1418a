#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentsync {

// Snapshots exchanged with replicas and handlers
using Json = nlohmann::json;

// Wall-clock time: timestamps are serialized alongside agent snapshots
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Agent priority (0-255, higher = more important)
using Priority = std::uint8_t;

constexpr Priority PRIORITY_LOW      = 0;
constexpr Priority PRIORITY_NORMAL   = 128;
constexpr Priority PRIORITY_HIGH     = 200;
constexpr Priority PRIORITY_CRITICAL = 255;

// Intrinsic wellness of an agent
enum class AgentHealth {
    Healthy,
    Degraded,
    Unhealthy,
    Offline,
    Unknown
};

// Current activity of an agent (orthogonal to health)
enum class AgentStatus {
    Idle,
    Busy,
    Maintenance,
    ShuttingDown,
    Starting,
    Error
};

// Agent lifecycle phases; Creating is initial, Destroyed is terminal
enum class LifecycleState {
    Creating,
    Initializing,
    Ready,
    Starting,
    Running,
    Stopping,
    Stopped,
    Restarting,
    Error,
    Destroying,
    Destroyed
};

enum class ConflictSeverity {
    Low,
    Medium,
    High,
    Critical
};

enum class ConflictKind {
    AgentState,
    TaskAssignment,
    Resource,
    Configuration,
    Communication,
    Custom
};

enum class StrategyKind {
    AutoMerge,
    KeepLocal,
    KeepRemote,
    Manual,
    LastWriterWins,
    Custom
};

// Conflict classification. `name` is only meaningful for ConflictKind::Custom.
struct ConflictType {
    ConflictKind kind{ConflictKind::AgentState};
    std::string name;

    static ConflictType custom(std::string type_name) {
        return ConflictType{ConflictKind::Custom, std::move(type_name)};
    }

    // Histogram key, e.g. "agent_state" or "custom_<name>"
    std::string key() const;

    friend bool operator==(const ConflictType& a, const ConflictType& b) {
        return a.kind == b.kind &&
               (a.kind != ConflictKind::Custom || a.name == b.name);
    }
    friend bool operator!=(const ConflictType& a, const ConflictType& b) {
        return !(a == b);
    }
};

// Resolution policy. `handler_name` is only meaningful for StrategyKind::Custom.
struct ConflictStrategy {
    StrategyKind kind{StrategyKind::AutoMerge};
    std::string handler_name;

    static ConflictStrategy custom(std::string handler) {
        return ConflictStrategy{StrategyKind::Custom, std::move(handler)};
    }

    // Histogram key, e.g. "keep_local" or "custom_<handler>"
    std::string key() const;

    friend bool operator==(const ConflictStrategy& a, const ConflictStrategy& b) {
        return a.kind == b.kind &&
               (a.kind != StrategyKind::Custom || a.handler_name == b.handler_name);
    }
    friend bool operator!=(const ConflictStrategy& a, const ConflictStrategy& b) {
        return !(a == b);
    }
};

// Health / status predicates

inline bool is_healthy(AgentHealth h) noexcept {
    return h == AgentHealth::Healthy || h == AgentHealth::Degraded;
}

inline bool is_available(AgentHealth h) noexcept {
    return h == AgentHealth::Healthy;
}

inline std::uint8_t health_score(AgentHealth h) noexcept {
    switch (h) {
        case AgentHealth::Healthy:   return 100;
        case AgentHealth::Degraded:  return 75;
        case AgentHealth::Unhealthy: return 25;
        case AgentHealth::Offline:   return 0;
        case AgentHealth::Unknown:   return 0;
    }
    return 0;
}

inline bool can_accept_tasks(AgentStatus s) noexcept {
    return s == AgentStatus::Idle;
}

inline bool is_operational(AgentStatus s) noexcept {
    return s == AgentStatus::Idle || s == AgentStatus::Busy;
}

// String conversions

inline const char* to_string(AgentHealth h) {
    switch (h) {
        case AgentHealth::Healthy:   return "healthy";
        case AgentHealth::Degraded:  return "degraded";
        case AgentHealth::Unhealthy: return "unhealthy";
        case AgentHealth::Offline:   return "offline";
        case AgentHealth::Unknown:   return "unknown";
    }
    return "unknown";
}

inline const char* to_string(AgentStatus s) {
    switch (s) {
        case AgentStatus::Idle:         return "idle";
        case AgentStatus::Busy:         return "busy";
        case AgentStatus::Maintenance:  return "maintenance";
        case AgentStatus::ShuttingDown: return "shutting_down";
        case AgentStatus::Starting:     return "starting";
        case AgentStatus::Error:        return "error";
    }
    return "unknown";
}

inline const char* to_string(LifecycleState s) {
    switch (s) {
        case LifecycleState::Creating:     return "Creating";
        case LifecycleState::Initializing: return "Initializing";
        case LifecycleState::Ready:        return "Ready";
        case LifecycleState::Starting:     return "Starting";
        case LifecycleState::Running:      return "Running";
        case LifecycleState::Stopping:     return "Stopping";
        case LifecycleState::Stopped:      return "Stopped";
        case LifecycleState::Restarting:   return "Restarting";
        case LifecycleState::Error:        return "Error";
        case LifecycleState::Destroying:   return "Destroying";
        case LifecycleState::Destroyed:    return "Destroyed";
    }
    return "Unknown";
}

inline const char* to_string(ConflictSeverity s) {
    switch (s) {
        case ConflictSeverity::Low:      return "Low";
        case ConflictSeverity::Medium:   return "Medium";
        case ConflictSeverity::High:     return "High";
        case ConflictSeverity::Critical: return "Critical";
    }
    return "Unknown";
}

inline const char* to_string(ConflictKind k) {
    switch (k) {
        case ConflictKind::AgentState:     return "agent_state";
        case ConflictKind::TaskAssignment: return "task_assignment";
        case ConflictKind::Resource:       return "resource";
        case ConflictKind::Configuration:  return "configuration";
        case ConflictKind::Communication:  return "communication";
        case ConflictKind::Custom:         return "custom";
    }
    return "unknown";
}

inline const char* to_string(StrategyKind k) {
    switch (k) {
        case StrategyKind::AutoMerge:      return "auto_merge";
        case StrategyKind::KeepLocal:      return "keep_local";
        case StrategyKind::KeepRemote:     return "keep_remote";
        case StrategyKind::Manual:         return "manual";
        case StrategyKind::LastWriterWins: return "last_writer_wins";
        case StrategyKind::Custom:         return "custom";
    }
    return "unknown";
}

inline std::string ConflictType::key() const {
    if (kind == ConflictKind::Custom) {
        return "custom_" + name;
    }
    return to_string(kind);
}

inline std::string ConflictStrategy::key() const {
    if (kind == StrategyKind::Custom) {
        return "custom_" + handler_name;
    }
    return to_string(kind);
}

// Parsing (throw ValidationFailedException on unknown names)
AgentHealth parse_agent_health(const std::string& s);
AgentStatus parse_agent_status(const std::string& s);

// Integer in 0..255; floats, strings and out-of-range values are rejected
Priority parse_priority(const Json& value);

// Accepts "auto_merge", "keep_local", ..., or "custom:<handler>"
ConflictStrategy parse_conflict_strategy(const std::string& s);

// Milliseconds since the Unix epoch, used in JSON snapshots
std::int64_t to_unix_ms(Timestamp t) noexcept;
Timestamp from_unix_ms(std::int64_t ms) noexcept;

} // namespace agentsync
