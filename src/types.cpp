#include "agentsync/types.hpp"
#include "agentsync/exceptions.hpp"

#include <cstdint>
#include <string>

namespace agentsync {

AgentHealth parse_agent_health(const std::string& s) {
    if (s == "healthy")   return AgentHealth::Healthy;
    if (s == "degraded")  return AgentHealth::Degraded;
    if (s == "unhealthy") return AgentHealth::Unhealthy;
    if (s == "offline")   return AgentHealth::Offline;
    if (s == "unknown")   return AgentHealth::Unknown;
    throw ValidationFailedException("unknown agent health '" + s + "'");
}

AgentStatus parse_agent_status(const std::string& s) {
    if (s == "idle")          return AgentStatus::Idle;
    if (s == "busy")          return AgentStatus::Busy;
    if (s == "maintenance")   return AgentStatus::Maintenance;
    if (s == "shutting_down") return AgentStatus::ShuttingDown;
    if (s == "starting")      return AgentStatus::Starting;
    if (s == "error")         return AgentStatus::Error;
    throw ValidationFailedException("unknown agent status '" + s + "'");
}

ConflictStrategy parse_conflict_strategy(const std::string& s) {
    static const std::string custom_prefix = "custom:";
    if (s.compare(0, custom_prefix.size(), custom_prefix) == 0) {
        std::string handler = s.substr(custom_prefix.size());
        if (handler.empty()) {
            throw ValidationFailedException("custom strategy requires a handler name");
        }
        return ConflictStrategy::custom(std::move(handler));
    }
    if (s == "auto_merge")       return {StrategyKind::AutoMerge, {}};
    if (s == "keep_local")       return {StrategyKind::KeepLocal, {}};
    if (s == "keep_remote")      return {StrategyKind::KeepRemote, {}};
    if (s == "manual")           return {StrategyKind::Manual, {}};
    if (s == "last_writer_wins") return {StrategyKind::LastWriterWins, {}};
    throw ValidationFailedException("unknown conflict strategy '" + s + "'");
}

Priority parse_priority(const Json& value) {
    if (value.is_number_unsigned()) {
        auto p = value.get<std::uint64_t>();
        if (p <= 255) {
            return static_cast<Priority>(p);
        }
        throw ValidationFailedException("priority out of range: " + std::to_string(p));
    }
    if (value.is_number_integer()) {
        auto p = value.get<std::int64_t>();
        if (p >= 0 && p <= 255) {
            return static_cast<Priority>(p);
        }
        throw ValidationFailedException("priority out of range: " + std::to_string(p));
    }
    throw ValidationFailedException("priority must be an integer, got " + value.dump());
}

std::int64_t to_unix_ms(Timestamp t) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count();
}

Timestamp from_unix_ms(std::int64_t ms) noexcept {
    return Timestamp(std::chrono::duration_cast<Duration>(std::chrono::milliseconds(ms)));
}

} // namespace agentsync
