#include "agentsync/conflict.hpp"

#include <algorithm>

namespace agentsync {

Conflict::Conflict(ConflictType type,
                   ConflictSeverity severity,
                   std::string description,
                   Json local_state,
                   Json remote_state,
                   std::unordered_map<std::string, Json> metadata)
    : Conflict(ConflictId::generate(), std::move(type), severity, std::move(description),
               std::move(local_state), std::move(remote_state), std::move(metadata)) {}

Conflict::Conflict(ConflictId id,
                   ConflictType type,
                   ConflictSeverity severity,
                   std::string description,
                   Json local_state,
                   Json remote_state,
                   std::unordered_map<std::string, Json> metadata)
    : id_(std::move(id))
    , type_(std::move(type))
    , severity_(severity)
    , description_(std::move(description))
    , local_state_(std::move(local_state))
    , remote_state_(std::move(remote_state))
    , created_at_(Clock::now())
    , metadata_(std::move(metadata)) {}

Duration Conflict::age() const {
    return std::max(Duration::zero(), Clock::now() - created_at_);
}

Conflict Conflict::resolved(const ConflictStrategy& strategy, Json result, Timestamp when) const {
    Conflict copy(*this);
    copy.resolved_at_ = when;
    copy.resolution_strategy_ = strategy;
    copy.resolution_result_ = std::move(result);
    return copy;
}

ResolutionResult ResolutionResult::make_success(ConflictStrategy strategy, Json state,
                                                std::string message) {
    ResolutionResult r;
    r.success = true;
    r.strategy = std::move(strategy);
    r.resolved_state = std::move(state);
    r.message = std::move(message);
    r.timestamp = Clock::now();
    return r;
}

ResolutionResult ResolutionResult::make_failure(ConflictStrategy strategy, std::string message) {
    ResolutionResult r;
    r.success = false;
    r.strategy = std::move(strategy);
    r.resolved_state = nullptr;
    r.message = std::move(message);
    r.timestamp = Clock::now();
    return r;
}

// ==================== JSON ====================

void to_json(Json& j, const ConflictType& t) {
    j = Json{{"kind", to_string(t.kind)}};
    if (t.kind == ConflictKind::Custom) {
        j["name"] = t.name;
    }
}

void to_json(Json& j, const ConflictStrategy& s) {
    j = Json{{"kind", to_string(s.kind)}};
    if (s.kind == StrategyKind::Custom) {
        j["handler_name"] = s.handler_name;
    }
}

void to_json(Json& j, const Conflict& c) {
    j = Json{
        {"id", c.id()},
        {"type", c.type()},
        {"severity", to_string(c.severity())},
        {"description", c.description()},
        {"local_state", c.local_state()},
        {"remote_state", c.remote_state()},
        {"created_at", to_unix_ms(c.created_at())},
        {"metadata", c.metadata()},
    };
    if (c.is_resolved()) {
        j["resolved_at"] = to_unix_ms(*c.resolved_at());
        j["resolution_strategy"] = *c.resolution_strategy();
        j["resolution_result"] = *c.resolution_result();
    }
}

void to_json(Json& j, const ResolutionResult& r) {
    j = Json{
        {"success", r.success},
        {"strategy", r.strategy},
        {"resolved_state", r.resolved_state},
        {"message", r.message},
        {"timestamp", to_unix_ms(r.timestamp)},
        {"metadata", r.metadata},
    };
}

void to_json(Json& j, const ConflictRecord& r) {
    j = Json{
        {"conflict_id", r.conflict_id},
        {"conflict_type", r.conflict_type},
        {"strategy", r.strategy},
        {"success", r.success},
        {"resolution_time_ms", r.resolution_time_ms},
        {"timestamp", to_unix_ms(r.timestamp)},
    };
    if (!r.error.empty()) {
        j["error"] = r.error;
    }
}

void to_json(Json& j, const ConflictStatistics& s) {
    j = Json{
        {"total_conflicts", s.total_conflicts},
        {"total_resolved", s.total_resolved},
        {"total_failed", s.total_failed},
        {"success_rate", s.success_rate},
        {"avg_resolution_time_ms", s.avg_resolution_time_ms},
        {"conflicts_by_type", s.conflicts_by_type},
        {"conflicts_by_strategy", s.conflicts_by_strategy},
        {"last_updated", to_unix_ms(s.last_updated)},
    };
}

} // namespace agentsync
