#pragma once

#include "agentsync/types.hpp"
#include "agentsync/identifiers.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentsync {

// A detected divergence between two observations of the same state.
// Snapshots and metadata are fixed at construction.
class Conflict {
public:
    Conflict(ConflictType type,
             ConflictSeverity severity,
             std::string description,
             Json local_state,
             Json remote_state,
             std::unordered_map<std::string, Json> metadata = {});

    // Same, with a caller-supplied id (e.g. replayed from a replica)
    Conflict(ConflictId id,
             ConflictType type,
             ConflictSeverity severity,
             std::string description,
             Json local_state,
             Json remote_state,
             std::unordered_map<std::string, Json> metadata = {});

    const ConflictId& id() const noexcept { return id_; }
    const ConflictType& type() const noexcept { return type_; }
    ConflictSeverity severity() const noexcept { return severity_; }
    const std::string& description() const noexcept { return description_; }
    const Json& local_state() const noexcept { return local_state_; }
    const Json& remote_state() const noexcept { return remote_state_; }
    Timestamp created_at() const noexcept { return created_at_; }
    const std::unordered_map<std::string, Json>& metadata() const noexcept { return metadata_; }

    bool is_resolved() const noexcept { return resolved_at_.has_value(); }
    const std::optional<Timestamp>& resolved_at() const noexcept { return resolved_at_; }
    const std::optional<ConflictStrategy>& resolution_strategy() const noexcept {
        return resolution_strategy_;
    }
    const std::optional<Json>& resolution_result() const noexcept { return resolution_result_; }

    Duration age() const;

    // Finalized copy carrying the resolution outcome
    Conflict resolved(const ConflictStrategy& strategy, Json result, Timestamp when) const;

private:
    ConflictId id_;
    ConflictType type_;
    ConflictSeverity severity_;
    std::string description_;
    Json local_state_;
    Json remote_state_;
    Timestamp created_at_;
    std::unordered_map<std::string, Json> metadata_;

    std::optional<Timestamp> resolved_at_;
    std::optional<ConflictStrategy> resolution_strategy_;
    std::optional<Json> resolution_result_;
};

struct ResolutionResult {
    bool success{false};
    ConflictStrategy strategy;
    Json resolved_state;
    std::string message;
    Timestamp timestamp{};
    std::unordered_map<std::string, Json> metadata;

    static ResolutionResult make_success(ConflictStrategy strategy, Json state,
                                         std::string message);

    // resolved_state is null
    static ResolutionResult make_failure(ConflictStrategy strategy, std::string message);
};

// One resolution attempt, appended to the resolver history
struct ConflictRecord {
    ConflictId conflict_id;
    ConflictType conflict_type;
    ConflictStrategy strategy;
    bool success{false};
    std::uint64_t resolution_time_ms{0};
    Timestamp timestamp{};

    // Empty on success
    std::string error;
};

struct ConflictStatistics {
    std::uint64_t total_conflicts{0};
    std::uint64_t total_resolved{0};
    std::uint64_t total_failed{0};

    // total_resolved / total_conflicts * 100
    double success_rate{0.0};

    // Mean over successful resolutions
    double avg_resolution_time_ms{0.0};

    // Detected conflicts per type key
    std::unordered_map<std::string, std::uint64_t> conflicts_by_type;

    // Resolution attempts per strategy key
    std::unordered_map<std::string, std::uint64_t> conflicts_by_strategy;

    Timestamp last_updated{};
};

void to_json(Json& j, const ConflictType& t);
void to_json(Json& j, const ConflictStrategy& s);
void to_json(Json& j, const Conflict& c);
void to_json(Json& j, const ResolutionResult& r);
void to_json(Json& j, const ConflictRecord& r);
void to_json(Json& j, const ConflictStatistics& s);

} // namespace agentsync
