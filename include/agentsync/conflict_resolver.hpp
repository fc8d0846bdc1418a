#pragma once

#include "agentsync/types.hpp"
#include "agentsync/config.hpp"
#include "agentsync/conflict.hpp"
#include "agentsync/conflict_handler.hpp"
#include "agentsync/monitor.hpp"

#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentsync {

class ConflictResolver {
public:
    explicit ConflictResolver(ResolverConfig config = ResolverConfig{});
    ~ConflictResolver() = default;

    ConflictResolver(const ConflictResolver&) = delete;
    ConflictResolver& operator=(const ConflictResolver&) = delete;

    // ==================== Strategy ====================

    ConflictStrategy strategy() const;
    void set_strategy(ConflictStrategy strategy);

    // ==================== Handler Registry ====================

    // Throws HandlerAlreadyRegisteredException on a duplicate name
    void add_handler(std::shared_ptr<ConflictHandler> handler);

    // Throws HandlerNotFoundException if absent
    void remove_handler(const std::string& handler_name);

    bool has_handler(const std::string& handler_name) const;
    std::vector<std::string> handler_names() const;

    // ==================== Detection ====================

    // Returns nullopt (and changes nothing) when the snapshots are equal;
    // otherwise records and returns a new active conflict.
    std::optional<Conflict> detect_conflict(ConflictType type,
                                            Json local_state,
                                            Json remote_state);

    std::optional<Conflict> detect_conflict(ConflictType type,
                                            ConflictSeverity severity,
                                            std::string description,
                                            Json local_state,
                                            Json remote_state);

    // Inserts an externally built conflict into the active set
    void add_conflict(Conflict conflict);

    // ==================== Resolution ====================

    // Resolves with the configured strategy. Throws ConflictNotFoundException,
    // ManualResolutionRequiredException, HandlerNotFoundException or whatever
    // a custom handler throws. Only a successful result retires the conflict.
    ResolutionResult attempt_resolution(const ConflictId& conflict_id);

    // Same, with an explicit strategy (e.g. retrying a Manual conflict)
    ResolutionResult attempt_resolution(const ConflictId& conflict_id,
                                        const ConflictStrategy& strategy);

    std::future<ResolutionResult> attempt_resolution_async(ConflictId conflict_id);

    // ==================== Queries ====================

    std::vector<Conflict> get_active_conflicts() const;
    std::optional<Conflict> get_conflict(const ConflictId& conflict_id) const;
    std::size_t active_conflict_count() const;
    std::size_t resolved_conflict_count() const;

    // Retired conflicts, carrying their resolution. Bounded like the
    // history (config.max_history_size), oldest evicted first.
    std::optional<Conflict> get_resolved_conflict(const ConflictId& conflict_id) const;

    ConflictStatistics get_statistics() const;
    std::vector<ConflictRecord> get_conflict_history() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    ResolverConfig config_;

    // Each structure has its own lock; none is held across a handler call.
    mutable std::shared_mutex strategy_mutex_;

    mutable std::shared_mutex conflicts_mutex_;
    std::unordered_map<ConflictId, Conflict> conflicts_;
    std::unordered_map<ConflictId, Conflict> resolved_;
    std::deque<ConflictId> resolved_order_;

    mutable std::shared_mutex history_mutex_;
    std::deque<ConflictRecord> history_;

    mutable std::shared_mutex handlers_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ConflictHandler>> handlers_;

    mutable std::shared_mutex stats_mutex_;
    ConflictStatistics statistics_;
    double resolution_ms_sum_{0.0};

    // Per-conflict serialization of resolution attempts
    std::mutex resolution_locks_mutex_;
    std::unordered_map<ConflictId, std::shared_ptr<std::mutex>> resolution_locks_;

    std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    std::shared_ptr<std::mutex> resolution_lock_for(const ConflictId& id);
    void release_resolution_lock(const ConflictId& id);

    ResolutionResult apply_strategy(const Conflict& conflict,
                                    const ConflictStrategy& strategy) const;
    ResolutionResult resolve_auto_merge(const Conflict& conflict) const;
    ResolutionResult resolve_last_writer_wins(const Conflict& conflict) const;
    ResolutionResult resolve_custom(const Conflict& conflict,
                                    const std::string& handler_name) const;

    // Records, logs and reports an unsuccessful attempt
    void fail_attempt(const Conflict& conflict, const ConflictStrategy& strategy,
                      double duration_ms, const std::string& error);

    // All statistics mutation goes through these two
    void record_detection(const Conflict& conflict);
    void record_attempt(const Conflict& conflict, const ConflictStrategy& strategy,
                        bool success, double duration_ms, std::string error);

    void emit_event(EventType type, const std::string& message,
                    std::optional<ConflictId> conflict_id = std::nullopt,
                    std::optional<std::string> strategy = std::nullopt,
                    std::optional<double> duration_ms = std::nullopt);
};

// Union of two JSON objects, `overlay` winning on key collisions
Json merge_objects(const Json& base, const Json& overlay);

} // namespace agentsync
