#pragma once

#include "agentsync/types.hpp"
#include "agentsync/config.hpp"
#include "agentsync/identifiers.hpp"
#include "agentsync/agent_state.hpp"
#include "agentsync/lifecycle.hpp"
#include "agentsync/conflict_resolver.hpp"
#include "agentsync/monitor.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentsync {

struct CoordinatorStatistics {
    std::size_t total_agents{0};
    std::size_t healthy_agents{0};
    std::size_t available_agents{0};
    std::size_t stale_agents{0};
    std::size_t active_conflicts{0};
    Timestamp last_updated{};
};

// Fleet-level facade: one AgentState and one AgentLifecycle per agent plus a
// shared ConflictResolver. Lifecycle transitions drive the agent's status.
class Coordinator {
public:
    explicit Coordinator(Config config = Config{});
    ~Coordinator() = default;

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // ==================== Agent Registry ====================

    void register_agent(AgentState agent);
    void deregister_agent(const AgentId& id);
    std::optional<AgentState> get_agent(const AgentId& id) const;
    std::vector<AgentState> get_all_agents() const;
    std::size_t agent_count() const;

    std::vector<AgentState> get_available_agents() const;

    // Highest-scoring available agent, optionally restricted to a capability
    std::optional<AgentId> select_agent(
        const std::optional<std::string>& capability = std::nullopt) const;

    // ==================== Lifecycle ====================

    void transition_agent(const AgentId& id, LifecycleState state,
                          std::optional<std::string> reason = std::nullopt);
    LifecycleState lifecycle_state(const AgentId& id) const;
    LifecycleStats lifecycle_stats(const AgentId& id) const;
    std::vector<LifecycleEvent> lifecycle_events(const AgentId& id) const;

    // ==================== Health & Work ====================

    void update_health(const AgentId& id, AgentHealth health);
    void record_heartbeat(const AgentId& id);
    void record_task_start(const AgentId& id, std::optional<TaskId> task = std::nullopt);
    void record_task_completion(const AgentId& id, std::uint64_t duration_ms);
    void record_task_failure(const AgentId& id);

    // Heartbeat older than config.heartbeat_timeout (or none at all)
    std::vector<AgentId> find_stale_agents() const;

    // In a transitional phase for longer than its lifecycle timeout
    std::vector<AgentId> find_stuck_agents() const;

    // ==================== Reconciliation ====================

    // Compares the agent's local snapshot with `remote_snapshot`
    std::optional<Conflict> reconcile(const AgentId& id, const Json& remote_snapshot);

    // Adopts health, status, priority and capabilities from a successful
    // resolution. Returns false if the result is unsuccessful.
    bool apply_resolution(const AgentId& id, const ResolutionResult& result);

    ConflictResolver& resolver() noexcept { return resolver_; }
    const ConflictResolver& resolver() const noexcept { return resolver_; }

    // ==================== Monitoring ====================

    CoordinatorStatistics get_statistics() const;
    void set_monitor(std::shared_ptr<Monitor> monitor);

    const Config& config() const noexcept { return config_; }

private:
    struct AgentEntry {
        AgentState state;
        std::unique_ptr<AgentLifecycle> lifecycle;
    };

    Config config_;
    ConflictResolver resolver_;

    mutable std::shared_mutex state_mutex_;
    std::unordered_map<AgentId, AgentEntry> agents_;

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    AgentEntry& entry_or_throw(const AgentId& id);
    const AgentEntry& entry_or_throw(const AgentId& id) const;

    // Wires lifecycle callbacks that update the agent's status field
    void bind_status_callbacks(AgentEntry& entry);

    std::optional<Duration> timeout_for(LifecycleState state) const;

    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<LifecycleState> state = std::nullopt) const;
};

} // namespace agentsync
