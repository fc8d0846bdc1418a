#pragma once

#include "agentsync/types.hpp"
#include "agentsync/identifiers.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentsync {

struct LifecycleTransition {
    LifecycleState from;
    LifecycleState to;
    Timestamp timestamp;
    std::string reason;
    std::unordered_map<std::string, Json> metadata;
};

enum class LifecycleEventKind {
    Created,
    Initialized,
    Started,
    Stopped,
    Restarted,
    Error,
    Destroyed,
    Custom
};

const char* to_string(LifecycleEventKind k);

struct LifecycleEvent {
    LifecycleEventKind kind;
    AgentId agent_id;
    Timestamp timestamp;

    // Error only
    std::string error;

    // Custom only, e.g. "transition_to_starting" with {"from": ..., "to": ...}
    std::string event_type;
    Json data;
};

struct LifecycleStats {
    LifecycleState current_state{LifecycleState::Creating};
    std::size_t total_transitions{0};
    std::size_t total_events{0};

    // Seconds since the last transition (0 if none yet)
    std::uint64_t current_state_duration{0};

    // Transitions into each state
    std::unordered_map<LifecycleState, std::size_t> state_counts;

    Timestamp last_update{};
};

// "State: Ready | Transitions: 2 | Events: 2 | Duration: 0s"
std::string to_string(const LifecycleStats& stats);

// Allow-listed transition table (self-transitions are always allowed)
bool is_valid_transition(LifecycleState from, LifecycleState to) noexcept;

// Per-agent lifecycle state machine. Not internally synchronized: the owner
// serializes calls.
class AgentLifecycle {
public:
    using StateChangeCallback = std::function<void(const AgentId&, const LifecycleState&)>;

    explicit AgentLifecycle(AgentId agent_id);

    const AgentId& agent_id() const noexcept;
    LifecycleState current_state() const noexcept;

    bool is_in_state(LifecycleState state) const noexcept;
    bool is_running() const noexcept;
    bool is_stopped() const noexcept;
    bool is_error() const noexcept;

    // Throws InvalidTransitionException (no mutation) if the pair is not
    // allow-listed, LifecycleException if called from one of this machine's
    // own callbacks.
    void transition_to(LifecycleState new_state,
                       std::optional<std::string> reason = std::nullopt,
                       std::unordered_map<std::string, Json> metadata = {});

    // Callbacks fire synchronously after every transition into `state`
    void add_state_change_callback(LifecycleState state, StateChangeCallback callback);

    const std::vector<LifecycleTransition>& get_transitions() const noexcept;
    const std::vector<LifecycleEvent>& get_events() const noexcept;

    // Newest first
    std::vector<LifecycleEvent> get_recent_events(std::size_t limit) const;
    std::vector<LifecycleEvent> get_events_for_agent(const AgentId& agent_id) const;

    // Drops events with timestamp < older_than
    void clear_old_events(Timestamp older_than);

    Duration time_in_current_state() const;

    LifecycleStats get_lifecycle_stats() const;

private:
    AgentId agent_id_;
    LifecycleState state_{LifecycleState::Creating};
    Timestamp created_at_;
    std::vector<LifecycleTransition> transitions_;
    std::vector<LifecycleEvent> events_;
    std::unordered_map<LifecycleState, std::vector<StateChangeCallback>> callbacks_;
    bool notifying_{false};

    LifecycleEvent make_event(LifecycleState from, LifecycleState to,
                              Timestamp when) const;
    void notify_callbacks(LifecycleState state);
};

} // namespace agentsync
