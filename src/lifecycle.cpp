#include "agentsync/lifecycle.hpp"
#include "agentsync/exceptions.hpp"
#include "agentsync/logging.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace agentsync {

const char* to_string(LifecycleEventKind k) {
    switch (k) {
        case LifecycleEventKind::Created:     return "Created";
        case LifecycleEventKind::Initialized: return "Initialized";
        case LifecycleEventKind::Started:     return "Started";
        case LifecycleEventKind::Stopped:     return "Stopped";
        case LifecycleEventKind::Restarted:   return "Restarted";
        case LifecycleEventKind::Error:       return "Error";
        case LifecycleEventKind::Destroyed:   return "Destroyed";
        case LifecycleEventKind::Custom:      return "Custom";
    }
    return "Unknown";
}

std::string to_string(const LifecycleStats& stats) {
    std::ostringstream ss;
    ss << "State: " << to_string(stats.current_state)
       << " | Transitions: " << stats.total_transitions
       << " | Events: " << stats.total_events
       << " | Duration: " << stats.current_state_duration << "s";
    return ss.str();
}

bool is_valid_transition(LifecycleState from, LifecycleState to) noexcept {
    if (from == to) return true;

    using S = LifecycleState;
    switch (from) {
        case S::Creating:     return to == S::Initializing;
        case S::Initializing: return to == S::Ready || to == S::Error;
        case S::Ready:        return to == S::Starting;
        case S::Starting:     return to == S::Running || to == S::Error;
        case S::Running:      return to == S::Stopping || to == S::Error;
        case S::Stopping:     return to == S::Stopped;
        case S::Stopped:      return to == S::Starting || to == S::Destroying;
        case S::Error:        return to == S::Starting || to == S::Destroying;
        case S::Destroying:   return to == S::Destroyed;
        case S::Restarting:
        case S::Destroyed:
            return false;
    }
    return false;
}

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Clears the reentrancy flag however notification ends
class NotifyingScope {
public:
    explicit NotifyingScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~NotifyingScope() { flag_ = false; }

    NotifyingScope(const NotifyingScope&) = delete;
    NotifyingScope& operator=(const NotifyingScope&) = delete;

private:
    bool& flag_;
};

} // anonymous namespace

AgentLifecycle::AgentLifecycle(AgentId agent_id)
    : agent_id_(std::move(agent_id))
    , created_at_(Clock::now()) {}

const AgentId& AgentLifecycle::agent_id() const noexcept { return agent_id_; }
LifecycleState AgentLifecycle::current_state() const noexcept { return state_; }

bool AgentLifecycle::is_in_state(LifecycleState state) const noexcept { return state_ == state; }
bool AgentLifecycle::is_running() const noexcept { return state_ == LifecycleState::Running; }
bool AgentLifecycle::is_stopped() const noexcept { return state_ == LifecycleState::Stopped; }
bool AgentLifecycle::is_error() const noexcept { return state_ == LifecycleState::Error; }

// ==================== Transitions ====================

void AgentLifecycle::transition_to(LifecycleState new_state,
                                   std::optional<std::string> reason,
                                   std::unordered_map<std::string, Json> metadata) {
    if (notifying_) {
        throw LifecycleException("Re-entrant transition to " + std::string(to_string(new_state)) +
                                 " from a state-change callback of agent " + agent_id_.str());
    }

    LifecycleState old_state = state_;
    if (!is_valid_transition(old_state, new_state)) {
        throw InvalidTransitionException(old_state, new_state);
    }

    auto now = Clock::now();
    LifecycleTransition transition{
        old_state, new_state, now,
        reason.value_or("State transition"),
        std::move(metadata)
    };
    LifecycleEvent event = make_event(old_state, new_state, now);

    // Both logs grow before the state changes so a failed allocation leaves
    // the machine untouched
    transitions_.reserve(transitions_.size() + 1);
    events_.reserve(events_.size() + 1);
    transitions_.push_back(std::move(transition));
    events_.push_back(std::move(event));
    state_ = new_state;

    log::logger()->debug("Agent {} transitioned {} -> {}",
                         agent_id_.str(), to_string(old_state), to_string(new_state));

    notify_callbacks(new_state);
}

void AgentLifecycle::add_state_change_callback(LifecycleState state,
                                               StateChangeCallback callback) {
    callbacks_[state].push_back(std::move(callback));
}

LifecycleEvent AgentLifecycle::make_event(LifecycleState from, LifecycleState to,
                                          Timestamp when) const {
    LifecycleEvent event{LifecycleEventKind::Custom, agent_id_, when, {}, {}, Json()};

    switch (to) {
        case LifecycleState::Initializing:
            event.kind = LifecycleEventKind::Created;
            break;
        case LifecycleState::Ready:
            event.kind = LifecycleEventKind::Initialized;
            break;
        case LifecycleState::Running:
            event.kind = LifecycleEventKind::Started;
            break;
        case LifecycleState::Stopped:
            event.kind = LifecycleEventKind::Stopped;
            break;
        case LifecycleState::Error:
            event.kind = LifecycleEventKind::Error;
            event.error = "State transition error";
            break;
        case LifecycleState::Destroyed:
            event.kind = LifecycleEventKind::Destroyed;
            break;
        default:
            event.event_type = "transition_to_" + lowercase(to_string(to));
            event.data = Json{{"from", to_string(from)}, {"to", to_string(to)}};
            break;
    }
    return event;
}

void AgentLifecycle::notify_callbacks(LifecycleState state) {
    auto it = callbacks_.find(state);
    if (it == callbacks_.end()) return;

    NotifyingScope scope(notifying_);
    for (auto& callback : it->second) {
        try {
            callback(agent_id_, state);
        } catch (const std::exception& e) {
            log::logger()->warn("State-change callback for agent {} ({}) threw: {}",
                                agent_id_.str(), to_string(state), e.what());
        }
    }
}

// ==================== Queries ====================

const std::vector<LifecycleTransition>& AgentLifecycle::get_transitions() const noexcept {
    return transitions_;
}

const std::vector<LifecycleEvent>& AgentLifecycle::get_events() const noexcept {
    return events_;
}

std::vector<LifecycleEvent> AgentLifecycle::get_recent_events(std::size_t limit) const {
    std::size_t n = std::min(limit, events_.size());
    return std::vector<LifecycleEvent>(events_.rbegin(), events_.rbegin() + n);
}

std::vector<LifecycleEvent> AgentLifecycle::get_events_for_agent(const AgentId& agent_id) const {
    std::vector<LifecycleEvent> result;
    for (const auto& e : events_) {
        if (e.agent_id == agent_id) {
            result.push_back(e);
        }
    }
    return result;
}

void AgentLifecycle::clear_old_events(Timestamp older_than) {
    events_.erase(
        std::remove_if(events_.begin(), events_.end(),
                       [older_than](const LifecycleEvent& e) { return e.timestamp < older_than; }),
        events_.end());
}

Duration AgentLifecycle::time_in_current_state() const {
    Timestamp since = transitions_.empty() ? created_at_ : transitions_.back().timestamp;
    return std::max(Duration::zero(), Clock::now() - since);
}

LifecycleStats AgentLifecycle::get_lifecycle_stats() const {
    LifecycleStats stats;
    stats.current_state = state_;
    stats.total_transitions = transitions_.size();
    stats.total_events = events_.size();
    if (!transitions_.empty()) {
        stats.current_state_duration = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(time_in_current_state()).count());
    }
    for (const auto& t : transitions_) {
        stats.state_counts[t.to]++;
    }
    stats.last_update = Clock::now();
    return stats;
}

} // namespace agentsync
