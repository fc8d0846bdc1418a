#include "agentsync/coordinator.hpp"
#include "agentsync/exceptions.hpp"
#include "agentsync/logging.hpp"

#include <algorithm>

namespace agentsync {

Coordinator::Coordinator(Config config)
    : config_(std::move(config))
    , resolver_(config_.resolver) {
    log::logger()->debug("Coordinator created (max_agents={}, default strategy={})",
                         config_.max_agents, config_.resolver.default_strategy.key());
}

Coordinator::AgentEntry& Coordinator::entry_or_throw(const AgentId& id) {
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        throw AgentNotFoundException(id);
    }
    return it->second;
}

const Coordinator::AgentEntry& Coordinator::entry_or_throw(const AgentId& id) const {
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        throw AgentNotFoundException(id);
    }
    return it->second;
}

// ==================== Agent Registry ====================

void Coordinator::register_agent(AgentState agent) {
    agent.validate();

    AgentId id = agent.id();
    std::string name = agent.name();
    {
        std::unique_lock lock(state_mutex_);
        if (agents_.count(id)) {
            throw AgentAlreadyRegisteredException(id);
        }
        if (agents_.size() >= config_.max_agents) {
            throw CapacityExceededException(config_.max_agents);
        }

        auto lifecycle = std::make_unique<AgentLifecycle>(id);
        auto it = agents_.emplace(id, AgentEntry{std::move(agent), std::move(lifecycle)}).first;
        bind_status_callbacks(it->second);
    }

    log::logger()->info("Registered agent {} ({})", id.str(), name);
    emit_event(EventType::AgentRegistered, "Agent registered: " + name, id);
}

void Coordinator::deregister_agent(const AgentId& id) {
    std::string name;
    {
        std::unique_lock lock(state_mutex_);
        auto it = agents_.find(id);
        if (it == agents_.end()) {
            throw AgentNotFoundException(id);
        }
        name = it->second.state.name();
        agents_.erase(it);
    }

    log::logger()->info("Deregistered agent {} ({})", id.str(), name);
    emit_event(EventType::AgentDeregistered, "Agent deregistered: " + name, id);
}

std::optional<AgentState> Coordinator::get_agent(const AgentId& id) const {
    std::shared_lock lock(state_mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return std::nullopt;
    return it->second.state;
}

std::vector<AgentState> Coordinator::get_all_agents() const {
    std::shared_lock lock(state_mutex_);
    std::vector<AgentState> result;
    result.reserve(agents_.size());
    for (const auto& [_, entry] : agents_) {
        result.push_back(entry.state);
    }
    return result;
}

std::size_t Coordinator::agent_count() const {
    std::shared_lock lock(state_mutex_);
    return agents_.size();
}

std::vector<AgentState> Coordinator::get_available_agents() const {
    std::vector<AgentState> result;
    {
        std::shared_lock lock(state_mutex_);
        for (const auto& [_, entry] : agents_) {
            if (entry.state.is_available()) {
                result.push_back(entry.state);
            }
        }
    }
    std::sort(result.begin(), result.end(),
              [](const AgentState& a, const AgentState& b) { return a.id() < b.id(); });
    return result;
}

std::optional<AgentId> Coordinator::select_agent(const std::optional<std::string>& capability) const {
    std::shared_lock lock(state_mutex_);

    const AgentState* best = nullptr;
    double best_score = 0.0;
    for (const auto& [_, entry] : agents_) {
        const AgentState& s = entry.state;
        if (!s.is_available()) continue;
        if (capability && !s.has_capability(*capability)) continue;

        double score = s.score();
        // Ties go to the smaller id so selection is deterministic
        if (!best || score > best_score || (score == best_score && s.id() < best->id())) {
            best = &s;
            best_score = score;
        }
    }
    if (!best) return std::nullopt;
    return best->id();
}

// ==================== Lifecycle ====================

void Coordinator::bind_status_callbacks(AgentEntry& entry) {
    AgentState* state = &entry.state;
    auto on_state = [&entry, state](LifecycleState on, AgentStatus status) {
        entry.lifecycle->add_state_change_callback(
            on, [state, status](const AgentId&, const LifecycleState&) {
                state->update_status(status);
            });
    };

    on_state(LifecycleState::Starting, AgentStatus::Starting);
    on_state(LifecycleState::Running, AgentStatus::Idle);
    on_state(LifecycleState::Stopping, AgentStatus::ShuttingDown);
    on_state(LifecycleState::Stopped, AgentStatus::Maintenance);
    on_state(LifecycleState::Error, AgentStatus::Error);
}

void Coordinator::transition_agent(const AgentId& id, LifecycleState state,
                                   std::optional<std::string> reason) {
    std::unique_lock lock(state_mutex_);
    auto& entry = entry_or_throw(id);
    LifecycleState from = entry.lifecycle->current_state();

    try {
        entry.lifecycle->transition_to(state, std::move(reason));
    } catch (const InvalidTransitionException& e) {
        lock.unlock();
        log::logger()->warn("Rejected transition for agent {}: {}", id.str(), e.what());
        emit_event(EventType::LifecycleTransitionRejected, e.what(), id, from);
        throw;
    }
    lock.unlock();

    emit_event(EventType::LifecycleTransitioned,
               std::string(to_string(from)) + " -> " + to_string(state), id, state);
}

LifecycleState Coordinator::lifecycle_state(const AgentId& id) const {
    std::shared_lock lock(state_mutex_);
    return entry_or_throw(id).lifecycle->current_state();
}

LifecycleStats Coordinator::lifecycle_stats(const AgentId& id) const {
    std::shared_lock lock(state_mutex_);
    return entry_or_throw(id).lifecycle->get_lifecycle_stats();
}

std::vector<LifecycleEvent> Coordinator::lifecycle_events(const AgentId& id) const {
    std::shared_lock lock(state_mutex_);
    return entry_or_throw(id).lifecycle->get_events();
}

std::optional<Duration> Coordinator::timeout_for(LifecycleState state) const {
    switch (state) {
        case LifecycleState::Initializing: return config_.lifecycle.initialization_timeout;
        case LifecycleState::Starting:     return config_.lifecycle.startup_timeout;
        case LifecycleState::Stopping:     return config_.lifecycle.shutdown_timeout;
        case LifecycleState::Destroying:   return config_.lifecycle.destroy_timeout;
        default:                           return std::nullopt;
    }
}

// ==================== Health & Work ====================

void Coordinator::update_health(const AgentId& id, AgentHealth health) {
    AgentHealth previous;
    {
        std::unique_lock lock(state_mutex_);
        auto& entry = entry_or_throw(id);
        previous = entry.state.health();
        entry.state.update_health(health);
    }
    if (previous != health) {
        emit_event(EventType::AgentHealthChanged,
                   std::string(to_string(previous)) + " -> " + to_string(health), id);
    }
}

void Coordinator::record_heartbeat(const AgentId& id) {
    std::unique_lock lock(state_mutex_);
    entry_or_throw(id).state.update_heartbeat();
}

void Coordinator::record_task_start(const AgentId& id, std::optional<TaskId> task) {
    std::unique_lock lock(state_mutex_);
    auto& state = entry_or_throw(id).state;
    state.record_task_start();
    if (task) {
        state.set_current_task(std::move(task));
    }
    if (state.status() == AgentStatus::Idle) {
        state.update_status(AgentStatus::Busy);
    }
}

namespace {

// Back to Idle once a busy agent has nothing left running
void settle_after_task(AgentState& state) {
    if (state.metrics().tasks_running() > 0) return;
    state.set_current_task(std::nullopt);
    if (state.status() == AgentStatus::Busy) {
        state.update_status(AgentStatus::Idle);
    }
}

} // anonymous namespace

void Coordinator::record_task_completion(const AgentId& id, std::uint64_t duration_ms) {
    std::unique_lock lock(state_mutex_);
    auto& state = entry_or_throw(id).state;
    state.record_task_completion(duration_ms);
    settle_after_task(state);
}

void Coordinator::record_task_failure(const AgentId& id) {
    std::unique_lock lock(state_mutex_);
    auto& state = entry_or_throw(id).state;
    state.record_task_failure();
    settle_after_task(state);
}

std::vector<AgentId> Coordinator::find_stale_agents() const {
    std::vector<AgentId> stale;
    {
        std::shared_lock lock(state_mutex_);
        for (const auto& [id, entry] : agents_) {
            if (entry.state.is_stale(config_.heartbeat_timeout)) {
                stale.push_back(id);
            }
        }
    }
    std::sort(stale.begin(), stale.end());

    for (const auto& id : stale) {
        emit_event(EventType::AgentStale, "No heartbeat within timeout", id);
    }
    return stale;
}

std::vector<AgentId> Coordinator::find_stuck_agents() const {
    std::vector<AgentId> stuck;
    {
        std::shared_lock lock(state_mutex_);
        for (const auto& [id, entry] : agents_) {
            auto timeout = timeout_for(entry.lifecycle->current_state());
            if (timeout && entry.lifecycle->time_in_current_state() > *timeout) {
                stuck.push_back(id);
            }
        }
    }
    std::sort(stuck.begin(), stuck.end());
    return stuck;
}

// ==================== Reconciliation ====================

std::optional<Conflict> Coordinator::reconcile(const AgentId& id, const Json& remote_snapshot) {
    Json local;
    {
        std::shared_lock lock(state_mutex_);
        local = Json(entry_or_throw(id).state);
    }
    return resolver_.detect_conflict(ConflictType{ConflictKind::AgentState, {}},
                                     ConflictSeverity::Medium,
                                     "Agent state diverged for " + id.str(),
                                     std::move(local), remote_snapshot);
}

bool Coordinator::apply_resolution(const AgentId& id, const ResolutionResult& result) {
    if (!result.success || !result.resolved_state.is_object()) {
        return false;
    }
    const Json& resolved = result.resolved_state;

    // Parse everything before touching the agent
    std::optional<AgentHealth> health;
    std::optional<AgentStatus> status;
    std::optional<Priority> priority;
    std::optional<std::vector<std::string>> capabilities;
    try {
        if (auto it = resolved.find("health"); it != resolved.end()) {
            health = parse_agent_health(it->get<std::string>());
        }
        if (auto it = resolved.find("status"); it != resolved.end()) {
            status = parse_agent_status(it->get<std::string>());
        }
        if (auto it = resolved.find("priority"); it != resolved.end()) {
            priority = parse_priority(*it);
        }
        if (auto it = resolved.find("capabilities"); it != resolved.end()) {
            capabilities = it->get<std::vector<std::string>>();
        }
    } catch (const Json::exception& e) {
        throw ValidationFailedException(std::string("malformed resolved state: ") + e.what());
    }

    AgentHealth previous;
    {
        std::unique_lock lock(state_mutex_);
        auto& state = entry_or_throw(id).state;
        previous = state.health();
        if (health) state.update_health(*health);
        if (status) state.update_status(*status);
        if (priority) state.set_priority(*priority);
        if (capabilities) {
            for (const auto& existing : std::vector<std::string>(state.capabilities())) {
                state.remove_capability(existing);
            }
            for (const auto& cap : *capabilities) {
                state.add_capability(cap);
            }
        }
    }

    if (health && *health != previous) {
        emit_event(EventType::AgentHealthChanged,
                   std::string(to_string(previous)) + " -> " + to_string(*health), id);
    }
    return true;
}

// ==================== Monitoring ====================

CoordinatorStatistics Coordinator::get_statistics() const {
    CoordinatorStatistics stats;
    {
        std::shared_lock lock(state_mutex_);
        stats.total_agents = agents_.size();
        for (const auto& [_, entry] : agents_) {
            if (entry.state.is_healthy()) stats.healthy_agents++;
            if (entry.state.is_available()) stats.available_agents++;
            if (entry.state.is_stale(config_.heartbeat_timeout)) stats.stale_agents++;
        }
    }
    stats.active_conflicts = resolver_.active_conflict_count();
    stats.last_updated = Clock::now();
    return stats;
}

void Coordinator::set_monitor(std::shared_ptr<Monitor> monitor) {
    resolver_.set_monitor(monitor);
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

void Coordinator::emit_event(EventType type, const std::string& message,
                             std::optional<AgentId> agent_id,
                             std::optional<LifecycleState> state) const {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor = monitor_;
    }
    if (!monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.agent_id = std::move(agent_id);
    event.lifecycle_state = state;
    monitor->on_event(event);
}

} // namespace agentsync
