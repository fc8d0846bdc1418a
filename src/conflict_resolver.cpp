#include "agentsync/conflict_resolver.hpp"
#include "agentsync/exceptions.hpp"
#include "agentsync/logging.hpp"

#include <algorithm>
#include <chrono>

namespace agentsync {

namespace {

constexpr const char* kDefaultDescription = "State conflict detected";

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

Json merge_objects(const Json& base, const Json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay;
    }
    Json merged = base;
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        merged[it.key()] = it.value();
    }
    return merged;
}

ConflictResolver::ConflictResolver(ResolverConfig config)
    : config_(std::move(config)) {
    statistics_.last_updated = Clock::now();
}

// ==================== Strategy ====================

ConflictStrategy ConflictResolver::strategy() const {
    std::shared_lock lock(strategy_mutex_);
    return config_.default_strategy;
}

void ConflictResolver::set_strategy(ConflictStrategy strategy) {
    std::unique_lock lock(strategy_mutex_);
    config_.default_strategy = std::move(strategy);
}

// ==================== Handler Registry ====================

void ConflictResolver::add_handler(std::shared_ptr<ConflictHandler> handler) {
    if (!handler) {
        throw ValidationFailedException("conflict handler cannot be null");
    }
    std::string name = handler->name();
    {
        std::unique_lock lock(handlers_mutex_);
        if (handlers_.count(name)) {
            throw HandlerAlreadyRegisteredException(name);
        }
        handlers_.emplace(name, std::move(handler));
    }
    log::logger()->info("Registered conflict handler '{}'", name);
    emit_event(EventType::HandlerRegistered, "Handler registered: " + name);
}

void ConflictResolver::remove_handler(const std::string& handler_name) {
    {
        std::unique_lock lock(handlers_mutex_);
        auto it = handlers_.find(handler_name);
        if (it == handlers_.end()) {
            throw HandlerNotFoundException(handler_name);
        }
        handlers_.erase(it);
    }
    emit_event(EventType::HandlerRemoved, "Handler removed: " + handler_name);
}

bool ConflictResolver::has_handler(const std::string& handler_name) const {
    std::shared_lock lock(handlers_mutex_);
    return handlers_.count(handler_name) > 0;
}

std::vector<std::string> ConflictResolver::handler_names() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(handlers_mutex_);
        names.reserve(handlers_.size());
        for (const auto& [name, handler] : handlers_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

// ==================== Detection ====================

std::optional<Conflict> ConflictResolver::detect_conflict(ConflictType type,
                                                          Json local_state,
                                                          Json remote_state) {
    return detect_conflict(std::move(type), ConflictSeverity::Medium, kDefaultDescription,
                           std::move(local_state), std::move(remote_state));
}

std::optional<Conflict> ConflictResolver::detect_conflict(ConflictType type,
                                                          ConflictSeverity severity,
                                                          std::string description,
                                                          Json local_state,
                                                          Json remote_state) {
    if (local_state == remote_state) {
        return std::nullopt;
    }

    Conflict conflict(std::move(type), severity, std::move(description),
                      std::move(local_state), std::move(remote_state));
    {
        std::unique_lock lock(conflicts_mutex_);
        conflicts_.insert_or_assign(conflict.id(), conflict);
    }
    record_detection(conflict);

    log::logger()->info("Detected {} conflict {} ({})",
                        conflict.type().key(), conflict.id().str(),
                        to_string(conflict.severity()));
    emit_event(EventType::ConflictDetected, conflict.description(), conflict.id());
    return conflict;
}

void ConflictResolver::add_conflict(Conflict conflict) {
    bool replaced = false;
    ConflictId id = conflict.id();
    std::string description = conflict.description();
    {
        std::unique_lock lock(conflicts_mutex_);
        replaced = conflicts_.count(id) > 0;
        conflicts_.insert_or_assign(id, conflict);
    }
    if (!replaced) {
        record_detection(conflict);
    }
    emit_event(EventType::ConflictDetected, description, id);
}

// ==================== Resolution ====================

ResolutionResult ConflictResolver::attempt_resolution(const ConflictId& conflict_id) {
    return attempt_resolution(conflict_id, strategy());
}

ResolutionResult ConflictResolver::attempt_resolution(const ConflictId& conflict_id,
                                                      const ConflictStrategy& strategy) {
    auto id_mutex = resolution_lock_for(conflict_id);
    std::lock_guard<std::mutex> serial(*id_mutex);

    std::optional<Conflict> conflict;
    {
        std::shared_lock lock(conflicts_mutex_);
        auto it = conflicts_.find(conflict_id);
        if (it != conflicts_.end()) {
            conflict = it->second;
        }
    }
    if (!conflict) {
        release_resolution_lock(conflict_id);
        throw ConflictNotFoundException(conflict_id);
    }

    auto start = std::chrono::steady_clock::now();
    ResolutionResult result;
    try {
        result = apply_strategy(*conflict, strategy);
    } catch (const std::exception& e) {
        fail_attempt(*conflict, strategy, elapsed_ms(start), e.what());
        throw;
    } catch (...) {
        fail_attempt(*conflict, strategy, elapsed_ms(start), "unknown error");
        throw;
    }
    double ms = elapsed_ms(start);

    if (!result.success) {
        fail_attempt(*conflict, strategy, ms, result.message);
        return result;
    }

    {
        std::unique_lock lock(conflicts_mutex_);
        conflicts_.erase(conflict_id);
        bool inserted = resolved_.insert_or_assign(
            conflict_id, conflict->resolved(strategy, result.resolved_state, result.timestamp)).second;
        if (inserted) {
            resolved_order_.push_back(conflict_id);
        }
        if (config_.max_history_size > 0) {
            while (resolved_order_.size() > config_.max_history_size) {
                resolved_.erase(resolved_order_.front());
                resolved_order_.pop_front();
            }
        }
    }
    record_attempt(*conflict, strategy, true, ms, {});
    release_resolution_lock(conflict_id);

    log::logger()->info("Resolved conflict {} with {} in {:.2f}ms",
                        conflict_id.str(), strategy.key(), ms);
    emit_event(EventType::ConflictResolved, result.message, conflict_id, strategy.key(), ms);
    return result;
}

void ConflictResolver::fail_attempt(const Conflict& conflict, const ConflictStrategy& strategy,
                                    double duration_ms, const std::string& error) {
    record_attempt(conflict, strategy, false, duration_ms, error);
    // The conflict stays active; only the serialization slot is dropped
    release_resolution_lock(conflict.id());
    log::logger()->warn("Resolution of conflict {} with {} failed: {}",
                        conflict.id().str(), strategy.key(), error);
    emit_event(EventType::ConflictResolutionFailed, error, conflict.id(),
               strategy.key(), duration_ms);
}

std::future<ResolutionResult> ConflictResolver::attempt_resolution_async(ConflictId conflict_id) {
    return std::async(std::launch::async, [this, id = std::move(conflict_id)] {
        return attempt_resolution(id);
    });
}

ResolutionResult ConflictResolver::apply_strategy(const Conflict& conflict,
                                                  const ConflictStrategy& strategy) const {
    switch (strategy.kind) {
        case StrategyKind::AutoMerge:
            return resolve_auto_merge(conflict);
        case StrategyKind::KeepLocal:
            return ResolutionResult::make_success(strategy, conflict.local_state(),
                                                  "Kept local state");
        case StrategyKind::KeepRemote:
            return ResolutionResult::make_success(strategy, conflict.remote_state(),
                                                  "Kept remote state");
        case StrategyKind::Manual:
            throw ManualResolutionRequiredException(conflict.id());
        case StrategyKind::LastWriterWins:
            return resolve_last_writer_wins(conflict);
        case StrategyKind::Custom:
            return resolve_custom(conflict, strategy.handler_name);
    }
    throw UnsupportedStrategyException(strategy.key());
}

ResolutionResult ConflictResolver::resolve_auto_merge(const Conflict& conflict) const {
    const ConflictStrategy strategy{StrategyKind::AutoMerge, {}};
    if (conflict.local_state().is_object() && conflict.remote_state().is_object()) {
        return ResolutionResult::make_success(
            strategy, merge_objects(conflict.local_state(), conflict.remote_state()),
            "Merged local and remote state");
    }
    return ResolutionResult::make_success(strategy, conflict.local_state(),
                                          "Kept local state (snapshots are not mergeable)");
}

// Without a logical clock this is AutoMerge for objects and remote otherwise
ResolutionResult ConflictResolver::resolve_last_writer_wins(const Conflict& conflict) const {
    const ConflictStrategy strategy{StrategyKind::LastWriterWins, {}};
    if (conflict.local_state().is_object() && conflict.remote_state().is_object()) {
        return ResolutionResult::make_success(
            strategy, merge_objects(conflict.local_state(), conflict.remote_state()),
            "Merged with remote writes taking precedence");
    }
    return ResolutionResult::make_success(strategy, conflict.remote_state(),
                                          "Remote state wins (last writer)");
}

ResolutionResult ConflictResolver::resolve_custom(const Conflict& conflict,
                                                  const std::string& handler_name) const {
    std::shared_ptr<ConflictHandler> handler;
    {
        std::shared_lock lock(handlers_mutex_);
        auto it = handlers_.find(handler_name);
        if (it == handlers_.end()) {
            throw HandlerNotFoundException(handler_name);
        }
        handler = it->second;
    }
    // The caller already owns `conflict`; no resolver lock is held here.
    return handler->resolve_conflict(conflict);
}

// ==================== Per-conflict serialization ====================

std::shared_ptr<std::mutex> ConflictResolver::resolution_lock_for(const ConflictId& id) {
    std::lock_guard<std::mutex> lock(resolution_locks_mutex_);
    auto& slot = resolution_locks_[id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void ConflictResolver::release_resolution_lock(const ConflictId& id) {
    std::lock_guard<std::mutex> lock(resolution_locks_mutex_);
    auto it = resolution_locks_.find(id);
    // Kept while other callers are still queued on it (map + current holder)
    if (it != resolution_locks_.end() && it->second.use_count() <= 2) {
        resolution_locks_.erase(it);
    }
}

// ==================== Statistics ====================

void ConflictResolver::record_detection(const Conflict& conflict) {
    std::unique_lock lock(stats_mutex_);
    statistics_.total_conflicts++;
    statistics_.conflicts_by_type[conflict.type().key()]++;
    statistics_.success_rate = static_cast<double>(statistics_.total_resolved) /
                               static_cast<double>(statistics_.total_conflicts) * 100.0;
    statistics_.last_updated = Clock::now();
}

void ConflictResolver::record_attempt(const Conflict& conflict, const ConflictStrategy& strategy,
                                      bool success, double duration_ms, std::string error) {
    ConflictRecord record;
    record.conflict_id = conflict.id();
    record.conflict_type = conflict.type();
    record.strategy = strategy;
    record.success = success;
    record.resolution_time_ms = static_cast<std::uint64_t>(std::max(0.0, duration_ms));
    record.timestamp = Clock::now();
    record.error = std::move(error);

    {
        std::unique_lock lock(history_mutex_);
        history_.push_back(std::move(record));
        if (config_.max_history_size > 0) {
            while (history_.size() > config_.max_history_size) {
                history_.pop_front();
            }
        }
    }

    std::unique_lock lock(stats_mutex_);
    statistics_.conflicts_by_strategy[strategy.key()]++;
    if (success) {
        statistics_.total_resolved++;
        resolution_ms_sum_ += duration_ms;
        statistics_.avg_resolution_time_ms =
            resolution_ms_sum_ / static_cast<double>(statistics_.total_resolved);
    } else {
        statistics_.total_failed++;
    }
    statistics_.success_rate = statistics_.total_conflicts > 0
        ? static_cast<double>(statistics_.total_resolved) /
              static_cast<double>(statistics_.total_conflicts) * 100.0
        : 0.0;
    statistics_.last_updated = Clock::now();
}

// ==================== Queries ====================

std::vector<Conflict> ConflictResolver::get_active_conflicts() const {
    std::shared_lock lock(conflicts_mutex_);
    std::vector<Conflict> result;
    result.reserve(conflicts_.size());
    for (const auto& [id, conflict] : conflicts_) {
        result.push_back(conflict);
    }
    return result;
}

std::optional<Conflict> ConflictResolver::get_conflict(const ConflictId& conflict_id) const {
    std::shared_lock lock(conflicts_mutex_);
    auto it = conflicts_.find(conflict_id);
    if (it == conflicts_.end()) return std::nullopt;
    return it->second;
}

std::size_t ConflictResolver::active_conflict_count() const {
    std::shared_lock lock(conflicts_mutex_);
    return conflicts_.size();
}

std::size_t ConflictResolver::resolved_conflict_count() const {
    std::shared_lock lock(conflicts_mutex_);
    return resolved_.size();
}

std::optional<Conflict> ConflictResolver::get_resolved_conflict(const ConflictId& conflict_id) const {
    std::shared_lock lock(conflicts_mutex_);
    auto it = resolved_.find(conflict_id);
    if (it == resolved_.end()) return std::nullopt;
    return it->second;
}

ConflictStatistics ConflictResolver::get_statistics() const {
    std::shared_lock lock(stats_mutex_);
    return statistics_;
}

std::vector<ConflictRecord> ConflictResolver::get_conflict_history() const {
    std::shared_lock lock(history_mutex_);
    return std::vector<ConflictRecord>(history_.begin(), history_.end());
}

// ==================== Monitoring ====================

void ConflictResolver::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

void ConflictResolver::emit_event(EventType type, const std::string& message,
                                  std::optional<ConflictId> conflict_id,
                                  std::optional<std::string> strategy,
                                  std::optional<double> duration_ms) {
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
    event.conflict_id = std::move(conflict_id);
    event.strategy = std::move(strategy);
    event.duration_ms = duration_ms;
    monitor->on_event(event);
}

} // namespace agentsync
