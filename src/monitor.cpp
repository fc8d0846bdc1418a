#include "agentsync/monitor.hpp"

#include <iomanip>
#include <iostream>

namespace agentsync {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::AgentRegistered:             return "AgentRegistered";
        case EventType::AgentDeregistered:           return "AgentDeregistered";
        case EventType::AgentHealthChanged:          return "AgentHealthChanged";
        case EventType::AgentStale:                  return "AgentStale";
        case EventType::LifecycleTransitioned:       return "LifecycleTransitioned";
        case EventType::LifecycleTransitionRejected: return "LifecycleTransitionRejected";
        case EventType::ConflictDetected:            return "ConflictDetected";
        case EventType::ConflictResolved:            return "ConflictResolved";
        case EventType::ConflictResolutionFailed:    return "ConflictResolutionFailed";
        case EventType::HandlerRegistered:           return "HandlerRegistered";
        case EventType::HandlerRemoved:              return "HandlerRemoved";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::AgentRegistered:
        case EventType::AgentDeregistered:
        case EventType::AgentStale:
        case EventType::LifecycleTransitionRejected:
        case EventType::ConflictDetected:
        case EventType::ConflictResolved:
        case EventType::ConflictResolutionFailed:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[AgentSync] " << to_string(event.type);

    if (event.agent_id.has_value()) {
        std::cout << " agent=" << event.agent_id.value();
    }
    if (event.conflict_id.has_value()) {
        std::cout << " conflict=" << event.conflict_id.value();
    }
    if (event.lifecycle_state.has_value()) {
        std::cout << " state=" << to_string(event.lifecycle_state.value());
    }
    if (event.strategy.has_value()) {
        std::cout << " strategy=" << event.strategy.value();
    }
    if (event.duration_ms.has_value()) {
        std::cout << " took=" << std::fixed << std::setprecision(2)
                  << event.duration_ms.value() << "ms";
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback alert;
    std::uint64_t failures = 0;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        switch (event.type) {
            case EventType::ConflictDetected:
                metrics_.conflicts_detected++;
                break;
            case EventType::ConflictResolved:
                metrics_.conflicts_resolved++;
                if (event.duration_ms.has_value()) {
                    resolution_ms_sum_ += event.duration_ms.value();
                    metrics_.average_resolution_ms =
                        resolution_ms_sum_ / static_cast<double>(metrics_.conflicts_resolved);
                }
                break;
            case EventType::ConflictResolutionFailed:
                metrics_.resolution_failures++;
                if (failure_cb_ && failure_threshold_ > 0 &&
                    metrics_.resolution_failures == failure_threshold_) {
                    alert = failure_cb_;
                    failures = metrics_.resolution_failures;
                }
                break;
            case EventType::LifecycleTransitioned:
                metrics_.transitions++;
                break;
            case EventType::LifecycleTransitionRejected:
                metrics_.rejected_transitions++;
                break;
            case EventType::AgentStale:
                metrics_.stale_agents_reported++;
                break;
            default:
                break;
        }
    }

    if (alert) {
        alert("Conflict resolution failures reached " + std::to_string(failures));
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    resolution_ms_sum_ = 0.0;
}

void MetricsMonitor::set_failure_alert_threshold(std::uint64_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    failure_threshold_ = threshold;
    failure_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

} // namespace agentsync
