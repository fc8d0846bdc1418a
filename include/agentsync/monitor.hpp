#pragma once

#include "agentsync/types.hpp"
#include "agentsync/identifiers.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentsync {

enum class EventType {
    AgentRegistered,
    AgentDeregistered,
    AgentHealthChanged,
    AgentStale,
    LifecycleTransitioned,
    LifecycleTransitionRejected,
    ConflictDetected,
    ConflictResolved,
    ConflictResolutionFailed,
    HandlerRegistered,
    HandlerRemoved
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<AgentId> agent_id;
    std::optional<ConflictId> conflict_id;
    std::optional<LifecycleState> lifecycle_state;
    std::optional<std::string> strategy;

    // Resolution duration in milliseconds
    std::optional<double> duration_ms;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Event counters
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t conflicts_detected{0};
        std::uint64_t conflicts_resolved{0};
        std::uint64_t resolution_failures{0};
        std::uint64_t transitions{0};
        std::uint64_t rejected_transitions{0};
        std::uint64_t stale_agents_reported{0};
        double average_resolution_ms{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;

    // Fires when resolution failures reach `threshold` (0 disables)
    void set_failure_alert_threshold(std::uint64_t threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    std::uint64_t failure_threshold_{0};
    AlertCallback failure_cb_;

    double resolution_ms_sum_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace agentsync
