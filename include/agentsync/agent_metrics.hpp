#pragma once

#include "agentsync/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace agentsync {

// Performance counters and gauges for one agent. Owned by its AgentState.
class AgentMetrics {
public:
    AgentMetrics();

    // Counters
    std::uint64_t tasks_completed() const noexcept { return tasks_completed_; }
    std::uint64_t tasks_failed() const noexcept { return tasks_failed_; }
    std::uint64_t tasks_running() const noexcept { return tasks_running_; }
    double avg_task_time_ms() const noexcept { return avg_task_time_ms_; }

    // Gauges
    double cpu_usage() const noexcept { return cpu_usage_; }
    std::uint64_t memory_usage() const noexcept { return memory_usage_; }
    double memory_usage_percent() const noexcept { return memory_usage_percent_; }
    std::uint64_t uptime() const noexcept { return uptime_; }

    const std::unordered_map<std::string, double>& custom_metrics() const noexcept {
        return custom_metrics_;
    }
    Timestamp last_updated() const noexcept { return last_updated_; }

    void start_task();

    // Folds `duration_ms` into the running mean over completed tasks
    void record_task_completion(std::uint64_t duration_ms);
    void record_task_failure();

    void update_cpu_usage(double percent);
    void update_memory_usage(std::uint64_t used_bytes, std::uint64_t total_bytes);
    void update_uptime(std::uint64_t seconds);
    void add_custom_metric(const std::string& key, double value);

    // completed / (completed + failed) * 100
    double success_rate() const noexcept;

    // Completed tasks per hour of uptime
    double throughput() const noexcept;

private:
    double cpu_usage_{0.0};
    std::uint64_t memory_usage_{0};
    double memory_usage_percent_{0.0};
    std::uint64_t tasks_completed_{0};
    std::uint64_t tasks_failed_{0};
    std::uint64_t tasks_running_{0};
    double avg_task_time_ms_{0.0};
    std::uint64_t uptime_{0};
    Timestamp last_updated_{};
    std::unordered_map<std::string, double> custom_metrics_;

    friend void to_json(Json& j, const AgentMetrics& m);
    friend void from_json(const Json& j, AgentMetrics& m);
};

void to_json(Json& j, const AgentMetrics& m);
void from_json(const Json& j, AgentMetrics& m);

} // namespace agentsync
