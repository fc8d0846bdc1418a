#include "agentsync/agent_metrics.hpp"

namespace agentsync {

AgentMetrics::AgentMetrics() : last_updated_(Clock::now()) {}

void AgentMetrics::start_task() {
    tasks_running_++;
    last_updated_ = Clock::now();
}

void AgentMetrics::record_task_completion(std::uint64_t duration_ms) {
    tasks_completed_++;
    if (tasks_running_ > 0) {
        tasks_running_--;
    }

    auto n = static_cast<double>(tasks_completed_);
    avg_task_time_ms_ = (avg_task_time_ms_ * (n - 1.0) + static_cast<double>(duration_ms)) / n;
    last_updated_ = Clock::now();
}

void AgentMetrics::record_task_failure() {
    tasks_failed_++;
    if (tasks_running_ > 0) {
        tasks_running_--;
    }
    last_updated_ = Clock::now();
}

void AgentMetrics::update_cpu_usage(double percent) {
    cpu_usage_ = percent;
    last_updated_ = Clock::now();
}

void AgentMetrics::update_memory_usage(std::uint64_t used_bytes, std::uint64_t total_bytes) {
    memory_usage_ = used_bytes;
    memory_usage_percent_ = total_bytes > 0
        ? static_cast<double>(used_bytes) / static_cast<double>(total_bytes) * 100.0
        : 0.0;
    last_updated_ = Clock::now();
}

void AgentMetrics::update_uptime(std::uint64_t seconds) {
    uptime_ = seconds;
    last_updated_ = Clock::now();
}

void AgentMetrics::add_custom_metric(const std::string& key, double value) {
    custom_metrics_[key] = value;
    last_updated_ = Clock::now();
}

double AgentMetrics::success_rate() const noexcept {
    auto total = tasks_completed_ + tasks_failed_;
    if (total == 0) return 0.0;
    return static_cast<double>(tasks_completed_) / static_cast<double>(total) * 100.0;
}

double AgentMetrics::throughput() const noexcept {
    if (uptime_ == 0) return 0.0;
    return static_cast<double>(tasks_completed_) / (static_cast<double>(uptime_) / 3600.0);
}

void to_json(Json& j, const AgentMetrics& m) {
    j = Json{
        {"cpu_usage", m.cpu_usage_},
        {"memory_usage", m.memory_usage_},
        {"memory_usage_percent", m.memory_usage_percent_},
        {"tasks_completed", m.tasks_completed_},
        {"tasks_failed", m.tasks_failed_},
        {"tasks_running", m.tasks_running_},
        {"avg_task_time_ms", m.avg_task_time_ms_},
        {"uptime", m.uptime_},
        {"custom_metrics", m.custom_metrics_},
        {"last_updated", to_unix_ms(m.last_updated_)},
    };
}

void from_json(const Json& j, AgentMetrics& m) {
    m = AgentMetrics{};
    m.cpu_usage_ = j.value("cpu_usage", 0.0);
    m.memory_usage_ = j.value("memory_usage", std::uint64_t{0});
    m.memory_usage_percent_ = j.value("memory_usage_percent", 0.0);
    m.tasks_completed_ = j.value("tasks_completed", std::uint64_t{0});
    m.tasks_failed_ = j.value("tasks_failed", std::uint64_t{0});
    m.tasks_running_ = j.value("tasks_running", std::uint64_t{0});
    m.avg_task_time_ms_ = j.value("avg_task_time_ms", 0.0);
    m.uptime_ = j.value("uptime", std::uint64_t{0});
    if (auto it = j.find("custom_metrics"); it != j.end()) {
        m.custom_metrics_ = it->get<std::unordered_map<std::string, double>>();
    }
    if (auto it = j.find("last_updated"); it != j.end()) {
        m.last_updated_ = from_unix_ms(it->get<std::int64_t>());
    }
}

} // namespace agentsync
