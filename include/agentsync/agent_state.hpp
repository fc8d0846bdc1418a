#pragma once

#include "agentsync/types.hpp"
#include "agentsync/identifiers.hpp"
#include "agentsync/agent_metrics.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentsync {

class AgentState {
public:
    AgentState(AgentId id, std::string name, std::string agent_type);

    const AgentId& id() const noexcept;
    const std::string& name() const noexcept;
    const std::string& agent_type() const noexcept;

    const std::string& version() const noexcept;
    void set_version(std::string version);

    AgentHealth health() const noexcept;
    void update_health(AgentHealth health);

    AgentStatus status() const noexcept;
    void update_status(AgentStatus status);

    Priority priority() const noexcept;
    void set_priority(Priority p);

    const std::optional<std::string>& endpoint() const noexcept;
    void set_endpoint(std::optional<std::string> endpoint);

    // Capabilities (insertion order, no duplicates)
    const std::vector<std::string>& capabilities() const noexcept;
    void add_capability(const std::string& capability);
    void remove_capability(const std::string& capability);
    bool has_capability(const std::string& capability) const;

    // Non-owning reference to the task the agent is working on
    const std::optional<TaskId>& current_task() const noexcept;
    void set_current_task(std::optional<TaskId> task);

    const AgentMetrics& metrics() const noexcept;
    void update_metrics(AgentMetrics metrics);
    void record_task_start();
    void record_task_completion(std::uint64_t duration_ms);
    void record_task_failure();

    const std::unordered_map<std::string, Json>& metadata() const noexcept;
    void add_metadata(const std::string& key, Json value);
    std::optional<Json> get_metadata(const std::string& key) const;

    Timestamp created_at() const noexcept;
    Timestamp last_updated() const noexcept;
    const std::optional<Timestamp>& last_heartbeat() const noexcept;
    void update_heartbeat();

    bool is_healthy() const noexcept;
    bool is_available() const noexcept;
    bool is_operational() const noexcept;

    // True when no heartbeat was ever seen or the last one is older than `timeout`
    bool is_stale(Duration timeout) const;

    Duration age() const;
    std::optional<Duration> time_since_heartbeat() const;

    // Throws ValidationFailedException on empty id, name, type or version
    void validate() const;

    // Load-balancing score:
    //   0.4 * health_score + 0.3 * priority + 0.3 * (100 / (tasks_running + 1))
    double score() const noexcept;

private:
    AgentId id_;
    std::string name_;
    std::string agent_type_;
    std::string version_{"1.0.0"};
    AgentHealth health_{AgentHealth::Healthy};
    AgentStatus status_{AgentStatus::Idle};
    Priority priority_{PRIORITY_NORMAL};
    std::optional<std::string> endpoint_;
    std::vector<std::string> capabilities_;
    std::optional<TaskId> current_task_;
    AgentMetrics metrics_;
    std::unordered_map<std::string, Json> metadata_;
    Timestamp created_at_;
    Timestamp last_updated_;
    std::optional<Timestamp> last_heartbeat_;

    void touch();

    friend void to_json(Json& j, const AgentState& s);
    friend AgentState agent_state_from_json(const Json& j);
};

// Snapshot encoding; health and status are lowercase strings
// ("healthy", "shutting_down", ...)
void to_json(Json& j, const AgentState& s);

// Throws ValidationFailedException on missing or malformed fields
AgentState agent_state_from_json(const Json& j);

} // namespace agentsync
