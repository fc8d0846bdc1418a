#include "agentsync/agent_state.hpp"
#include "agentsync/exceptions.hpp"

#include <algorithm>

namespace agentsync {

AgentState::AgentState(AgentId id, std::string name, std::string agent_type)
    : id_(std::move(id))
    , name_(std::move(name))
    , agent_type_(std::move(agent_type))
    , created_at_(Clock::now())
    , last_updated_(created_at_)
    , last_heartbeat_(created_at_) {}

void AgentState::touch() {
    last_updated_ = Clock::now();
}

// ==================== Identity ====================

const AgentId& AgentState::id() const noexcept { return id_; }
const std::string& AgentState::name() const noexcept { return name_; }
const std::string& AgentState::agent_type() const noexcept { return agent_type_; }

const std::string& AgentState::version() const noexcept { return version_; }

void AgentState::set_version(std::string version) {
    version_ = std::move(version);
    touch();
}

// ==================== Health & Status ====================

AgentHealth AgentState::health() const noexcept { return health_; }

void AgentState::update_health(AgentHealth health) {
    health_ = health;
    touch();
}

AgentStatus AgentState::status() const noexcept { return status_; }

void AgentState::update_status(AgentStatus status) {
    status_ = status;
    touch();
}

Priority AgentState::priority() const noexcept { return priority_; }

void AgentState::set_priority(Priority p) {
    priority_ = p;
    touch();
}

const std::optional<std::string>& AgentState::endpoint() const noexcept { return endpoint_; }

void AgentState::set_endpoint(std::optional<std::string> endpoint) {
    endpoint_ = std::move(endpoint);
    touch();
}

// ==================== Capabilities ====================

const std::vector<std::string>& AgentState::capabilities() const noexcept {
    return capabilities_;
}

void AgentState::add_capability(const std::string& capability) {
    if (has_capability(capability)) return;
    capabilities_.push_back(capability);
    touch();
}

void AgentState::remove_capability(const std::string& capability) {
    capabilities_.erase(
        std::remove(capabilities_.begin(), capabilities_.end(), capability),
        capabilities_.end());
    touch();
}

bool AgentState::has_capability(const std::string& capability) const {
    return std::find(capabilities_.begin(), capabilities_.end(), capability)
           != capabilities_.end();
}

// ==================== Work ====================

const std::optional<TaskId>& AgentState::current_task() const noexcept {
    return current_task_;
}

void AgentState::set_current_task(std::optional<TaskId> task) {
    current_task_ = std::move(task);
    touch();
}

const AgentMetrics& AgentState::metrics() const noexcept { return metrics_; }

void AgentState::update_metrics(AgentMetrics metrics) {
    metrics_ = std::move(metrics);
    touch();
}

void AgentState::record_task_start() {
    metrics_.start_task();
    touch();
}

void AgentState::record_task_completion(std::uint64_t duration_ms) {
    metrics_.record_task_completion(duration_ms);
    touch();
}

void AgentState::record_task_failure() {
    metrics_.record_task_failure();
    touch();
}

// ==================== Metadata ====================

const std::unordered_map<std::string, Json>& AgentState::metadata() const noexcept {
    return metadata_;
}

void AgentState::add_metadata(const std::string& key, Json value) {
    metadata_[key] = std::move(value);
    touch();
}

std::optional<Json> AgentState::get_metadata(const std::string& key) const {
    auto it = metadata_.find(key);
    if (it == metadata_.end()) return std::nullopt;
    return it->second;
}

// ==================== Timing ====================

Timestamp AgentState::created_at() const noexcept { return created_at_; }
Timestamp AgentState::last_updated() const noexcept { return last_updated_; }

const std::optional<Timestamp>& AgentState::last_heartbeat() const noexcept {
    return last_heartbeat_;
}

void AgentState::update_heartbeat() {
    last_heartbeat_ = Clock::now();
    last_updated_ = *last_heartbeat_;
}

bool AgentState::is_stale(Duration timeout) const {
    if (!last_heartbeat_) return true;
    return Clock::now() - *last_heartbeat_ > timeout;
}

Duration AgentState::age() const {
    return std::max(Duration::zero(), Clock::now() - created_at_);
}

std::optional<Duration> AgentState::time_since_heartbeat() const {
    if (!last_heartbeat_) return std::nullopt;
    return std::max(Duration::zero(), Clock::now() - *last_heartbeat_);
}

// ==================== Queries ====================

bool AgentState::is_healthy() const noexcept {
    return agentsync::is_healthy(health_);
}

bool AgentState::is_available() const noexcept {
    return agentsync::is_available(health_) && can_accept_tasks(status_);
}

bool AgentState::is_operational() const noexcept {
    return agentsync::is_healthy(health_) && agentsync::is_operational(status_);
}

void AgentState::validate() const {
    if (id_.empty()) {
        throw ValidationFailedException("Agent ID cannot be empty");
    }
    if (name_.empty()) {
        throw ValidationFailedException("Agent name cannot be empty");
    }
    if (agent_type_.empty()) {
        throw ValidationFailedException("Agent type cannot be empty");
    }
    if (version_.empty()) {
        throw ValidationFailedException("Agent version cannot be empty");
    }
}

double AgentState::score() const noexcept {
    double health = static_cast<double>(health_score(health_));
    double priority = static_cast<double>(priority_);
    double load = 100.0 / (static_cast<double>(metrics_.tasks_running()) + 1.0);
    return health * 0.4 + priority * 0.3 + load * 0.3;
}

// ==================== Serialization ====================

void to_json(Json& j, const AgentState& s) {
    j = Json{
        {"id", s.id_},
        {"name", s.name_},
        {"agent_type", s.agent_type_},
        {"version", s.version_},
        {"capabilities", s.capabilities_},
        {"health", to_string(s.health_)},
        {"status", to_string(s.status_)},
        {"priority", s.priority_},
        {"metrics", s.metrics_},
        {"metadata", s.metadata_},
        {"created_at", to_unix_ms(s.created_at_)},
        {"last_updated", to_unix_ms(s.last_updated_)},
    };
    j["current_task"] = s.current_task_ ? Json(s.current_task_->str()) : Json(nullptr);
    j["endpoint"] = s.endpoint_ ? Json(*s.endpoint_) : Json(nullptr);
    j["last_heartbeat"] = s.last_heartbeat_ ? Json(to_unix_ms(*s.last_heartbeat_)) : Json(nullptr);
}

namespace {

const Json& require(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw ValidationFailedException(std::string("missing field '") + key + "'");
    }
    return *it;
}

} // anonymous namespace

AgentState agent_state_from_json(const Json& j) {
    if (!j.is_object()) {
        throw ValidationFailedException("agent snapshot must be a JSON object");
    }

    try {
        AgentState s(AgentId(require(j, "id").get<std::string>()),
                     require(j, "name").get<std::string>(),
                     require(j, "agent_type").get<std::string>());

        s.version_ = j.value("version", std::string("1.0.0"));
        if (auto it = j.find("capabilities"); it != j.end()) {
            if (!it->is_array()) {
                throw ValidationFailedException("'capabilities' must be an array");
            }
            for (const auto& cap : *it) {
                s.add_capability(cap.get<std::string>());
            }
        }
        if (auto it = j.find("health"); it != j.end()) {
            s.health_ = parse_agent_health(it->get<std::string>());
        }
        if (auto it = j.find("status"); it != j.end()) {
            s.status_ = parse_agent_status(it->get<std::string>());
        }
        if (auto it = j.find("priority"); it != j.end()) {
            s.priority_ = parse_priority(*it);
        }
        if (auto it = j.find("metrics"); it != j.end()) {
            s.metrics_ = it->get<AgentMetrics>();
        }
        if (auto it = j.find("metadata"); it != j.end()) {
            s.metadata_ = it->get<std::unordered_map<std::string, Json>>();
        }
        if (auto it = j.find("current_task"); it != j.end() && !it->is_null()) {
            s.current_task_ = TaskId(it->get<std::string>());
        }
        if (auto it = j.find("endpoint"); it != j.end() && !it->is_null()) {
            s.endpoint_ = it->get<std::string>();
        }
        if (auto it = j.find("created_at"); it != j.end()) {
            s.created_at_ = from_unix_ms(it->get<std::int64_t>());
        }
        if (auto it = j.find("last_heartbeat"); it != j.end()) {
            if (it->is_null()) {
                s.last_heartbeat_.reset();
            } else {
                s.last_heartbeat_ = from_unix_ms(it->get<std::int64_t>());
            }
        }
        if (auto it = j.find("last_updated"); it != j.end()) {
            s.last_updated_ = from_unix_ms(it->get<std::int64_t>());
        }
        s.validate();
        return s;
    } catch (const Json::exception& e) {
        throw ValidationFailedException(std::string("malformed agent snapshot: ") + e.what());
    }
}

} // namespace agentsync
