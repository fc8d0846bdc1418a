#include "bind_forward.hpp"
#include <agentsync/agentsync.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agentsync;

// ---------------------------------------------------------------------------
// bind_core  --  AgentMetrics, AgentState, Coordinator
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // AgentMetrics
    // ===================================================================
    py::class_<AgentMetrics>(m, "AgentMetrics")
        .def(py::init<>())
        // Counters
        .def("tasks_completed",  &AgentMetrics::tasks_completed)
        .def("tasks_failed",     &AgentMetrics::tasks_failed)
        .def("tasks_running",    &AgentMetrics::tasks_running)
        .def("avg_task_time_ms", &AgentMetrics::avg_task_time_ms)
        // Gauges
        .def("cpu_usage",            &AgentMetrics::cpu_usage)
        .def("memory_usage",         &AgentMetrics::memory_usage)
        .def("memory_usage_percent", &AgentMetrics::memory_usage_percent)
        .def("uptime",               &AgentMetrics::uptime)
        .def("custom_metrics",       &AgentMetrics::custom_metrics)
        .def("last_updated",         &AgentMetrics::last_updated)
        // Updates
        .def("start_task",             &AgentMetrics::start_task)
        .def("record_task_completion", &AgentMetrics::record_task_completion,
             py::arg("duration_ms"))
        .def("record_task_failure",    &AgentMetrics::record_task_failure)
        .def("update_cpu_usage",       &AgentMetrics::update_cpu_usage, py::arg("percent"))
        .def("update_memory_usage",    &AgentMetrics::update_memory_usage,
             py::arg("used_bytes"), py::arg("total_bytes"))
        .def("update_uptime",          &AgentMetrics::update_uptime, py::arg("seconds"))
        .def("add_custom_metric",      &AgentMetrics::add_custom_metric,
             py::arg("key"), py::arg("value"))
        // Derived
        .def("success_rate", &AgentMetrics::success_rate)
        .def("throughput",   &AgentMetrics::throughput);

    // ===================================================================
    // AgentState
    // ===================================================================
    py::class_<AgentState>(m, "AgentState")
        .def(py::init<AgentId, std::string, std::string>(),
             py::arg("id"), py::arg("name"), py::arg("agent_type"))
        // Identity
        .def("id",          &AgentState::id)
        .def("name",        &AgentState::name)
        .def("agent_type",  &AgentState::agent_type)
        .def("version",     &AgentState::version)
        .def("set_version", &AgentState::set_version, py::arg("version"))
        // Health / status
        .def("health",        &AgentState::health)
        .def("update_health", &AgentState::update_health, py::arg("health"))
        .def("status",        &AgentState::status)
        .def("update_status", &AgentState::update_status, py::arg("status"))
        .def("priority",      &AgentState::priority)
        .def("set_priority",  &AgentState::set_priority, py::arg("p"))
        .def("endpoint",      &AgentState::endpoint)
        .def("set_endpoint",  &AgentState::set_endpoint, py::arg("endpoint"))
        // Capabilities
        .def("capabilities",      &AgentState::capabilities)
        .def("add_capability",    &AgentState::add_capability, py::arg("capability"))
        .def("remove_capability", &AgentState::remove_capability, py::arg("capability"))
        .def("has_capability",    &AgentState::has_capability, py::arg("capability"))
        // Work
        .def("current_task",           &AgentState::current_task)
        .def("set_current_task",       &AgentState::set_current_task, py::arg("task"))
        .def("metrics",                &AgentState::metrics)
        .def("update_metrics",         &AgentState::update_metrics, py::arg("metrics"))
        .def("record_task_start",      &AgentState::record_task_start)
        .def("record_task_completion", &AgentState::record_task_completion,
             py::arg("duration_ms"))
        .def("record_task_failure",    &AgentState::record_task_failure)
        // Metadata
        .def("add_metadata", [](AgentState& s, const std::string& key, py::handle value) {
                 s.add_metadata(key, json_from_py(value));
             }, py::arg("key"), py::arg("value"))
        .def("get_metadata", [](const AgentState& s, const std::string& key) -> py::object {
                 auto value = s.get_metadata(key);
                 if (!value) return py::none();
                 return json_to_py(*value);
             }, py::arg("key"))
        // Time
        .def("created_at",           &AgentState::created_at)
        .def("last_updated",         &AgentState::last_updated)
        .def("last_heartbeat",       &AgentState::last_heartbeat)
        .def("update_heartbeat",     &AgentState::update_heartbeat)
        .def("is_stale",             &AgentState::is_stale, py::arg("timeout"))
        .def("age",                  &AgentState::age)
        .def("time_since_heartbeat", &AgentState::time_since_heartbeat)
        // Predicates
        .def("is_healthy",     &AgentState::is_healthy)
        .def("is_available",   &AgentState::is_available)
        .def("is_operational", &AgentState::is_operational)
        .def("validate",       &AgentState::validate)
        .def("score",          &AgentState::score)
        // Snapshots
        .def("to_json", [](const AgentState& s) { return json_to_py(Json(s)); })
        .def_static("from_json", [](py::handle obj) {
                 return agent_state_from_json(json_from_py(obj));
             }, py::arg("obj"))
        // __repr__
        .def("__repr__", [](const AgentState& s) {
            return "<AgentState id='" + s.id().str()
                 + "' health=" + to_string(s.health())
                 + " status=" + to_string(s.status()) + ">";
        });

    // ===================================================================
    // CoordinatorStatistics
    // ===================================================================
    py::class_<CoordinatorStatistics>(m, "CoordinatorStatistics")
        .def(py::init<>())
        .def_readwrite("total_agents",     &CoordinatorStatistics::total_agents)
        .def_readwrite("healthy_agents",   &CoordinatorStatistics::healthy_agents)
        .def_readwrite("available_agents", &CoordinatorStatistics::available_agents)
        .def_readwrite("stale_agents",     &CoordinatorStatistics::stale_agents)
        .def_readwrite("active_conflicts", &CoordinatorStatistics::active_conflicts)
        .def_readwrite("last_updated",     &CoordinatorStatistics::last_updated);

    // ===================================================================
    // Coordinator
    // ===================================================================
    py::class_<Coordinator>(m, "Coordinator")
        .def(py::init<Config>(), py::arg("config") = Config{})
        // Registry
        .def("register_agent",       &Coordinator::register_agent, py::arg("agent"))
        .def("deregister_agent",     &Coordinator::deregister_agent, py::arg("id"))
        .def("get_agent",            &Coordinator::get_agent, py::arg("id"))
        .def("get_all_agents",       &Coordinator::get_all_agents)
        .def("agent_count",          &Coordinator::agent_count)
        .def("get_available_agents", &Coordinator::get_available_agents)
        .def("select_agent",         &Coordinator::select_agent,
             py::arg("capability") = std::nullopt)
        // Lifecycle
        .def("transition_agent", &Coordinator::transition_agent,
             py::arg("id"), py::arg("state"), py::arg("reason") = std::nullopt)
        .def("lifecycle_state",  &Coordinator::lifecycle_state, py::arg("id"))
        .def("lifecycle_stats",  &Coordinator::lifecycle_stats, py::arg("id"))
        .def("lifecycle_events", &Coordinator::lifecycle_events, py::arg("id"))
        // Health & work
        .def("update_health",          &Coordinator::update_health,
             py::arg("id"), py::arg("health"))
        .def("record_heartbeat",       &Coordinator::record_heartbeat, py::arg("id"))
        .def("record_task_start",      &Coordinator::record_task_start,
             py::arg("id"), py::arg("task") = std::nullopt)
        .def("record_task_completion", &Coordinator::record_task_completion,
             py::arg("id"), py::arg("duration_ms"))
        .def("record_task_failure",    &Coordinator::record_task_failure, py::arg("id"))
        .def("find_stale_agents",      &Coordinator::find_stale_agents)
        .def("find_stuck_agents",      &Coordinator::find_stuck_agents)
        // Reconciliation
        .def("reconcile", [](Coordinator& c, const AgentId& id, py::handle remote) {
                 return c.reconcile(id, json_from_py(remote));
             }, py::arg("id"), py::arg("remote_snapshot"))
        .def("apply_resolution", &Coordinator::apply_resolution,
             py::arg("id"), py::arg("result"))
        .def("resolver", py::overload_cast<>(&Coordinator::resolver),
             py::return_value_policy::reference_internal)
        // Monitoring
        .def("get_statistics", &Coordinator::get_statistics)
        .def("set_monitor",    &Coordinator::set_monitor, py::arg("monitor"))
        .def("config",         &Coordinator::config);
}
