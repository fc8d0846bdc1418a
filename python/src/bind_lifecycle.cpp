#include "bind_forward.hpp"
#include <agentsync/agentsync.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agentsync;

namespace {

py::dict metadata_to_py(const std::unordered_map<std::string, Json>& metadata) {
    py::dict d;
    for (const auto& [key, value] : metadata) {
        d[py::str(key)] = json_to_py(value);
    }
    return d;
}

std::unordered_map<std::string, Json> metadata_from_py(const py::dict& d) {
    std::unordered_map<std::string, Json> metadata;
    for (auto item : d) {
        metadata.emplace(item.first.cast<std::string>(), json_from_py(item.second));
    }
    return metadata;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// bind_lifecycle  --  transitions, events, stats, AgentLifecycle
// ---------------------------------------------------------------------------
void bind_lifecycle(py::module_& m) {

    py::enum_<LifecycleEventKind>(m, "LifecycleEventKind")
        .value("Created",     LifecycleEventKind::Created)
        .value("Initialized", LifecycleEventKind::Initialized)
        .value("Started",     LifecycleEventKind::Started)
        .value("Stopped",     LifecycleEventKind::Stopped)
        .value("Restarted",   LifecycleEventKind::Restarted)
        .value("Error",       LifecycleEventKind::Error)
        .value("Destroyed",   LifecycleEventKind::Destroyed)
        .value("Custom",      LifecycleEventKind::Custom);

    py::class_<LifecycleTransition>(m, "LifecycleTransition")
        .def_readonly("from_state", &LifecycleTransition::from)
        .def_readonly("to_state",   &LifecycleTransition::to)
        .def_readonly("timestamp",  &LifecycleTransition::timestamp)
        .def_readonly("reason",     &LifecycleTransition::reason)
        .def_property_readonly("metadata", [](const LifecycleTransition& t) {
            return metadata_to_py(t.metadata);
        });

    py::class_<LifecycleEvent>(m, "LifecycleEvent")
        .def_readonly("kind",       &LifecycleEvent::kind)
        .def_readonly("agent_id",   &LifecycleEvent::agent_id)
        .def_readonly("timestamp",  &LifecycleEvent::timestamp)
        .def_readonly("error",      &LifecycleEvent::error)
        .def_readonly("event_type", &LifecycleEvent::event_type)
        .def_property_readonly("data", [](const LifecycleEvent& e) { return json_to_py(e.data); });

    py::class_<LifecycleStats>(m, "LifecycleStats")
        .def_readonly("current_state",          &LifecycleStats::current_state)
        .def_readonly("total_transitions",      &LifecycleStats::total_transitions)
        .def_readonly("total_events",           &LifecycleStats::total_events)
        .def_readonly("current_state_duration", &LifecycleStats::current_state_duration)
        .def_readonly("state_counts",           &LifecycleStats::state_counts)
        .def_readonly("last_update",            &LifecycleStats::last_update)
        .def("__str__", [](const LifecycleStats& s) { return to_string(s); });

    m.def("is_valid_transition", &is_valid_transition, py::arg("from_state"), py::arg("to_state"));

    // ===================================================================
    // AgentLifecycle
    // ===================================================================
    py::class_<AgentLifecycle>(m, "AgentLifecycle")
        .def(py::init<AgentId>(), py::arg("agent_id"))
        .def("agent_id",      &AgentLifecycle::agent_id)
        .def("current_state", &AgentLifecycle::current_state)
        .def("is_in_state",   &AgentLifecycle::is_in_state, py::arg("state"))
        .def("is_running",    &AgentLifecycle::is_running)
        .def("is_stopped",    &AgentLifecycle::is_stopped)
        .def("is_error",      &AgentLifecycle::is_error)
        .def("transition_to",
            [](AgentLifecycle& self, LifecycleState state,
               std::optional<std::string> reason, const py::dict& metadata) {
                self.transition_to(state, std::move(reason), metadata_from_py(metadata));
            },
            py::arg("state"), py::arg("reason") = std::nullopt,
            py::arg("metadata") = py::dict())
        .def("add_state_change_callback",
            [](AgentLifecycle& self, LifecycleState state, py::function cb) {
                AgentLifecycle::StateChangeCallback cpp_cb =
                    [cb = py::object(cb)](const AgentId& id, const LifecycleState& s) {
                        py::gil_scoped_acquire acquire;
                        cb(id, s);
                    };
                self.add_state_change_callback(state, std::move(cpp_cb));
            },
            py::arg("state"), py::arg("callback"))
        .def("get_transitions",      &AgentLifecycle::get_transitions)
        .def("get_events",           &AgentLifecycle::get_events)
        .def("get_recent_events",    &AgentLifecycle::get_recent_events, py::arg("limit"))
        .def("get_events_for_agent", &AgentLifecycle::get_events_for_agent, py::arg("agent_id"))
        .def("clear_old_events",     &AgentLifecycle::clear_old_events, py::arg("older_than"))
        .def("time_in_current_state", &AgentLifecycle::time_in_current_state)
        .def("get_lifecycle_stats",  &AgentLifecycle::get_lifecycle_stats);
}
