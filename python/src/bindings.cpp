#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <agentsync/agentsync.hpp>

using namespace agentsync;

namespace {

template <typename Id>
void bind_identifier(py::module_& m, const char* name) {
    py::class_<Id>(m, name)
        .def(py::init<std::string>(), py::arg("value"))
        .def_static("generate",  &Id::generate)
        .def_static("validated", &Id::validated, py::arg("value"))
        .def("str",   &Id::str)
        .def("empty", &Id::empty)
        .def("__str__",  &Id::str)
        .def("__repr__", [name](const Id& id) {
            return std::string("<") + name + " '" + id.str() + "'>";
        })
        .def("__eq__", [](const Id& a, const Id& b) { return a == b; })
        .def("__lt__", [](const Id& a, const Id& b) { return a < b; })
        .def("__hash__", [](const Id& id) { return std::hash<Id>{}(id); });
    py::implicitly_convertible<py::str, Id>();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_agentsync, m) {
    m.doc() = "AgentSync: state, lifecycle and conflict coordination for agent fleets";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_lifecycle(m);
    bind_conflicts(m);
    bind_monitors(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Identifiers ------------------------------------------------------

    bind_identifier<AgentId>(m, "AgentId");
    bind_identifier<ConflictId>(m, "ConflictId");
    bind_identifier<TaskId>(m, "TaskId");

    // ---- Enums ------------------------------------------------------------

    py::enum_<AgentHealth>(m, "AgentHealth")
        .value("Healthy",   AgentHealth::Healthy)
        .value("Degraded",  AgentHealth::Degraded)
        .value("Unhealthy", AgentHealth::Unhealthy)
        .value("Offline",   AgentHealth::Offline)
        .value("Unknown",   AgentHealth::Unknown)
        .export_values();

    py::enum_<AgentStatus>(m, "AgentStatus")
        .value("Idle",         AgentStatus::Idle)
        .value("Busy",         AgentStatus::Busy)
        .value("Maintenance",  AgentStatus::Maintenance)
        .value("ShuttingDown", AgentStatus::ShuttingDown)
        .value("Starting",     AgentStatus::Starting)
        .value("Error",        AgentStatus::Error);

    py::enum_<LifecycleState>(m, "LifecycleState")
        .value("Creating",     LifecycleState::Creating)
        .value("Initializing", LifecycleState::Initializing)
        .value("Ready",        LifecycleState::Ready)
        .value("Starting",     LifecycleState::Starting)
        .value("Running",      LifecycleState::Running)
        .value("Stopping",     LifecycleState::Stopping)
        .value("Stopped",      LifecycleState::Stopped)
        .value("Restarting",   LifecycleState::Restarting)
        .value("Error",        LifecycleState::Error)
        .value("Destroying",   LifecycleState::Destroying)
        .value("Destroyed",    LifecycleState::Destroyed);

    py::enum_<ConflictSeverity>(m, "ConflictSeverity")
        .value("Low",      ConflictSeverity::Low)
        .value("Medium",   ConflictSeverity::Medium)
        .value("High",     ConflictSeverity::High)
        .value("Critical", ConflictSeverity::Critical)
        .export_values();

    py::enum_<ConflictKind>(m, "ConflictKind")
        .value("AgentState",     ConflictKind::AgentState)
        .value("TaskAssignment", ConflictKind::TaskAssignment)
        .value("Resource",       ConflictKind::Resource)
        .value("Configuration",  ConflictKind::Configuration)
        .value("Communication",  ConflictKind::Communication)
        .value("Custom",         ConflictKind::Custom);

    py::enum_<StrategyKind>(m, "StrategyKind")
        .value("AutoMerge",      StrategyKind::AutoMerge)
        .value("KeepLocal",      StrategyKind::KeepLocal)
        .value("KeepRemote",     StrategyKind::KeepRemote)
        .value("Manual",         StrategyKind::Manual)
        .value("LastWriterWins", StrategyKind::LastWriterWins)
        .value("Custom",         StrategyKind::Custom);

    py::enum_<EventType>(m, "EventType")
        .value("AgentRegistered",             EventType::AgentRegistered)
        .value("AgentDeregistered",           EventType::AgentDeregistered)
        .value("AgentHealthChanged",          EventType::AgentHealthChanged)
        .value("AgentStale",                  EventType::AgentStale)
        .value("LifecycleTransitioned",       EventType::LifecycleTransitioned)
        .value("LifecycleTransitionRejected", EventType::LifecycleTransitionRejected)
        .value("ConflictDetected",            EventType::ConflictDetected)
        .value("ConflictResolved",            EventType::ConflictResolved)
        .value("ConflictResolutionFailed",    EventType::ConflictResolutionFailed)
        .value("HandlerRegistered",           EventType::HandlerRegistered)
        .value("HandlerRemoved",              EventType::HandlerRemoved)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .export_values();

    // ---- Structs ----------------------------------------------------------

    py::class_<ConflictType>(m, "ConflictType")
        .def(py::init<>())
        .def(py::init([](ConflictKind kind) { return ConflictType{kind, {}}; }), py::arg("kind"))
        .def_static("custom", &ConflictType::custom, py::arg("name"))
        .def_readwrite("kind", &ConflictType::kind)
        .def_readwrite("name", &ConflictType::name)
        .def("key", &ConflictType::key)
        .def("__eq__", [](const ConflictType& a, const ConflictType& b) { return a == b; })
        .def("__repr__", [](const ConflictType& t) { return "<ConflictType " + t.key() + ">"; });

    py::class_<ConflictStrategy>(m, "ConflictStrategy")
        .def(py::init<>())
        .def(py::init([](StrategyKind kind) { return ConflictStrategy{kind, {}}; }), py::arg("kind"))
        .def_static("custom", &ConflictStrategy::custom, py::arg("handler"))
        .def_static("parse",  &parse_conflict_strategy, py::arg("text"))
        .def_readwrite("kind",         &ConflictStrategy::kind)
        .def_readwrite("handler_name", &ConflictStrategy::handler_name)
        .def("key", &ConflictStrategy::key)
        .def("__eq__", [](const ConflictStrategy& a, const ConflictStrategy& b) { return a == b; })
        .def("__repr__", [](const ConflictStrategy& s) {
            return "<ConflictStrategy " + s.key() + ">";
        });

    py::class_<LifecycleConfig>(m, "LifecycleConfig")
        .def(py::init<>())
        .def_readwrite("initialization_timeout", &LifecycleConfig::initialization_timeout)
        .def_readwrite("startup_timeout",        &LifecycleConfig::startup_timeout)
        .def_readwrite("shutdown_timeout",       &LifecycleConfig::shutdown_timeout)
        .def_readwrite("destroy_timeout",        &LifecycleConfig::destroy_timeout);

    py::class_<ResolverConfig>(m, "ResolverConfig")
        .def(py::init<>())
        .def_readwrite("default_strategy", &ResolverConfig::default_strategy)
        .def_readwrite("max_history_size", &ResolverConfig::max_history_size);

    // Config (top-level, embeds the two sub-configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("max_agents",        &Config::max_agents)
        .def_readwrite("heartbeat_timeout", &Config::heartbeat_timeout)
        .def_readwrite("lifecycle",         &Config::lifecycle)
        .def_readwrite("resolver",          &Config::resolver)
        .def_static("from_json", [](py::handle obj) { return config_from_json(json_from_py(obj)); },
                    py::arg("obj"))
        .def("to_json", [](const Config& c) { return json_to_py(config_to_json(c)); });

    // MonitorEvent
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",            &MonitorEvent::type)
        .def_readwrite("timestamp",       &MonitorEvent::timestamp)
        .def_readwrite("message",         &MonitorEvent::message)
        .def_readwrite("agent_id",        &MonitorEvent::agent_id)
        .def_readwrite("conflict_id",     &MonitorEvent::conflict_id)
        .def_readwrite("lifecycle_state", &MonitorEvent::lifecycle_state)
        .def_readwrite("strategy",        &MonitorEvent::strategy)
        .def_readwrite("duration_ms",     &MonitorEvent::duration_ms);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("conflicts_detected",    &MetricsMonitor::Metrics::conflicts_detected)
        .def_readwrite("conflicts_resolved",    &MetricsMonitor::Metrics::conflicts_resolved)
        .def_readwrite("resolution_failures",   &MetricsMonitor::Metrics::resolution_failures)
        .def_readwrite("transitions",           &MetricsMonitor::Metrics::transitions)
        .def_readwrite("rejected_transitions",  &MetricsMonitor::Metrics::rejected_transitions)
        .def_readwrite("stale_agents_reported", &MetricsMonitor::Metrics::stale_agents_reported)
        .def_readwrite("average_resolution_ms", &MetricsMonitor::Metrics::average_resolution_ms);

    // ---- Priority constants -----------------------------------------------

    m.attr("PRIORITY_LOW")      = PRIORITY_LOW;
    m.attr("PRIORITY_NORMAL")   = PRIORITY_NORMAL;
    m.attr("PRIORITY_HIGH")     = PRIORITY_HIGH;
    m.attr("PRIORITY_CRITICAL") = PRIORITY_CRITICAL;
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_AgentSyncError =
        py::register_exception<AgentSyncException>(m, "AgentSyncError", PyExc_RuntimeError);

    static auto py_InvalidIdentifierError =
        py::register_exception<InvalidIdentifierException>(m, "InvalidIdentifierError", py_AgentSyncError.ptr());
    static auto py_ValidationFailedError =
        py::register_exception<ValidationFailedException>(m, "ValidationFailedError", py_AgentSyncError.ptr());

    // Lifecycle
    static auto py_LifecycleError =
        py::register_exception<LifecycleException>(m, "LifecycleError", py_AgentSyncError.ptr());
    static auto py_InvalidTransitionError =
        py::register_exception<InvalidTransitionException>(m, "InvalidTransitionError", py_LifecycleError.ptr());

    // Conflicts
    static auto py_ConflictError =
        py::register_exception<ConflictException>(m, "ConflictError", py_AgentSyncError.ptr());
    static auto py_HandlerNotFoundError =
        py::register_exception<HandlerNotFoundException>(m, "HandlerNotFoundError", py_ConflictError.ptr());
    static auto py_HandlerAlreadyRegisteredError =
        py::register_exception<HandlerAlreadyRegisteredException>(m, "HandlerAlreadyRegisteredError", py_ConflictError.ptr());
    static auto py_ManualResolutionRequiredError =
        py::register_exception<ManualResolutionRequiredException>(m, "ManualResolutionRequiredError", py_ConflictError.ptr());
    static auto py_UnsupportedStrategyError =
        py::register_exception<UnsupportedStrategyException>(m, "UnsupportedStrategyError", py_ConflictError.ptr());
    static auto py_ConflictNotFoundError =
        py::register_exception<ConflictNotFoundException>(m, "ConflictNotFoundError", py_ConflictError.ptr());

    // Coordinator
    static auto py_AgentNotFoundError =
        py::register_exception<AgentNotFoundException>(m, "AgentNotFoundError", py_AgentSyncError.ptr());
    static auto py_AgentAlreadyRegisteredError =
        py::register_exception<AgentAlreadyRegisteredException>(m, "AgentAlreadyRegisteredError", py_AgentSyncError.ptr());
    static auto py_CapacityExceededError =
        py::register_exception<CapacityExceededException>(m, "CapacityExceededError", py_AgentSyncError.ptr());
}
