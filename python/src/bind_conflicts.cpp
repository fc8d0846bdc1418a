#include "bind_forward.hpp"
#include <agentsync/agentsync.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <future>

using namespace agentsync;

// ---------------------------------------------------------------------------
// Wrapper for std::future<ResolutionResult>
// ---------------------------------------------------------------------------
struct FutureResolution {
    std::future<ResolutionResult> fut;

    ResolutionResult result() {
        py::gil_scoped_release release;
        return fut.get();
    }

    bool ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

// Trampoline class to allow Python subclassing of ConflictHandler
class PyConflictHandler : public ConflictHandler {
public:
    using ConflictHandler::ConflictHandler;

    ResolutionResult resolve_conflict(const Conflict& conflict) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(ResolutionResult, ConflictHandler, resolve_conflict, conflict);
    }

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, ConflictHandler, name);
    }

    std::vector<ConflictType> supported_conflict_types() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::vector<ConflictType>, ConflictHandler,
                               supported_conflict_types);
    }
};

// ---------------------------------------------------------------------------
// bind_conflicts  --  Conflict, results, handlers, ConflictResolver
// ---------------------------------------------------------------------------
void bind_conflicts(py::module_& m) {

    // ===================================================================
    // Conflict
    // ===================================================================
    py::class_<Conflict>(m, "Conflict")
        .def(py::init([](ConflictType type, ConflictSeverity severity, std::string description,
                         py::handle local, py::handle remote) {
                 return Conflict(std::move(type), severity, std::move(description),
                                 json_from_py(local), json_from_py(remote));
             }),
             py::arg("type"), py::arg("severity"), py::arg("description"),
             py::arg("local_state"), py::arg("remote_state"))
        .def("id",          &Conflict::id)
        .def("type",        &Conflict::type)
        .def("severity",    &Conflict::severity)
        .def("description", &Conflict::description)
        .def("local_state",  [](const Conflict& c) { return json_to_py(c.local_state()); })
        .def("remote_state", [](const Conflict& c) { return json_to_py(c.remote_state()); })
        .def("created_at",  &Conflict::created_at)
        .def("is_resolved", &Conflict::is_resolved)
        .def("resolved_at", &Conflict::resolved_at)
        .def("resolution_strategy", &Conflict::resolution_strategy)
        .def("resolution_result", [](const Conflict& c) -> py::object {
            if (!c.resolution_result()) return py::none();
            return json_to_py(*c.resolution_result());
        })
        .def("age",     &Conflict::age)
        .def("to_json", [](const Conflict& c) { return json_to_py(Json(c)); })
        .def("__repr__", [](const Conflict& c) {
            return "<Conflict id='" + c.id().str() + "' type=" + c.type().key()
                 + " severity=" + to_string(c.severity()) + ">";
        });

    // ===================================================================
    // ResolutionResult / ConflictRecord / ConflictStatistics
    // ===================================================================
    py::class_<ResolutionResult>(m, "ResolutionResult")
        .def(py::init<>())
        .def_static("make_success",
            [](ConflictStrategy strategy, py::handle state, std::string message) {
                return ResolutionResult::make_success(std::move(strategy), json_from_py(state),
                                                      std::move(message));
            },
            py::arg("strategy"), py::arg("state"), py::arg("message"))
        .def_static("make_failure", &ResolutionResult::make_failure,
                    py::arg("strategy"), py::arg("message"))
        .def_readwrite("success",   &ResolutionResult::success)
        .def_readwrite("strategy",  &ResolutionResult::strategy)
        .def_readwrite("message",   &ResolutionResult::message)
        .def_readwrite("timestamp", &ResolutionResult::timestamp)
        .def_property("resolved_state",
            [](const ResolutionResult& r) { return json_to_py(r.resolved_state); },
            [](ResolutionResult& r, py::handle value) { r.resolved_state = json_from_py(value); });

    py::class_<ConflictRecord>(m, "ConflictRecord")
        .def_readonly("conflict_id",        &ConflictRecord::conflict_id)
        .def_readonly("conflict_type",      &ConflictRecord::conflict_type)
        .def_readonly("strategy",           &ConflictRecord::strategy)
        .def_readonly("success",            &ConflictRecord::success)
        .def_readonly("resolution_time_ms", &ConflictRecord::resolution_time_ms)
        .def_readonly("timestamp",          &ConflictRecord::timestamp)
        .def_readonly("error",              &ConflictRecord::error);

    py::class_<ConflictStatistics>(m, "ConflictStatistics")
        .def_readonly("total_conflicts",        &ConflictStatistics::total_conflicts)
        .def_readonly("total_resolved",         &ConflictStatistics::total_resolved)
        .def_readonly("total_failed",           &ConflictStatistics::total_failed)
        .def_readonly("success_rate",           &ConflictStatistics::success_rate)
        .def_readonly("avg_resolution_time_ms", &ConflictStatistics::avg_resolution_time_ms)
        .def_readonly("conflicts_by_type",      &ConflictStatistics::conflicts_by_type)
        .def_readonly("conflicts_by_strategy",  &ConflictStatistics::conflicts_by_strategy)
        .def_readonly("last_updated",           &ConflictStatistics::last_updated);

    py::class_<FutureResolution>(m, "FutureResolution")
        .def("result", &FutureResolution::result)
        .def("ready",  &FutureResolution::ready);

    // ===================================================================
    // Handlers
    // ===================================================================
    py::class_<ConflictHandler, PyConflictHandler, std::shared_ptr<ConflictHandler>>(m, "ConflictHandler")
        .def(py::init<>())
        .def("resolve_conflict", &ConflictHandler::resolve_conflict, py::arg("conflict"))
        .def("name", &ConflictHandler::name)
        .def("supported_conflict_types", &ConflictHandler::supported_conflict_types);

    py::class_<AgentStateConflictHandler, ConflictHandler,
               std::shared_ptr<AgentStateConflictHandler>>(m, "AgentStateConflictHandler")
        .def(py::init<>());

    py::class_<FunctionConflictHandler, ConflictHandler,
               std::shared_ptr<FunctionConflictHandler>>(m, "FunctionConflictHandler")
        .def(py::init([](std::string name, py::function fn, std::vector<ConflictType> types) {
                 FunctionConflictHandler::ResolveFn cpp_fn =
                     [fn = py::object(fn)](const Conflict& c) {
                         py::gil_scoped_acquire acquire;
                         return fn(c).cast<ResolutionResult>();
                     };
                 return std::make_shared<FunctionConflictHandler>(
                     std::move(name), std::move(cpp_fn), std::move(types));
             }),
             py::arg("name"), py::arg("fn"),
             py::arg("supported_types") = std::vector<ConflictType>{});

    // ===================================================================
    // ConflictResolver
    // ===================================================================
    py::class_<ConflictResolver>(m, "ConflictResolver")
        .def(py::init<ResolverConfig>(), py::arg("config") = ResolverConfig{})
        // Strategy
        .def("strategy",     &ConflictResolver::strategy)
        .def("set_strategy", &ConflictResolver::set_strategy, py::arg("strategy"))
        // Handler registry
        .def("add_handler",    &ConflictResolver::add_handler, py::arg("handler"))
        .def("remove_handler", &ConflictResolver::remove_handler, py::arg("handler_name"))
        .def("has_handler",    &ConflictResolver::has_handler, py::arg("handler_name"))
        .def("handler_names",  &ConflictResolver::handler_names)
        // Detection
        .def("detect_conflict",
            [](ConflictResolver& self, ConflictType type, py::handle local, py::handle remote,
               ConflictSeverity severity, std::string description) {
                return self.detect_conflict(std::move(type), severity, std::move(description),
                                            json_from_py(local), json_from_py(remote));
            },
            py::arg("type"), py::arg("local_state"), py::arg("remote_state"),
            py::arg("severity") = ConflictSeverity::Medium,
            py::arg("description") = std::string("State conflict detected"))
        .def("add_conflict", &ConflictResolver::add_conflict, py::arg("conflict"))
        // Resolution (handlers re-acquire the GIL themselves)
        .def("attempt_resolution",
             py::overload_cast<const ConflictId&>(&ConflictResolver::attempt_resolution),
             py::arg("conflict_id"), py::call_guard<py::gil_scoped_release>())
        .def("attempt_resolution",
             py::overload_cast<const ConflictId&, const ConflictStrategy&>(
                 &ConflictResolver::attempt_resolution),
             py::arg("conflict_id"), py::arg("strategy"),
             py::call_guard<py::gil_scoped_release>())
        .def("attempt_resolution_async",
            [](ConflictResolver& self, ConflictId id) {
                return FutureResolution{self.attempt_resolution_async(std::move(id))};
            },
            py::arg("conflict_id"))
        // Queries
        .def("get_active_conflicts",  &ConflictResolver::get_active_conflicts)
        .def("get_conflict",          &ConflictResolver::get_conflict, py::arg("conflict_id"))
        .def("active_conflict_count", &ConflictResolver::active_conflict_count)
        .def("resolved_conflict_count", &ConflictResolver::resolved_conflict_count)
        .def("get_resolved_conflict", &ConflictResolver::get_resolved_conflict,
             py::arg("conflict_id"))
        .def("get_statistics",        &ConflictResolver::get_statistics)
        .def("get_conflict_history",  &ConflictResolver::get_conflict_history)
        .def("set_monitor",           &ConflictResolver::set_monitor, py::arg("monitor"));

    m.def("merge_objects", [](py::handle base, py::handle overlay) {
        return json_to_py(merge_objects(json_from_py(base), json_from_py(overlay)));
    }, py::arg("base"), py::arg("overlay"));
}
