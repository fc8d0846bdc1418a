#pragma once
#include <pybind11/pybind11.h>
#include <agentsync/types.hpp>
namespace py = pybind11;

void bind_enums_and_structs(py::module_& m);
void bind_exceptions(py::module_& m);
void bind_core(py::module_& m);
void bind_lifecycle(py::module_& m);
void bind_conflicts(py::module_& m);
void bind_monitors(py::module_& m);

// Snapshots cross the boundary as plain Python objects via the json module
inline py::object json_to_py(const agentsync::Json& j) {
    return py::module_::import("json").attr("loads")(j.dump());
}

inline agentsync::Json json_from_py(py::handle obj) {
    auto text = py::module_::import("json").attr("dumps")(obj).cast<std::string>();
    return agentsync::Json::parse(text);
}
