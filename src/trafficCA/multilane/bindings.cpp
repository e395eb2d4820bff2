#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "road.hpp"
#include "flow_stats.hpp"

namespace py = pybind11;

PYBIND11_MODULE(multilane_cpp, m)
{
    m.doc() = "Multi-lane Nagel-Schreckenberg traffic simulation";

    // ---------------- Parameters ----------------
    py::class_<Parameters>(m, "Parameters")
        .def(py::init<>())
        .def_readwrite("num_lanes",      &Parameters::num_lanes)
        .def_readwrite("length",         &Parameters::length)
        .def_readwrite("cars_per_lane",  &Parameters::cars_per_lane)
        .def_readwrite("max_velocity",   &Parameters::max_velocity)
        .def_readwrite("p_slowdown",     &Parameters::p_slowdown)
        .def_readwrite("p_crash",        &Parameters::p_crash)
        .def_readwrite("crash_duration", &Parameters::crash_duration)
        .def_readwrite("lane_changes",   &Parameters::lane_changes)
        .def_readwrite("verbose",        &Parameters::verbose);

    py::class_<CrashEvent>(m, "CrashEvent")
        .def_readonly("tick",     &CrashEvent::tick)
        .def_readonly("lane",     &CrashEvent::lane)
        .def_readonly("position", &CrashEvent::position);

    // ---------------- Road ----------------
    py::class_<Road>(m, "Road")
        .def(py::init(
            [](const Parameters& p, py::object seed) {
                if (seed.is_none())
                    return Road(p);
                return Road(p, seed.cast<std::uint32_t>());
            }),
            py::arg("params"), py::arg("seed") = py::none())

        .def("tick", &Road::tick)
        .def("tick_with_lane_changes", &Road::tickWithLaneChanges)
        .def("simulate", &Road::simulate, py::arg("steps"))

        // (num_lanes, length) int array, -1 where the cell is empty
        .def("snapshot", &Road::snapshot)

        .def("shape",
             [](const Road& r) {
                 return py::make_tuple(r.numLanes(), r.length());
             })

        .def("lane_positions",
             [](const Road& r, std::size_t i) { return r.lane(i).positions(); })
        .def("lane_velocities",
             [](const Road& r, std::size_t i) { return r.lane(i).velocities(); })

        .def("car_count", &Road::carCount)
        .def_property_readonly("ticks", &Road::ticks)
        .def_property_readonly("crashes", &Road::crashes);

    // ---------------- Flow statistics ----------------
    py::class_<FlowStats>(m, "FlowStats")
        .def_readonly("density",             &FlowStats::density)
        .def_readonly("mean_velocity",       &FlowStats::mean_velocity)
        .def_readonly("flow",                &FlowStats::flow)
        .def_readonly("total_density",       &FlowStats::total_density)
        .def_readonly("total_mean_velocity", &FlowStats::total_mean_velocity)
        .def_readonly("total_flow",          &FlowStats::total_flow);

    m.def("measure_flow",
          [](const Road& r) { return measureFlow(r.snapshot()); },
          py::arg("road"));
    m.def("sample_flow", &sampleFlow,
          py::arg("road"), py::arg("warmup"), py::arg("steps"));
}
