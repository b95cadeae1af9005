/*
  Pybind11 module exposing TrafficEq-Core C++ APIs to Python.

  Notes:
    - Graph construction accepts NumPy arrays (C-contiguous) and converts to
      spans for zero-copy views.
    - Path flows and edge flows are returned as Python lists/dicts; they are
      one entry per path/edge and small in practice.
    - Core exceptions map to Python exception types of the same name.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <sstream>

#include "trafficeq/core/assignment.hpp"
#include "trafficeq/core/cost_digraph.hpp"
#include "trafficeq/core/error.hpp"
#include "trafficeq/core/flow_aggregation.hpp"
#include "trafficeq/core/gml_loader.hpp"
#include "trafficeq/core/path_enumeration.hpp"
#include "trafficeq/core/report.hpp"
#include "trafficeq/core/social_cost.hpp"
#include "trafficeq/core/traffic_analysis.hpp"
#include "trafficeq/core/types.hpp"

namespace py = pybind11;
using namespace trafficeq::core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 1) throw py::type_error(std::string(name) + " must be a 1-D array");
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

static SolverOptions make_solver_options(int max_iterations, double tolerance) {
  SolverOptions opts;
  opts.max_iterations = max_iterations;
  opts.tolerance = tolerance;
  return opts;
}

PYBIND11_MODULE(_trafficeq_core, m) {
  m.doc() = "TrafficEq-Core C++ bindings";

  py::register_exception<ValueError>(m, "ValueError", PyExc_ValueError);
  py::register_exception<GraphLoadError>(m, "GraphLoadError", PyExc_ValueError);
  py::register_exception<NotFoundError>(m, "NotFoundError", PyExc_LookupError);
  py::register_exception<ConvergenceError>(m, "ConvergenceError", PyExc_RuntimeError);

  py::class_<CostDiGraph>(m, "CostDiGraph")
      .def_static(
          "from_arrays",
          [](py::object nodes, py::array src, py::array dst, py::array a, py::array b) {
            auto src_s = as_span<std::int32_t>(src, "src");
            auto dst_s = as_span<std::int32_t>(dst, "dst");
            auto a_s = as_span<double>(a, "a");
            auto b_s = as_span<double>(b, "b");
            if (py::isinstance<py::int_>(nodes)) {
              return CostDiGraph::from_arrays(py::cast<std::int32_t>(nodes), src_s, dst_s, a_s, b_s);
            }
            return CostDiGraph::from_arrays(py::cast<std::vector<std::string>>(nodes),
                                            src_s, dst_s, a_s, b_s);
          },
          py::arg("nodes"), py::arg("src"), py::arg("dst"), py::arg("a"), py::arg("b"))
      .def("num_nodes", &CostDiGraph::num_nodes)
      .def("num_edges", &CostDiGraph::num_edges)
      .def("node_name", &CostDiGraph::node_name, py::arg("node"))
      .def("find_node", [](const CostDiGraph& g, const std::string& name){ return g.find_node(name); },
           py::arg("name"))
      .def("find_edges", &CostDiGraph::find_edges, py::arg("u"), py::arg("v"))
      .def("edge_src", &CostDiGraph::edge_src, py::arg("edge"))
      .def("edge_dst", &CostDiGraph::edge_dst, py::arg("edge"))
      .def("coeff_a_view", [](py::object self_obj, const CostDiGraph& g){
        auto s = g.coeff_a_view();
        return py::array(
            py::buffer_info(
                const_cast<double*>(s.data()), sizeof(double), py::format_descriptor<double>::format(), 1, { s.size() }, { sizeof(double) }
            ), self_obj);
      })
      .def("coeff_b_view", [](py::object self_obj, const CostDiGraph& g){
        auto s = g.coeff_b_view();
        return py::array(
            py::buffer_info(
                const_cast<double*>(s.data()), sizeof(double), py::format_descriptor<double>::format(), 1, { s.size() }, { sizeof(double) }
            ), self_obj);
      });

  py::class_<Path>(m, "Path")
      .def_readonly("nodes", &Path::nodes)
      .def_readonly("edges", &Path::edges)
      .def("__eq__", [](const Path& a, const Path& b){ return a == b; });

  m.def("enumerate_paths",
        [](const CostDiGraph& g, py::object src, py::object dst, std::optional<std::int64_t> max_paths) {
          PathEnumerationOptions opts;
          opts.max_paths = max_paths;
          if (py::isinstance<py::str>(src) && py::isinstance<py::str>(dst)) {
            return enumerate_paths(g, py::cast<std::string>(src), py::cast<std::string>(dst), opts);
          }
          return enumerate_paths(g, py::cast<NodeId>(src), py::cast<NodeId>(dst), opts);
        },
        py::arg("graph"), py::arg("src"), py::arg("dst"), py::kw_only(), py::arg("max_paths") = py::none());

  m.def("edge_cost", &edge_cost, py::arg("graph"), py::arg("edge"), py::arg("flow"));

  m.def("flows_to_edge_flows",
        [](const std::vector<Path>& paths, const std::vector<Flow>& flows) {
          return flows_to_edge_flows(paths, flows);
        },
        py::arg("paths"), py::arg("path_flows"));

  m.def("total_cost",
        [](const EdgeFlowMap& edge_flows, const CostDiGraph& g) { return total_cost(edge_flows, g); },
        py::arg("edge_flows"), py::arg("graph"));

  m.def("total_cost_of_path_flows",
        [](const std::vector<Path>& paths, const std::vector<Flow>& flows, const CostDiGraph& g) {
          return total_cost_of_path_flows(paths, flows, g);
        },
        py::arg("paths"), py::arg("path_flows"), py::arg("graph"));

  m.def("assign_flow_social_optimum",
        [](const std::vector<Path>& paths, double demand, const CostDiGraph& g,
           int max_iterations, double tolerance) {
          auto opts = make_solver_options(max_iterations, tolerance);
          py::gil_scoped_release rel;
          return assign_flow_social_optimum(paths, demand, g, opts);
        },
        py::arg("paths"), py::arg("total_demand"), py::arg("graph"), py::kw_only(),
        py::arg("max_iterations") = SolverOptions{}.max_iterations,
        py::arg("tolerance") = SolverOptions{}.tolerance);

  m.def("assign_flows_nash_equilibrium",
        [](const std::vector<Path>& paths, double demand) {
          return assign_flows_nash_equilibrium(paths, demand);
        },
        py::arg("paths"), py::arg("total_demand"));

  py::class_<AssignmentResult>(m, "AssignmentResult")
      .def_readonly("path_flows", &AssignmentResult::path_flows)
      .def_readonly("edge_flows", &AssignmentResult::edge_flows)
      .def_readonly("total_cost", &AssignmentResult::total_cost)
      .def_readonly("travel_times", &AssignmentResult::travel_times);

  py::class_<AnalysisReport>(m, "AnalysisReport")
      .def_readonly("src", &AnalysisReport::src)
      .def_readonly("dst", &AnalysisReport::dst)
      .def_readonly("demand", &AnalysisReport::demand)
      .def_readonly("paths", &AnalysisReport::paths)
      .def_readonly("social_optimum", &AnalysisReport::social_optimum)
      .def_readonly("nash_equilibrium", &AnalysisReport::nash_equilibrium)
      .def_readonly("solver_iterations", &AnalysisReport::solver_iterations)
      .def("has_route", &AnalysisReport::has_route)
      .def("price_of_anarchy", &AnalysisReport::price_of_anarchy)
      .def("to_dot", [](const AnalysisReport& r, const CostDiGraph& g){
        std::ostringstream os; write_dot(os, r, g); return os.str();
      }, py::arg("graph"))
      .def("to_text", [](const AnalysisReport& r, const CostDiGraph& g){
        std::ostringstream os; write_text_report(os, r, g); return os.str();
      }, py::arg("graph"));

  m.def("analyze_traffic",
        [](const CostDiGraph& g, const std::string& src, const std::string& dst, double demand,
           std::optional<std::int64_t> max_paths, int max_iterations, double tolerance) {
          AnalysisOptions opts;
          opts.enumeration.max_paths = max_paths;
          opts.solver = make_solver_options(max_iterations, tolerance);
          py::gil_scoped_release rel;
          return analyze_traffic(g, src, dst, demand, opts);
        },
        py::arg("graph"), py::arg("src"), py::arg("dst"), py::arg("demand"), py::kw_only(),
        py::arg("max_paths") = py::none(),
        py::arg("max_iterations") = SolverOptions{}.max_iterations,
        py::arg("tolerance") = SolverOptions{}.tolerance);

  m.def("parse_gml", [](const std::string& text){ return parse_gml(text); }, py::arg("text"));
  m.def("load_gml", &load_gml, py::arg("path"));
}
