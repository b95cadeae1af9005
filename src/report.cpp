/*
  Report rendering.

  DOT output draws the whole graph, not only the enumerated paths, so that
  unused roads stay visible. Flows are printed with a fixed precision; the
  optimum is reported as "opt" and the equal split as "nash".
*/
#include "trafficeq/core/report.hpp"
#include "trafficeq/core/constants.hpp"
#include "trafficeq/core/edge_cost.hpp"

#include <iomanip>
#include <sstream>

namespace trafficeq::core {

namespace {

std::string dot_quote(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string fmt(double v, int precision = 3) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(precision) << v;
  return os.str();
}

std::string format_cost_fn(const AffineCost& c) {
  return fmt(c.a, 2) + "x+" + fmt(c.b, 2);
}

Flow flow_on(const EdgeFlowMap& m, EdgeId e) {
  auto it = m.find(e);
  return it == m.end() ? 0.0 : it->second;
}

} // namespace

std::string format_path(const CostDiGraph& g, const Path& p) {
  std::string out;
  for (std::size_t i = 0; i < p.nodes.size(); ++i) {
    if (i) out += " -> ";
    out += g.node_name(p.nodes[i]);
  }
  return out;
}

void write_dot(std::ostream& os, const AnalysisReport& report, const CostDiGraph& g) {
  os << "digraph traffic {\n";
  os << "  rankdir=LR;\n";
  std::string label;
  if (!report.has_route()) {
    label = "no route from " + g.node_name(report.src) + " to " + g.node_name(report.dst);
  } else {
    label = "demand " + fmt(report.demand, 2) +
            "  social optimum cost " + fmt(report.social_optimum.total_cost) +
            "  nash (equal split) cost " + fmt(report.nash_equilibrium.total_cost);
  }
  os << "  label=" << dot_quote(label) << ";\n";
  os << "  labelloc=t;\n";

  for (NodeId v = 0; v < g.num_nodes(); ++v) {
    os << "  n" << v << " [label=" << dot_quote(g.node_name(v));
    if (v == report.src || v == report.dst) os << ", shape=doublecircle";
    os << "];\n";
  }
  for (EdgeId e = 0; e < g.num_edges(); ++e) {
    const Flow opt = flow_on(report.social_optimum.edge_flows, e);
    const Flow ne = flow_on(report.nash_equilibrium.edge_flows, e);
    const std::string elabel = format_cost_fn(edge_cost_function(g, e)) +
                               "\\nopt " + fmt(opt) + "\\nnash " + fmt(ne);
    os << "  n" << g.edge_src(e) << " -> n" << g.edge_dst(e)
       << " [label=\"" << elabel << "\"";
    if (opt > kMinFlow || ne > kMinFlow) os << ", style=bold";
    os << "];\n";
  }
  os << "}\n";
}

void write_text_report(std::ostream& os, const AnalysisReport& report, const CostDiGraph& g) {
  os << "Route " << g.node_name(report.src) << " -> " << g.node_name(report.dst)
     << ", demand " << fmt(report.demand, 2) << "\n";
  if (!report.has_route()) {
    os << "No route: " << g.node_name(report.dst) << " is unreachable from "
       << g.node_name(report.src) << "\n";
    os << "Social optimum cost: " << fmt(0.0) << "\n";
    os << "Nash equilibrium cost: " << fmt(0.0) << "\n";
    return;
  }

  os << "\nPaths (" << report.paths.size() << "):\n";
  for (std::size_t i = 0; i < report.paths.size(); ++i) {
    os << "  [" << i << "] " << format_path(g, report.paths[i]) << "\n"
       << "      opt flow " << fmt(report.social_optimum.path_flows[i])
       << "  time " << fmt(report.social_optimum.travel_times[i])
       << " | nash flow " << fmt(report.nash_equilibrium.path_flows[i])
       << "  time " << fmt(report.nash_equilibrium.travel_times[i]) << "\n";
  }

  os << "\nEdges:\n";
  for (auto const& [e, opt] : report.social_optimum.edge_flows) {
    os << "  " << g.node_name(g.edge_src(e)) << " -> " << g.node_name(g.edge_dst(e))
       << " (" << format_cost_fn(edge_cost_function(g, e)) << ")"
       << "  opt " << fmt(opt)
       << "  nash " << fmt(flow_on(report.nash_equilibrium.edge_flows, e)) << "\n";
  }

  os << "\nSocial optimum cost: " << fmt(report.social_optimum.total_cost)
     << " (" << report.solver_iterations << " solver iterations)\n";
  os << "Nash equilibrium cost: " << fmt(report.nash_equilibrium.total_cost) << "\n";
  os << "Price of anarchy: " << fmt(report.price_of_anarchy(), 4) << "\n";
}

} // namespace trafficeq::core
