/*
  Analysis pipeline: load-independent part of a run.

  enumerate_paths -> {assign_flow_social_optimum, assign_flows_nash_equilibrium}
                  -> flows_to_edge_flows -> total_cost / path_travel_times

  The path set is computed once and shared by both policies so that their
  path-flow vectors are indexed identically.
*/
#include "trafficeq/core/traffic_analysis.hpp"
#include "trafficeq/core/assignment.hpp"
#include "trafficeq/core/flow_aggregation.hpp"
#include "trafficeq/core/path_enumeration.hpp"
#include "trafficeq/core/social_cost.hpp"

#include <limits>
#include <utility>

namespace trafficeq::core {

namespace {

AssignmentResult evaluate(const CostDiGraph& g, std::span<const Path> paths, PathFlows flows) {
  AssignmentResult r;
  r.path_flows = std::move(flows);
  r.edge_flows = flows_to_edge_flows(paths, r.path_flows);
  r.total_cost = total_cost(r.edge_flows, g);
  r.travel_times = path_travel_times(paths, r.edge_flows, g);
  return r;
}

} // namespace

double AnalysisReport::price_of_anarchy() const noexcept {
  const double opt = social_optimum.total_cost;
  const double ne = nash_equilibrium.total_cost;
  if (opt <= 0.0) return ne <= 0.0 ? 1.0 : std::numeric_limits<double>::infinity();
  return ne / opt;
}

AnalysisReport analyze_traffic(const CostDiGraph& g, NodeId src, NodeId dst,
                               Flow demand, const AnalysisOptions& opts) {
  AnalysisReport rep;
  rep.src = src;
  rep.dst = dst;
  rep.demand = demand;
  rep.paths = enumerate_paths(g, src, dst, opts.enumeration);

  auto so = assign_flow_social_optimum(rep.paths, demand, g, opts.solver, &rep.solver_iterations);
  auto ne = assign_flows_nash_equilibrium(rep.paths, demand);
  rep.social_optimum = evaluate(g, rep.paths, std::move(so));
  rep.nash_equilibrium = evaluate(g, rep.paths, std::move(ne));
  return rep;
}

AnalysisReport analyze_traffic(const CostDiGraph& g,
                               std::string_view src, std::string_view dst,
                               Flow demand, const AnalysisOptions& opts) {
  NodeId s = require_node(g, src, "start");
  NodeId t = require_node(g, dst, "end");
  return analyze_traffic(g, s, t, demand, opts);
}

} // namespace trafficeq::core
