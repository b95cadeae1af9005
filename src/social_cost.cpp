/*
  Social-cost evaluation.

  The system cost sum_e x_e * (a_e x_e + b_e) is a convex quadratic in the
  path flows because every x_e is a sum of path flows. Per-path travel times
  and marginal costs are the two path-level views of the same edge costs:
  equal travel times on used paths characterize a Wardrop equilibrium, equal
  marginal costs characterize the social optimum.
*/
#include "trafficeq/core/social_cost.hpp"
#include "trafficeq/core/edge_cost.hpp"
#include "trafficeq/core/flow_aggregation.hpp"

#include <map>
#include <utility>
#include <vector>

namespace trafficeq::core {

Cost total_cost(const EdgeFlowMap& edge_flows, const CostDiGraph& g) {
  Cost total = 0.0;
  for (auto const& [e, x] : edge_flows) {
    total += edge_delay(g, e, x);
  }
  return total;
}

Cost total_cost_of_path_flows(std::span<const Path> paths,
                              std::span<const Flow> path_flows,
                              const CostDiGraph& g) {
  return total_cost(flows_to_edge_flows(paths, path_flows), g);
}

std::vector<Cost> path_travel_times(std::span<const Path> paths,
                                    const EdgeFlowMap& edge_flows,
                                    const CostDiGraph& g) {
  std::vector<Cost> out;
  out.reserve(paths.size());
  for (auto const& p : paths) {
    Cost t = 0.0;
    for (auto e : p.edges) {
      auto it = edge_flows.find(e);
      t += edge_cost(g, e, it == edge_flows.end() ? 0.0 : it->second);
    }
    out.push_back(t);
  }
  return out;
}

std::vector<Cost> path_marginal_costs(std::span<const Path> paths,
                                      std::span<const Flow> path_flows,
                                      const CostDiGraph& g) {
  const auto edge_flows = flows_to_edge_flows(paths, path_flows);
  std::vector<Cost> out;
  out.reserve(paths.size());
  for (auto const& p : paths) {
    Cost m = 0.0;
    for (auto e : p.edges) m += edge_marginal_cost(g, e, edge_flows.at(e));
    out.push_back(m);
  }
  return out;
}

std::vector<Cost> path_cost_hessian(std::span<const Path> paths, const CostDiGraph& g) {
  const std::size_t n = paths.size();
  // Paths through each referenced edge, with that edge's curvature 2a.
  std::map<EdgeId, std::pair<Cost, std::vector<std::size_t>>> by_edge;
  for (std::size_t i = 0; i < n; ++i) {
    for (auto e : paths[i].edges) {
      auto it = by_edge.find(e);
      if (it == by_edge.end()) {
        it = by_edge.emplace(e, std::make_pair(2.0 * edge_cost_function(g, e).a,
                                               std::vector<std::size_t>{})).first;
      }
      it->second.second.push_back(i);
    }
  }
  std::vector<Cost> h(n * n, 0.0);
  for (auto const& [e, entry] : by_edge) {
    auto const& [w, on_edge] = entry;
    if (w == 0.0) continue;
    for (auto i : on_edge) {
      for (auto j : on_edge) h[i * n + j] += w;
    }
  }
  return h;
}

} // namespace trafficeq::core
