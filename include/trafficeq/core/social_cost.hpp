/* Social cost (total system delay) and per-path cost views. */
#pragma once

#include <span>
#include <vector>

#include "trafficeq/core/cost_digraph.hpp"
#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Sum over edges in the mapping of flow * cost(flow). Empty mapping -> 0.
[[nodiscard]] Cost total_cost(const EdgeFlowMap& edge_flows, const CostDiGraph& g);

// flows_to_edge_flows followed by total_cost. This is the objective the
// social-optimum assigner minimizes.
[[nodiscard]] Cost total_cost_of_path_flows(std::span<const Path> paths,
                                            std::span<const Flow> path_flows,
                                            const CostDiGraph& g);

// Travel time of one vehicle on each path under the given edge flows:
// sum of a*x_e + b over the path's edges. Edges missing from the mapping
// are treated as carrying no flow.
[[nodiscard]] std::vector<Cost> path_travel_times(std::span<const Path> paths,
                                                  const EdgeFlowMap& edge_flows,
                                                  const CostDiGraph& g);

// Gradient of total_cost_of_path_flows w.r.t. each path flow:
// sum of 2*a*x_e + b over the path's edges.
[[nodiscard]] std::vector<Cost> path_marginal_costs(std::span<const Path> paths,
                                                    std::span<const Flow> path_flows,
                                                    const CostDiGraph& g);

// Hessian of total_cost_of_path_flows w.r.t. path flows, row-major n x n:
// H[i][j] = sum of 2*a over the edges paths i and j share. Independent of the
// flows because edge costs are affine. Singular whenever a path is
// congestion-free or one path's edges are covered by others.
[[nodiscard]] std::vector<Cost> path_cost_hessian(std::span<const Path> paths,
                                                  const CostDiGraph& g);

} // namespace trafficeq::core
