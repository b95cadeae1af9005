/* End-to-end comparison of the social optimum and the equal-split Nash assignment. */
#pragma once

#include <string_view>
#include <vector>

#include "trafficeq/core/cost_digraph.hpp"
#include "trafficeq/core/options.hpp"
#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Result of one assignment policy over the shared path set.
struct AssignmentResult {
  PathFlows path_flows;
  EdgeFlowMap edge_flows;
  Cost total_cost {0.0};
  std::vector<Cost> travel_times;  // per path, under this policy's edge flows
};

struct AnalysisReport {
  NodeId src {-1};
  NodeId dst {-1};
  Flow demand {0.0};
  std::vector<Path> paths;
  AssignmentResult social_optimum;
  AssignmentResult nash_equilibrium;
  int solver_iterations {0};

  // False when dst is unreachable from src; all results are then empty/zero.
  [[nodiscard]] bool has_route() const noexcept { return !paths.empty(); }
  // Nash cost / optimum cost; 1.0 when both are zero.
  [[nodiscard]] double price_of_anarchy() const noexcept;
};

// Enumerate paths, run both assigners, aggregate and evaluate.
// Throws NotFoundError (missing node, invalid demand) or ConvergenceError.
[[nodiscard]] AnalysisReport analyze_traffic(const CostDiGraph& g, NodeId src, NodeId dst,
                                             Flow demand, const AnalysisOptions& opts = {});
[[nodiscard]] AnalysisReport analyze_traffic(const CostDiGraph& g,
                                             std::string_view src, std::string_view dst,
                                             Flow demand, const AnalysisOptions& opts = {});

} // namespace trafficeq::core
