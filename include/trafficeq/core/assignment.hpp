/* Flow assignment policies: social optimum and equal-split Nash approximation. */
#pragma once

#include <span>

#include "trafficeq/core/cost_digraph.hpp"
#include "trafficeq/core/options.hpp"
#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Minimize total_cost_of_path_flows over path flows subject to
// sum(flows) == total_demand and flows >= 0, starting from the equal split.
// - Zero paths -> empty vector; zero demand -> all zeros (no optimization).
// - Negative or non-finite demand -> NotFoundError.
// - Solver failure -> ConvergenceError (the unconverged iterate is never returned).
// The result is clamped to >= 0 and sums to total_demand within 1e-6 relative.
// iterations, when non-null, receives the minimizer's iteration count.
[[nodiscard]] PathFlows assign_flow_social_optimum(std::span<const Path> paths,
                                                   Flow total_demand,
                                                   const CostDiGraph& g,
                                                   const SolverOptions& opts = {},
                                                   int* iterations = nullptr);

// Equal split: every path receives total_demand / paths.size().
// This approximates selfish routing; it is not an iterative Wardrop solve.
// Zero paths -> empty vector. Negative or non-finite demand -> NotFoundError.
[[nodiscard]] PathFlows assign_flows_nash_equilibrium(std::span<const Path> paths,
                                                      Flow total_demand);

} // namespace trafficeq::core
