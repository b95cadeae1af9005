/*
  Flow assignment.

  Social optimum: the objective is handed to the generic simplex minimizer as
  a closure over the (immutable) graph and path set, together with its
  analytic gradient (the per-path marginal costs) and its constant Hessian
  (shared-edge curvature), which selects the active-set Newton method.
  Because edge flows are linear in path flows and each edge term
  a*x^2 + b*x is convex, any converged point is a global optimum; ties
  between equivalent paths are resolved by the minimizer.

  Nash approximation: the demand is split equally over all enumerated paths.
*/
#include "trafficeq/core/assignment.hpp"
#include "trafficeq/core/constants.hpp"
#include "trafficeq/core/error.hpp"
#include "trafficeq/core/simplex_minimizer.hpp"
#include "trafficeq/core/social_cost.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>

namespace trafficeq::core {

namespace {

void validate_demand(Flow total_demand) {
  if (!std::isfinite(total_demand) || total_demand < 0.0) {
    throw NotFoundError("vehicle demand must be a finite non-negative number, got " +
                        std::to_string(total_demand));
  }
}

// Clamp solver noise to zero and push any conservation residual onto the
// largest entry, where it is relatively smallest.
void finalize_flows(PathFlows& flows, Flow total_demand) {
  for (auto& f : flows) {
    if (f < 0.0) {
      if (f < -kNegativeFlowNoise * std::max(1.0, total_demand)) {
        throw ConvergenceError("social optimum produced a negative path flow (" +
                               std::to_string(f) + ")");
      }
      f = 0.0;
    }
  }
  const Flow sum = std::accumulate(flows.begin(), flows.end(), 0.0);
  auto largest = std::max_element(flows.begin(), flows.end());
  *largest = std::max(0.0, *largest + (total_demand - sum));
  const Flow fixed = std::accumulate(flows.begin(), flows.end(), 0.0);
  if (std::abs(fixed - total_demand) > kConservationRelTol * std::max(1.0, total_demand)) {
    throw ConvergenceError("social optimum violates flow conservation: sum " +
                           std::to_string(fixed) + " != demand " + std::to_string(total_demand));
  }
}

} // namespace

PathFlows assign_flow_social_optimum(std::span<const Path> paths,
                                     Flow total_demand,
                                     const CostDiGraph& g,
                                     const SolverOptions& opts,
                                     int* iterations) {
  validate_demand(total_demand);
  if (iterations) *iterations = 0;
  if (paths.empty()) return {};
  if (total_demand == 0.0) return PathFlows(paths.size(), 0.0);

  SimplexObjective objective;
  objective.value = [&](std::span<const double> x) {
    return total_cost_of_path_flows(paths, x, g);
  };
  objective.gradient = [&](std::span<const double> x, std::span<double> grad) {
    auto m = path_marginal_costs(paths, x, g);
    std::copy(m.begin(), m.end(), grad.begin());
  };
  objective.hessian = [h = path_cost_hessian(paths, g)](std::span<const double>,
                                                        std::span<double> out) {
    std::copy(h.begin(), h.end(), out.begin());
  };

  const PathFlows x0 = assign_flows_nash_equilibrium(paths, total_demand);
  auto res = minimize_on_simplex(objective, x0, total_demand, opts);
  if (iterations) *iterations = res.iterations;
  if (!res.converged) {
    throw ConvergenceError("social optimum did not converge within " +
                           std::to_string(opts.max_iterations) + " iterations");
  }
  if (!std::all_of(res.x.begin(), res.x.end(), [](double v){ return std::isfinite(v); })) {
    throw ConvergenceError("social optimum produced non-finite path flows");
  }
  PathFlows flows = std::move(res.x);
  finalize_flows(flows, total_demand);
  return flows;
}

PathFlows assign_flows_nash_equilibrium(std::span<const Path> paths, Flow total_demand) {
  validate_demand(total_demand);
  if (paths.empty()) return {};
  const Flow share = total_demand / static_cast<Flow>(paths.size());
  return PathFlows(paths.size(), share);
}

} // namespace trafficeq::core
