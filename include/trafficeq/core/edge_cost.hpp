/* Affine edge cost model: cost(x) = a*x + b. */
#pragma once

#include "trafficeq/core/cost_digraph.hpp"
#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Coefficients of one edge. a is the congestion slope, b the free-flow time.
struct AffineCost {
  double a {0.0};
  double b {0.0};

  // Travel time of one vehicle when x vehicles use the edge.
  [[nodiscard]] constexpr Cost at(Flow x) const noexcept { return a * x + b; }
  // Total delay of all x vehicles on the edge: x * cost(x) = a*x^2 + b*x.
  [[nodiscard]] constexpr Cost delay(Flow x) const noexcept { return x * at(x); }
  // d/dx of delay(x); the cost one extra vehicle imposes on the system.
  [[nodiscard]] constexpr Cost marginal(Flow x) const noexcept { return 2.0 * a * x + b; }
};

// Coefficients of edge e; throws ValueError if e is out of range.
[[nodiscard]] AffineCost edge_cost_function(const CostDiGraph& g, EdgeId e);

[[nodiscard]] Cost edge_cost(const CostDiGraph& g, EdgeId e, Flow flow);
[[nodiscard]] Cost edge_delay(const CostDiGraph& g, EdgeId e, Flow flow);
[[nodiscard]] Cost edge_marginal_cost(const CostDiGraph& g, EdgeId e, Flow flow);

} // namespace trafficeq::core
