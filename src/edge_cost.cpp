#include "trafficeq/core/edge_cost.hpp"
#include "trafficeq/core/error.hpp"

#include <string>

namespace trafficeq::core {

AffineCost edge_cost_function(const CostDiGraph& g, EdgeId e) {
  if (e < 0 || e >= g.num_edges()) {
    throw ValueError("edge id " + std::to_string(e) + " out of range");
  }
  auto i = static_cast<std::size_t>(e);
  return AffineCost{g.coeff_a_view()[i], g.coeff_b_view()[i]};
}

Cost edge_cost(const CostDiGraph& g, EdgeId e, Flow flow) {
  return edge_cost_function(g, e).at(flow);
}

Cost edge_delay(const CostDiGraph& g, EdgeId e, Flow flow) {
  return edge_cost_function(g, e).delay(flow);
}

Cost edge_marginal_cost(const CostDiGraph& g, EdgeId e, Flow flow) {
  return edge_cost_function(g, e).marginal(flow);
}

} // namespace trafficeq::core
