#include "trafficeq/core/flow_aggregation.hpp"
#include "trafficeq/core/error.hpp"

#include <string>

namespace trafficeq::core {

EdgeFlowMap flows_to_edge_flows(std::span<const Path> paths,
                                std::span<const Flow> path_flows) {
  if (paths.size() != path_flows.size()) {
    throw ValueError("flows_to_edge_flows: expected " + std::to_string(paths.size()) +
                     " path flows, got " + std::to_string(path_flows.size()));
  }
  EdgeFlowMap edge_flows;
  // Seed every referenced edge so unused ones still report 0.
  for (auto const& p : paths) {
    for (auto e : p.edges) edge_flows.emplace(e, 0.0);
  }
  for (std::size_t i = 0; i < paths.size(); ++i) {
    const Flow f = path_flows[i];
    for (auto e : paths[i].edges) edge_flows[e] += f;
  }
  return edge_flows;
}

} // namespace trafficeq::core
