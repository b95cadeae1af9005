/* Path flows -> edge flows. */
#pragma once

#include <span>
#include <vector>

#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Sum the flow of every path over the edges it traverses.
// Every edge referenced by at least one path is present in the result (0 when
// all paths through it carry no flow); edges on no path are absent.
// path_flows[i] belongs to paths[i]; throws ValueError on a length mismatch.
[[nodiscard]] EdgeFlowMap flows_to_edge_flows(std::span<const Path> paths,
                                              std::span<const Flow> path_flows);

} // namespace trafficeq::core
