/* Simple-path enumeration between one origin and one destination. */
#pragma once

#include <string_view>
#include <vector>

#include "trafficeq/core/cost_digraph.hpp"
#include "trafficeq/core/options.hpp"
#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Enumerate every simple path (no repeated node) from src to dst by
// depth-first search over the CSR adjacency. Output order is deterministic for
// a given graph and is the index basis of every PathFlows vector built from it.
// Parallel edges produce one path each. src == dst yields the single path [src].
// Returns an empty vector when dst is unreachable.
// Throws NotFoundError if src or dst is not a node of g.
[[nodiscard]] std::vector<Path>
enumerate_paths(const CostDiGraph& g, NodeId src, NodeId dst,
                const PathEnumerationOptions& opts = {});

// Same, with endpoints given by node name.
[[nodiscard]] std::vector<Path>
enumerate_paths(const CostDiGraph& g, std::string_view src, std::string_view dst,
                const PathEnumerationOptions& opts = {});

// Resolve a node name; throws NotFoundError naming `role` ("start"/"end").
[[nodiscard]] NodeId require_node(const CostDiGraph& g, std::string_view name,
                                  std::string_view role);

} // namespace trafficeq::core
