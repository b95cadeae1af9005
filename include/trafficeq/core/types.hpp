/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId/EdgeId: int32 (matches np.int32)
 * - Flow/Cost: double (matches np.float64)
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 * - std::map<K, V>: ordered dict (iteration order is sorted by key)
 */
#pragma once

#include <cstdint>
#include <map>
#include <vector>

namespace trafficeq::core {

// Node and edge identifiers are signed 32-bit integers.
using NodeId = std::int32_t;
using EdgeId = std::int32_t;
using Flow   = double;   // Vehicles per unit time on a path or edge
using Cost   = double;   // Travel time / delay (affine in flow)

// A simple path: nodes[0] is the origin, nodes.back() the destination.
// edges[i] is the edge taken from nodes[i] to nodes[i+1], so
// edges.size() == nodes.size() - 1. Parallel edges produce distinct paths.
struct Path {
  std::vector<NodeId> nodes;
  std::vector<EdgeId> edges;
  friend bool operator==(const Path& a, const Path& b) noexcept {
    return a.nodes == b.nodes && a.edges == b.edges;
  }
};

// One entry per enumerated path, indexed in enumeration order.
using PathFlows = std::vector<Flow>;

// Total flow per edge. Keys are exactly the edges referenced by some path;
// ordered so that iteration (and therefore cost summation) is deterministic.
using EdgeFlowMap = std::map<EdgeId, Flow>;

} // namespace trafficeq::core
