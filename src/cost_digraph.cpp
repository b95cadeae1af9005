/*
  CostDiGraph: immutable directed multigraph with affine edge costs.

  Construction validates inputs (ids in range, finite non-negative
  coefficients, unique node names) and builds CSR adjacency with a counting
  sort, so out-edges of a node keep their construction order. Path
  enumeration order is therefore a pure function of the input arrays.
*/
#include "trafficeq/core/cost_digraph.hpp"
#include "trafficeq/core/error.hpp"

#include <cmath>
#include <utility>

namespace trafficeq::core {

CostDiGraph CostDiGraph::from_arrays(
    std::vector<std::string> node_names,
    std::span<const NodeId> src,
    std::span<const NodeId> dst,
    std::span<const double> a,
    std::span<const double> b) {

  if (src.size() != dst.size() || src.size() != a.size() || src.size() != b.size()) {
    throw ValueError("src, dst, a, and b must have the same length");
  }
  const auto num_nodes = static_cast<std::int32_t>(node_names.size());
  const std::size_t m = src.size();

  CostDiGraph g;
  g.index_.reserve(node_names.size());
  for (std::size_t i = 0; i < node_names.size(); ++i) {
    auto [it, inserted] = g.index_.emplace(node_names[i], static_cast<NodeId>(i));
    if (!inserted) {
      throw ValueError("duplicate node name: " + node_names[i]);
    }
  }
  g.names_ = std::move(node_names);

  // Invariants: ids within [0, num_nodes), finite non-negative coefficients
  for (std::size_t i = 0; i < m; ++i) {
    if (src[i] < 0 || dst[i] < 0 || src[i] >= num_nodes || dst[i] >= num_nodes) {
      throw ValueError("edge " + std::to_string(i) + " references a node outside [0, num_nodes)");
    }
    if (!std::isfinite(a[i]) || !std::isfinite(b[i])) {
      throw ValueError("edge " + std::to_string(i) + " has a non-finite cost coefficient");
    }
    if (a[i] < 0.0 || b[i] < 0.0) {
      throw ValueError("edge " + std::to_string(i) + " has a negative cost coefficient (need a >= 0, b >= 0)");
    }
  }
  g.src_.assign(src.begin(), src.end());
  g.dst_.assign(dst.begin(), dst.end());
  g.a_.assign(a.begin(), a.end());
  g.b_.assign(b.begin(), b.end());

  // Build CSR adjacency
  g.row_offsets_.assign(static_cast<std::size_t>(num_nodes) + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    g.row_offsets_[static_cast<std::size_t>(g.src_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < g.row_offsets_.size(); ++i) {
    g.row_offsets_[i] += g.row_offsets_[i - 1];
  }
  g.col_indices_.resize(m);
  g.adj_edge_index_.resize(m);
  // We need a copy of offsets to fill in-place
  std::vector<std::int32_t> cursor = g.row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = g.src_[e];
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    g.col_indices_[pos] = g.dst_[e];
    g.adj_edge_index_[pos] = static_cast<EdgeId>(e);
  }
  return g;
}

CostDiGraph CostDiGraph::from_arrays(
    std::int32_t num_nodes,
    std::span<const NodeId> src,
    std::span<const NodeId> dst,
    std::span<const double> a,
    std::span<const double> b) {
  if (num_nodes < 0) {
    throw ValueError("num_nodes must be >= 0");
  }
  std::vector<std::string> names;
  names.reserve(static_cast<std::size_t>(num_nodes));
  for (std::int32_t v = 0; v < num_nodes; ++v) names.push_back(std::to_string(v));
  return from_arrays(std::move(names), src, dst, a, b);
}

const std::string& CostDiGraph::node_name(NodeId v) const {
  if (v < 0 || v >= num_nodes()) {
    throw ValueError("node id " + std::to_string(v) + " out of range");
  }
  return names_[static_cast<std::size_t>(v)];
}

std::optional<NodeId> CostDiGraph::find_node(std::string_view name) const {
  auto it = index_.find(std::string(name));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::vector<EdgeId> CostDiGraph::find_edges(NodeId u, NodeId v) const {
  std::vector<EdgeId> out;
  if (u < 0 || u >= num_nodes()) return out;
  auto s = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u)]);
  auto e = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u) + 1]);
  for (std::size_t j = s; j < e; ++j) {
    if (col_indices_[j] == v) out.push_back(adj_edge_index_[j]);
  }
  return out;
}

} // namespace trafficeq::core
