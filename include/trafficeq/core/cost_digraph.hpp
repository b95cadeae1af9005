/* Immutable directed multigraph with named nodes, affine edge costs and CSR adjacency. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Notes on identifiers:
// - NodeId is the dense index of a node; the external identifier is its name
//   (an opaque string, e.g. the GML label).
// - EdgeId is the index of an edge in construction order. Parallel edges
//   between the same (u, v) pair are distinct edges.
// - Each edge carries the coefficients of cost(x) = a*x + b with a, b >= 0.

class CostDiGraph {
public:
  [[nodiscard]] static CostDiGraph from_arrays(
      std::vector<std::string> node_names,
      std::span<const NodeId> src,
      std::span<const NodeId> dst,
      std::span<const double> a,
      std::span<const double> b);
  // Nodes are named "0", "1", ..., "num_nodes-1".
  [[nodiscard]] static CostDiGraph from_arrays(
      std::int32_t num_nodes,
      std::span<const NodeId> src,
      std::span<const NodeId> dst,
      std::span<const double> a,
      std::span<const double> b);
  ~CostDiGraph() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(names_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(src_.size()); }

  [[nodiscard]] const std::string& node_name(NodeId v) const;
  [[nodiscard]] std::optional<NodeId> find_node(std::string_view name) const;
  // All edges u->v in EdgeId order (empty when none).
  [[nodiscard]] std::vector<EdgeId> find_edges(NodeId u, NodeId v) const;

  [[nodiscard]] NodeId edge_src(EdgeId e) const { return src_.at(static_cast<std::size_t>(e)); }
  [[nodiscard]] NodeId edge_dst(EdgeId e) const { return dst_.at(static_cast<std::size_t>(e)); }

  [[nodiscard]] std::span<const std::string> node_names_view() const noexcept { return names_; }
  [[nodiscard]] std::span<const NodeId> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeId> edge_dst_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const double> coeff_a_view() const noexcept { return a_; }
  [[nodiscard]] std::span<const double> coeff_b_view() const noexcept { return b_; }
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeId> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const EdgeId> adj_edge_index_view() const noexcept { return adj_edge_index_; }

private:
  std::vector<std::string> names_ {};
  std::unordered_map<std::string, NodeId> index_ {};
  std::vector<NodeId> src_ {};
  std::vector<NodeId> dst_ {};
  std::vector<double> a_ {};
  std::vector<double> b_ {};

  // CSR adjacency; within a row, out-edges keep EdgeId order
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeId> col_indices_ {};
  std::vector<EdgeId> adj_edge_index_ {}; // map CSR entry -> EdgeId
};

} // namespace trafficeq::core
