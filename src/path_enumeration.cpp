/*
  Simple-path enumeration.

  Depth-first search from the origin with an on-path marker per node, so a
  node is never revisited within one path while remaining usable by sibling
  branches. Out-edges are explored in CSR order (construction order), which
  makes the resulting path order stable across calls.
*/
#include "trafficeq/core/path_enumeration.hpp"
#include "trafficeq/core/error.hpp"

#include <string>
#include <utility>

namespace trafficeq::core {

namespace {

struct DfsState {
  const CostDiGraph& g;
  NodeId dst;
  std::optional<std::int64_t> max_paths;
  std::vector<unsigned char> on_path;
  std::vector<NodeId> nodes;
  std::vector<EdgeId> edges;
  std::vector<Path> out;

  [[nodiscard]] bool full() const noexcept {
    return max_paths && static_cast<std::int64_t>(out.size()) >= *max_paths;
  }
};

void dfs_paths(DfsState& st, NodeId u) {
  if (u == st.dst) {
    st.out.push_back(Path{st.nodes, st.edges});
    return;
  }
  const auto row = st.g.row_offsets_view();
  const auto col = st.g.col_indices_view();
  const auto aei = st.g.adj_edge_index_view();
  auto s = static_cast<std::size_t>(row[static_cast<std::size_t>(u)]);
  auto e = static_cast<std::size_t>(row[static_cast<std::size_t>(u) + 1]);
  for (std::size_t j = s; j < e; ++j) {
    if (st.full()) return;
    NodeId v = col[j];
    if (st.on_path[static_cast<std::size_t>(v)]) continue;
    st.on_path[static_cast<std::size_t>(v)] = 1;
    st.nodes.push_back(v);
    st.edges.push_back(aei[j]);
    dfs_paths(st, v);
    st.edges.pop_back();
    st.nodes.pop_back();
    st.on_path[static_cast<std::size_t>(v)] = 0;
  }
}

} // namespace

std::vector<Path> enumerate_paths(const CostDiGraph& g, NodeId src, NodeId dst,
                                  const PathEnumerationOptions& opts) {
  const NodeId N = g.num_nodes();
  if (src < 0 || src >= N) {
    throw NotFoundError("start node id " + std::to_string(src) + " is not in the graph");
  }
  if (dst < 0 || dst >= N) {
    throw NotFoundError("end node id " + std::to_string(dst) + " is not in the graph");
  }
  if (opts.max_paths && *opts.max_paths <= 0) return {};

  DfsState st{g, dst, opts.max_paths, {}, {}, {}, {}};
  st.on_path.assign(static_cast<std::size_t>(N), 0);
  st.on_path[static_cast<std::size_t>(src)] = 1;
  st.nodes.push_back(src);
  dfs_paths(st, src);
  return std::move(st.out);
}

std::vector<Path> enumerate_paths(const CostDiGraph& g, std::string_view src, std::string_view dst,
                                  const PathEnumerationOptions& opts) {
  NodeId s = require_node(g, src, "start");
  NodeId t = require_node(g, dst, "end");
  return enumerate_paths(g, s, t, opts);
}

NodeId require_node(const CostDiGraph& g, std::string_view name, std::string_view role) {
  auto v = g.find_node(name);
  if (!v) {
    throw NotFoundError(std::string(role) + " node '" + std::string(name) + "' is not in the graph");
  }
  return *v;
}

} // namespace trafficeq::core
