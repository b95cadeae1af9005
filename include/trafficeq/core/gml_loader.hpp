/* GML graph loader producing a CostDiGraph. */
#pragma once

#include <string>
#include <string_view>

#include "trafficeq/core/cost_digraph.hpp"

namespace trafficeq::core {

// Parse a GML document of the form NetworkX writes:
//
//   graph [
//     directed 1
//     node [ id 0 label "S" ]
//     node [ id 1 label "T" ]
//     edge [ source 0 target 1 a 1.0 b 0.0 ]
//   ]
//
// Node names are labels when present, otherwise the decimal id. Every edge
// needs numeric, non-negative `a` and `b`. Unknown keys and nested lists are
// ignored. Throws GraphLoadError with a line number on malformed input.
[[nodiscard]] CostDiGraph parse_gml(std::string_view text);

// Read and parse a GML file; unreadable files raise GraphLoadError.
[[nodiscard]] CostDiGraph load_gml(const std::string& path);

} // namespace trafficeq::core
