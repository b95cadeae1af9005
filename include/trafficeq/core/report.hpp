/* Rendering of an AnalysisReport: Graphviz DOT and a plain-text summary. */
#pragma once

#include <ostream>
#include <string>

#include "trafficeq/core/cost_digraph.hpp"
#include "trafficeq/core/traffic_analysis.hpp"

namespace trafficeq::core {

// Human-readable label of a path, e.g. "S -> A -> T".
[[nodiscard]] std::string format_path(const CostDiGraph& g, const Path& p);

// Graphviz digraph of g. Each edge is labelled with its cost function and
// the optimum/Nash flows; edges carrying flow under either policy are bold.
// The graph label carries both social costs, or "no route" when src cannot
// reach dst.
void write_dot(std::ostream& os, const AnalysisReport& report, const CostDiGraph& g);

// Per-path and per-edge comparison table followed by both totals and the
// price of anarchy.
void write_text_report(std::ostream& os, const AnalysisReport& report, const CostDiGraph& g);

} // namespace trafficeq::core
