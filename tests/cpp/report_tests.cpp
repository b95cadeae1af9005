#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "trafficeq/core/path_enumeration.hpp"
#include "trafficeq/core/report.hpp"
#include "trafficeq/core/traffic_analysis.hpp"
#include "test_utils.hpp"

using namespace trafficeq::core;
using namespace trafficeq::core::test;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(Report, FormatPathUsesNodeNames) {
  auto g = make_braess_graph(false);
  auto paths = enumerate_paths(g, "S", "T");
  ASSERT_EQ(paths.size(), 2u);
  EXPECT_EQ(format_path(g, paths[0]), "S -> A -> T");
  EXPECT_EQ(format_path(g, paths[1]), "S -> B -> T");
}

TEST(Report, DotDrawsEveryEdgeWithBothFlows) {
  auto g = make_braess_graph(true);
  auto rep = analyze_traffic(g, "S", "T", 4000.0);
  std::ostringstream os;
  write_dot(os, rep, g);
  const std::string dot = os.str();
  EXPECT_TRUE(contains(dot, "digraph traffic {"));
  EXPECT_TRUE(contains(dot, "n0 [label=\"S\", shape=doublecircle]"));
  EXPECT_TRUE(contains(dot, "n1 [label=\"A\"]"));
  EXPECT_TRUE(contains(dot, "n1 -> n2"));
  EXPECT_TRUE(contains(dot, "opt 1750.000"));
  EXPECT_TRUE(contains(dot, "nash 1333.333"));
  EXPECT_TRUE(contains(dot, "style=bold"));
  EXPECT_TRUE(contains(dot, "social optimum cost 2587"));
  EXPECT_EQ(dot.back(), '\n');
}

TEST(Report, DotUnusedEdgeIsNotBold) {
  // T->S and X->T lie on no S->T path.
  std::vector<NodeId> src{0, 1, 2};
  std::vector<NodeId> dst{1, 0, 1};
  std::vector<double> a{1.0, 1.0, 1.0};
  std::vector<double> b{0.0, 0.0, 0.0};
  auto g = CostDiGraph::from_arrays({"S", "T", "X"}, src, dst, a, b);
  auto rep = analyze_traffic(g, "S", "T", 5.0);
  std::ostringstream os;
  write_dot(os, rep, g);
  const std::string dot = os.str();
  EXPECT_TRUE(contains(dot, "n0 -> n1 [label=\"1.00x+0.00\\nopt 5.000\\nnash 5.000\", style=bold]"));
  EXPECT_TRUE(contains(dot, "n2 -> n1 [label=\"1.00x+0.00\\nopt 0.000\\nnash 0.000\"]"));
}

TEST(Report, DotReportsMissingRoute) {
  auto g = make_disconnected_graph();
  auto rep = analyze_traffic(g, "S", "T", 10.0);
  std::ostringstream os;
  write_dot(os, rep, g);
  const std::string dot = os.str();
  EXPECT_TRUE(contains(dot, "no route from S to T"));
  EXPECT_FALSE(contains(dot, "style=bold"));
}

TEST(Report, TextSummaryListsPathsAndCosts) {
  auto g = make_parallel_paths({{1.0, 0.0}, {0.0, 10.0}, {2.0, 2.0}});
  auto rep = analyze_traffic(g, "S", "T", 10.0);
  std::ostringstream os;
  write_text_report(os, rep, g);
  const std::string txt = os.str();
  EXPECT_TRUE(contains(txt, "Route S -> T, demand 10.00"));
  EXPECT_TRUE(contains(txt, "Paths (3):"));
  EXPECT_TRUE(contains(txt, "[0] S -> M0 -> T"));
  EXPECT_TRUE(contains(txt, "Social optimum cost: 67.000"));
  EXPECT_TRUE(contains(txt, "Nash equilibrium cost: 73.333"));
  EXPECT_TRUE(contains(txt, "Price of anarchy: 1.0945"));
}

TEST(Report, TextSummaryForMissingRoute) {
  auto g = make_disconnected_graph();
  auto rep = analyze_traffic(g, "S", "T", 10.0);
  std::ostringstream os;
  write_text_report(os, rep, g);
  const std::string txt = os.str();
  EXPECT_TRUE(contains(txt, "No route: T is unreachable from S"));
  EXPECT_TRUE(contains(txt, "Social optimum cost: 0.000"));
  EXPECT_FALSE(contains(txt, "Price of anarchy"));
}
