#include <gtest/gtest.h>
#include <vector>
#include "trafficeq/core/error.hpp"
#include "trafficeq/core/flow_aggregation.hpp"
#include "trafficeq/core/path_enumeration.hpp"
#include "test_utils.hpp"

using namespace trafficeq::core;
using namespace trafficeq::core::test;

TEST(FlowAggregation, SharedEdgesAccumulate) {
  auto g = make_braess_graph(true);
  auto paths = enumerate_paths(g, "S", "T");  // S-A-T, S-A-B-T, S-B-T
  ASSERT_EQ(paths.size(), 3u);
  std::vector<Flow> flows{1.0, 2.0, 4.0};
  auto ef = flows_to_edge_flows(paths, flows);
  ASSERT_EQ(ef.size(), 5u);
  EXPECT_DOUBLE_EQ(ef.at(0), 3.0);  // S->A
  EXPECT_DOUBLE_EQ(ef.at(1), 1.0);  // A->T
  EXPECT_DOUBLE_EQ(ef.at(2), 4.0);  // S->B
  EXPECT_DOUBLE_EQ(ef.at(3), 6.0);  // B->T
  EXPECT_DOUBLE_EQ(ef.at(4), 2.0);  // A->B
}

TEST(FlowAggregation, UnusedReferencedEdgesReportZero) {
  auto g = make_parallel_paths({{1.0, 0.0}, {0.0, 10.0}});
  auto paths = enumerate_paths(g, "S", "T");
  std::vector<Flow> flows{0.0, 7.0};
  auto ef = flows_to_edge_flows(paths, flows);
  ASSERT_EQ(ef.size(), 4u);
  EXPECT_DOUBLE_EQ(ef.at(0), 0.0);
  EXPECT_DOUBLE_EQ(ef.at(1), 0.0);
  EXPECT_DOUBLE_EQ(ef.at(2), 7.0);
  EXPECT_DOUBLE_EQ(ef.at(3), 7.0);
}

TEST(FlowAggregation, EdgesOffAllPathsAreAbsent) {
  // Braess without the shortcut edge reachable: restrict to the first path only
  auto g = make_braess_graph(true);
  auto paths = enumerate_paths(g, "S", "T");
  std::vector<Path> first{paths[0]};
  std::vector<Flow> flows{5.0};
  auto ef = flows_to_edge_flows(first, flows);
  EXPECT_EQ(ef.size(), 2u);
  EXPECT_EQ(ef.count(4), 0u);
  EXPECT_EQ(ef.count(2), 0u);
}

TEST(FlowAggregation, IdempotentOnRepeatedCalls) {
  auto g = make_grid_graph(3, 3);
  auto paths = enumerate_paths(g, 0, 8);
  std::vector<Flow> flows(paths.size());
  for (std::size_t i = 0; i < flows.size(); ++i) flows[i] = 0.5 * static_cast<double>(i + 1);
  auto first = flows_to_edge_flows(paths, flows);
  auto second = flows_to_edge_flows(paths, flows);
  EXPECT_EQ(first, second);
}

TEST(FlowAggregation, EmptyPathSetGivesEmptyMapping) {
  std::vector<Path> paths;
  std::vector<Flow> flows;
  EXPECT_TRUE(flows_to_edge_flows(paths, flows).empty());
}

TEST(FlowAggregation, LengthMismatchThrows) {
  auto g = make_braess_graph(false);
  auto paths = enumerate_paths(g, "S", "T");
  std::vector<Flow> flows{1.0};
  EXPECT_THROW((void)flows_to_edge_flows(paths, flows), ValueError);
}
