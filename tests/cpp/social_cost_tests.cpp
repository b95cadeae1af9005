#include <gtest/gtest.h>
#include <vector>
#include "trafficeq/core/flow_aggregation.hpp"
#include "trafficeq/core/path_enumeration.hpp"
#include "trafficeq/core/social_cost.hpp"
#include "test_utils.hpp"

using namespace trafficeq::core;
using namespace trafficeq::core::test;

TEST(SocialCost, EmptyMappingCostsNothing) {
  auto g = make_line_graph(3);
  EXPECT_DOUBLE_EQ(total_cost(EdgeFlowMap{}, g), 0.0);
}

TEST(SocialCost, SumsFlowTimesCost) {
  // x1^2 + 10*x2 at x = (5, 5)
  auto g = make_parallel_edges({{1.0, 0.0}, {0.0, 10.0}});
  EdgeFlowMap ef{{0, 5.0}, {1, 5.0}};
  EXPECT_DOUBLE_EQ(total_cost(ef, g), 75.0);
}

TEST(SocialCost, ComposedObjectiveMatchesTwoStepEvaluation) {
  auto g = make_braess_graph(true);
  auto paths = enumerate_paths(g, "S", "T");
  std::vector<Flow> flows{1750.0, 500.0, 1750.0};
  auto ef = flows_to_edge_flows(paths, flows);
  EXPECT_DOUBLE_EQ(total_cost_of_path_flows(paths, flows, g), total_cost(ef, g));
  EXPECT_NEAR(total_cost(ef, g), 258750.0, 1e-6);
}

TEST(SocialCost, PathTravelTimesSumEdgeCosts) {
  auto g = make_braess_graph(true);
  auto paths = enumerate_paths(g, "S", "T");
  // Everyone on the shortcut: S-A and B-T each carry 4000 -> 40 + 0 + 40
  std::vector<Flow> flows{0.0, 4000.0, 0.0};
  auto ef = flows_to_edge_flows(paths, flows);
  auto times = path_travel_times(paths, ef, g);
  ASSERT_EQ(times.size(), 3u);
  EXPECT_NEAR(times[0], 40.0 + 45.0, 1e-9);
  EXPECT_NEAR(times[1], 80.0, 1e-9);
  EXPECT_NEAR(times[2], 45.0 + 40.0, 1e-9);
}

TEST(SocialCost, MarginalCostsAreObjectiveGradient) {
  auto g = make_braess_graph(true);
  auto paths = enumerate_paths(g, "S", "T");
  std::vector<Flow> flows{1000.0, 1500.0, 1500.0};
  auto grad = path_marginal_costs(paths, flows, g);
  ASSERT_EQ(grad.size(), flows.size());
  const double h = 1e-3;
  for (std::size_t i = 0; i < flows.size(); ++i) {
    auto up = flows;
    auto down = flows;
    up[i] += h;
    down[i] -= h;
    const double fd = (total_cost_of_path_flows(paths, up, g) -
                       total_cost_of_path_flows(paths, down, g)) / (2.0 * h);
    EXPECT_NEAR(grad[i], fd, 1e-4) << "path " << i;
  }
}

TEST(SocialCost, HessianSumsSharedCurvature) {
  // Paths S-A-T, S-A-B-T, S-B-T; only S->A and B->T are congestible (a = 0.01)
  auto g = make_braess_graph(true);
  auto paths = enumerate_paths(g, "S", "T");
  ASSERT_EQ(paths.size(), 3u);
  auto h = path_cost_hessian(paths, g);
  const std::vector<double> expected{0.02, 0.02, 0.0,
                                     0.02, 0.04, 0.02,
                                     0.0,  0.02, 0.02};
  ASSERT_EQ(h.size(), expected.size());
  for (std::size_t i = 0; i < h.size(); ++i) EXPECT_NEAR(h[i], expected[i], 1e-15) << "entry " << i;
}

TEST(SocialCost, HessianMatchesMarginalCostDifferences) {
  auto g = make_grid_graph(3, 3);
  auto paths = enumerate_paths(g, NodeId{0}, NodeId{8});
  const std::size_t n = paths.size();
  auto h = path_cost_hessian(paths, g);
  ASSERT_EQ(h.size(), n * n);
  std::vector<Flow> flows(n, 1.0);
  auto base = path_marginal_costs(paths, flows, g);
  for (std::size_t j = 0; j < n; ++j) {
    auto bumped = flows;
    bumped[j] += 1.0;
    auto m = path_marginal_costs(paths, bumped, g);
    for (std::size_t i = 0; i < n; ++i) {
      EXPECT_NEAR(m[i] - base[i], h[i * n + j], 1e-9) << "entry " << i << "," << j;
      EXPECT_DOUBLE_EQ(h[i * n + j], h[j * n + i]);
    }
  }
}
