#include <gtest/gtest.h>
#include <span>
#include <vector>
#include "trafficeq/core/cost_digraph.hpp"
#include "trafficeq/core/traffic_analysis.hpp"

using namespace trafficeq::core;

TEST(TrafficSmoke, CongestedChainAgainstFixedBypass) {
  // 0 -> 1 -> 2 costs 1.5x + 10, the bypass 0 -> 2 a flat 20.
  // Optimum: 3x + 10 == 20 -> x = 10/3; equal split sends 5 each way.
  std::int32_t src[3] = {0, 1, 0};
  std::int32_t dst[3] = {1, 2, 2};
  double a[3] = {1.0, 0.5, 0.0};
  double b[3] = {0.0, 10.0, 20.0};
  auto g = CostDiGraph::from_arrays(3,
      std::span<const std::int32_t>(src, 3),
      std::span<const std::int32_t>(dst, 3),
      std::span<const double>(a, 3),
      std::span<const double>(b, 3));

  auto report = analyze_traffic(g, "0", "2", 10.0);
  ASSERT_TRUE(report.has_route());
  ASSERT_EQ(report.paths.size(), 2u);
  EXPECT_EQ(report.paths[0].edges, (std::vector<EdgeId>{0, 1}));
  EXPECT_EQ(report.paths[1].edges, (std::vector<EdgeId>{2}));

  EXPECT_NEAR(report.social_optimum.path_flows[0], 10.0 / 3.0, 1e-6);
  EXPECT_NEAR(report.social_optimum.path_flows[1], 20.0 / 3.0, 1e-6);
  EXPECT_NEAR(report.social_optimum.total_cost, 550.0 / 3.0, 1e-6);
  EXPECT_NEAR(report.nash_equilibrium.total_cost, 187.5, 1e-9);
  EXPECT_NEAR(report.price_of_anarchy(), 187.5 / (550.0 / 3.0), 1e-9);
}
