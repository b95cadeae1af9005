#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include "trafficeq/core/error.hpp"
#include "trafficeq/core/gml_loader.hpp"
#include "trafficeq/core/path_enumeration.hpp"

using namespace trafficeq::core;

namespace {

// As written by networkx.write_gml for a DiGraph with a/b edge attributes.
const char* kPigouGml = R"(graph [
  directed 1
  node [
    id 0
    label "S"
  ]
  node [
    id 1
    label "T"
  ]
  edge [
    source 0
    target 1
    a 1.0
    b 0.0
  ]
  edge [
    source 0
    target 1
    a 0
    b 10
  ]
]
)";

} // namespace

TEST(GmlLoader, ParsesNetworkxOutput) {
  auto g = parse_gml(kPigouGml);
  EXPECT_EQ(g.num_nodes(), 2);
  EXPECT_EQ(g.num_edges(), 2);
  EXPECT_EQ(g.node_name(0), "S");
  EXPECT_EQ(g.node_name(1), "T");
  EXPECT_DOUBLE_EQ(g.coeff_a_view()[0], 1.0);
  EXPECT_DOUBLE_EQ(g.coeff_b_view()[1], 10.0);
  EXPECT_EQ(enumerate_paths(g, "S", "T").size(), 2u);
}

TEST(GmlLoader, UnlabelledNodesUseIds) {
  auto g = parse_gml("graph [ directed 1 node [ id 7 ] node [ id 3 ] "
                     "edge [ source 7 target 3 a 2 b 1 ] ]");
  ASSERT_TRUE(g.find_node("7").has_value());
  ASSERT_TRUE(g.find_node("3").has_value());
  EXPECT_EQ(g.edge_src(0), *g.find_node("7"));
  EXPECT_EQ(g.edge_dst(0), *g.find_node("3"));
}

TEST(GmlLoader, IgnoresCommentsAndUnknownKeys) {
  auto g = parse_gml("# road network\n"
                     "Creator \"hand\"\n"
                     "graph [\n"
                     "  directed 1\n"
                     "  name \"demo\"\n"
                     "  node [ id 0 label \"A\" graphics [ x 1.5 y -2 ] ]\n"
                     "  node [ id 1 label \"B\" ]\n"
                     "  edge [ source 0 target 1 key 0 a 0.5 b 3e1 ]  # comment\n"
                     "]\n");
  EXPECT_EQ(g.num_edges(), 1);
  EXPECT_DOUBLE_EQ(g.coeff_b_view()[0], 30.0);
}

TEST(GmlLoader, CyclesAreAccepted) {
  auto g = parse_gml("graph [ directed 1 node [ id 0 ] node [ id 1 ] "
                     "edge [ source 0 target 1 a 1 b 0 ] edge [ source 1 target 0 a 1 b 0 ] ]");
  EXPECT_EQ(g.num_edges(), 2);
}

TEST(GmlLoader, RejectsUndirectedGraph) {
  EXPECT_THROW((void)parse_gml("graph [ node [ id 0 ] ]"), GraphLoadError);
  EXPECT_THROW((void)parse_gml("graph [ directed 0 node [ id 0 ] ]"), GraphLoadError);
}

TEST(GmlLoader, RejectsMissingGraphBlock) {
  EXPECT_THROW((void)parse_gml("node [ id 0 ]"), GraphLoadError);
  EXPECT_THROW((void)parse_gml(""), GraphLoadError);
}

TEST(GmlLoader, RejectsMissingCoefficients) {
  EXPECT_THROW((void)parse_gml("graph [ directed 1 node [ id 0 ] node [ id 1 ] "
                               "edge [ source 0 target 1 a 1 ] ]"),
               GraphLoadError);
  EXPECT_THROW((void)parse_gml("graph [ directed 1 node [ id 0 ] node [ id 1 ] "
                               "edge [ source 0 target 1 a \"fast\" b 1 ] ]"),
               GraphLoadError);
}

TEST(GmlLoader, RejectsNegativeCoefficients) {
  EXPECT_THROW((void)parse_gml("graph [ directed 1 node [ id 0 ] node [ id 1 ] "
                               "edge [ source 0 target 1 a -1 b 1 ] ]"),
               GraphLoadError);
}

TEST(GmlLoader, RejectsUnknownEndpoint) {
  EXPECT_THROW((void)parse_gml("graph [ directed 1 node [ id 0 ] "
                               "edge [ source 0 target 5 a 1 b 1 ] ]"),
               GraphLoadError);
}

TEST(GmlLoader, RejectsDuplicateIdsAndLabels) {
  EXPECT_THROW((void)parse_gml("graph [ directed 1 node [ id 0 ] node [ id 0 ] ]"), GraphLoadError);
  EXPECT_THROW((void)parse_gml("graph [ directed 1 node [ id 0 label \"X\" ] node [ id 1 label \"X\" ] ]"),
               GraphLoadError);
}

TEST(GmlLoader, RejectsUnbalancedBrackets) {
  EXPECT_THROW((void)parse_gml("graph [ directed 1 node [ id 0 ]"), GraphLoadError);
  EXPECT_THROW((void)parse_gml("graph [ directed 1 ] ]"), GraphLoadError);
}

TEST(GmlLoader, ErrorsCarryLineNumbers) {
  try {
    (void)parse_gml("graph [\n directed 1\n node [ id 0 ]\n edge [ source 0 target 9 a 1 b 1 ]\n]\n");
    FAIL() << "expected GraphLoadError";
  } catch (const GraphLoadError& e) {
    EXPECT_NE(std::string(e.what()).find("line 4"), std::string::npos) << e.what();
  }
}

TEST(GmlLoader, LoadsFromFile) {
  const std::string path = ::testing::TempDir() + "trafficeq_pigou.gml";
  {
    std::ofstream out(path);
    out << kPigouGml;
  }
  auto g = load_gml(path);
  EXPECT_EQ(g.num_edges(), 2);
  std::remove(path.c_str());
}

TEST(GmlLoader, MissingFileThrows) {
  EXPECT_THROW((void)load_gml("/nonexistent/dir/graph.gml"), GraphLoadError);
}
