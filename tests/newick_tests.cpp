#include "newick.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace lineage {

// Parsing
// =======

TEST(Newick_test, parse_with_lengths) {
  auto topology = parse_newick("((a:1,b:2)x:0.5,c:3e-1)r;");

  auto expected = Raw_topology{};
  expected.add_node("r");
  expected.add_node("x");
  expected.add_edge("r", "x", 0.5);
  expected.add_node("a");
  expected.add_edge("x", "a", 1.0);
  expected.add_node("b");
  expected.add_edge("x", "b", 2.0);
  expected.add_node("c");
  expected.add_edge("r", "c", 0.3);

  EXPECT_THAT(topology.nodes, testing::ElementsAreArray(expected.nodes));
  EXPECT_THAT(topology.edges, testing::SizeIs(4));
  for (auto i = 0; i != 4; ++i) {
    EXPECT_THAT(topology.edges[i].parent, testing::StrEq(expected.edges[i].parent));
    EXPECT_THAT(topology.edges[i].child, testing::StrEq(expected.edges[i].child));
    ASSERT_TRUE(topology.edges[i].length.has_value());
    EXPECT_THAT(*topology.edges[i].length, testing::DoubleEq(*expected.edges[i].length));
  }
}

TEST(Newick_test, parse_without_lengths) {
  auto topology = parse_newick("(a,(b,c)y)r");  // Final ';' is optional

  EXPECT_THAT(topology.nodes, testing::ElementsAre("r", "a", "y", "b", "c"));
  for (const auto& edge : topology.edges) {
    EXPECT_FALSE(edge.length.has_value());
  }
}

TEST(Newick_test, unnamed_nodes) {
  EXPECT_THAT(parse_newick("((a,b),(c,d));").nodes,
              testing::ElementsAre("node0", "node1", "a", "b", "node2", "c", "d"));

  // Generated names steer clear of given ones
  EXPECT_THAT(parse_newick("((node0,b),node2);").nodes,
              testing::ElementsAre("node1", "node3", "node0", "b", "node2"));
}

TEST(Newick_test, quoted_labels) {
  auto topology = parse_newick("('it''s a':1,'x(y),z')'root [r]';");

  EXPECT_THAT(topology.nodes, testing::ElementsAre("root [r]", "it's a", "x(y),z"));
  EXPECT_THAT(topology.edges[0].parent, testing::StrEq("root [r]"));
  EXPECT_THAT(topology.edges[0].length, testing::Optional(1.0));
}

TEST(Newick_test, whitespace_and_comments) {
  auto topology = parse_newick(" ( a [a comment] ,\n\tb:2 [another] ) [&&NHX:x=1] r ; ");

  EXPECT_THAT(topology.nodes, testing::ElementsAre("r", "a", "b"));
  EXPECT_THAT(topology.edges[1].length, testing::Optional(2.0));
}

TEST(Newick_test, single_node) {
  EXPECT_THAT(parse_newick("solo;").nodes, testing::ElementsAre("solo"));
  EXPECT_THAT(parse_newick("solo;").edges, testing::IsEmpty());
  EXPECT_THAT(parse_newick(";").nodes, testing::ElementsAre("node0"));
}

TEST(Newick_test, parse_errors) {
  EXPECT_THROW(parse_newick(""), std::runtime_error);
  EXPECT_THROW(parse_newick("   [only a comment]  "), std::runtime_error);
  EXPECT_THROW(parse_newick("(a,b"), std::runtime_error);
  EXPECT_THROW(parse_newick("(a,b));"), std::runtime_error);
  EXPECT_THROW(parse_newick("(a:,b);"), std::runtime_error);
  EXPECT_THROW(parse_newick("(a:x,b);"), std::runtime_error);
  EXPECT_THROW(parse_newick("(a,b)r; (c,d)s;"), std::runtime_error);
  EXPECT_THROW(parse_newick("('unterminated,b);"), std::runtime_error);
  EXPECT_THROW(parse_newick("(a,b) [unterminated"), std::runtime_error);
  EXPECT_THROW(parse_newick("(a,b)]"), std::runtime_error);
}

// Writing
// =======

class Newick_writer_test : public testing::Test {
 protected:
  //               r
  //            /     \       .
  //          x        c
  //        /   \             .
  //       a     y
  //            / \           .
  //           b   d
  Lineage_tree tree{};

  Newick_writer_test() {
    auto topology = Raw_topology{};
    topology.add_edge("r", "x", 1.0);
    topology.add_edge("r", "c", 2.0);
    topology.add_edge("x", "a", 2.0);
    topology.add_edge("x", "y", 0.25);
    topology.add_edge("y", "b", 2.0);
    topology.add_edge("y", "d", 1.0);
    tree.populate_tree(topology);
  }
};

TEST_F(Newick_writer_test, topology_only) {
  EXPECT_THAT(tree.get_newick(), testing::StrEq("((a,(b,d)y)x,c)r;"));
}

TEST_F(Newick_writer_test, with_branch_lengths) {
  EXPECT_THAT(tree.get_newick(true), testing::StrEq("((a:2,(b:2,d:1)y:0.25)x:1,c:2)r;"));
  EXPECT_THAT(to_newick(tree, true), testing::StrEq(tree.get_newick(true)));
}

TEST_F(Newick_writer_test, quotes_special_labels) {
  tree.relabel_nodes({{"a", "cell a"}, {"b", "it's"}, {"y", "y:1"}});

  EXPECT_THAT(tree.get_newick(), testing::StrEq("(('cell a',('it''s',d)'y:1')x,c)r;"));
}

TEST_F(Newick_writer_test, rejects_commas) {
  tree.relabel_nodes({{"a", "a,b"}});

  EXPECT_THROW(tree.get_newick(), Tree_validation_error);
}

TEST(Newick_writer_single_node_test, single_node) {
  auto tree = Lineage_tree{};
  tree.populate_tree("only;");

  EXPECT_THAT(tree.get_newick(true), testing::StrEq("only;"));
}

// Round trips through Lineage_tree
// ================================

TEST_F(Newick_writer_test, round_trip) {
  tree.relabel_nodes({{"b", "it's b"}, {"c", "c [x]"}});

  auto copy = Lineage_tree{};
  copy.populate_tree(tree.get_newick(true));

  EXPECT_THAT(copy.root(), testing::StrEq("r"));
  EXPECT_THAT(copy.edges(), testing::UnorderedElementsAreArray(tree.edges()));
  for (const auto& node : tree.nodes()) {
    EXPECT_THAT(copy.get_time(node), testing::DoubleEq(tree.get_time(node))) << node;
  }
  EXPECT_THAT(copy.get_newick(true), testing::StrEq(tree.get_newick(true)));
}

TEST(Newick_populate_test, unnamed_nodes_and_default_lengths) {
  auto tree = Lineage_tree{};
  tree.populate_tree("((a,b):2,c:0.5);");

  EXPECT_THAT(tree.root(), testing::StrEq("node0"));
  EXPECT_THAT(tree.internal_nodes(), testing::ElementsAre("node0", "node1"));
  EXPECT_THAT(tree.get_time("a"), testing::DoubleEq(3.0));
  EXPECT_THAT(tree.get_time("c"), testing::DoubleEq(0.5));
  EXPECT_THAT(tree.find_lca({"a", "b"}), testing::StrEq("node1"));
  assert_lineage_tree_integrity(tree, true);
}

TEST(Newick_populate_test, invalid_trees) {
  auto tree = Lineage_tree{};

  EXPECT_THROW(tree.populate_tree("(a,b"), std::runtime_error);
  EXPECT_THROW(tree.populate_tree("(a,a)r;"), Tree_validation_error);
  EXPECT_THROW(tree.populate_tree("(a:-1,b)r;"), Tree_validation_error);
  EXPECT_THROW(tree.populate_tree("(a,'')r;"), Tree_validation_error);
  EXPECT_FALSE(tree.is_initialized());
}

}  // namespace lineage
