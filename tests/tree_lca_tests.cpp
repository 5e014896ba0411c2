#include "tree_lca.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace lineage {

class Tree_lca_test : public testing::Test {
 protected:
  //              0
  //            /   \              .
  //           1     2
  //          / \   / | \          .
  //         3   4 5  6  7
  //        / \                    .
  //       8   9
  Tree<Nary_node> tree{10};

  Tree_lca_test() {
    tree.root = 0;
    link(0, 1); link(0, 2);
    link(1, 3); link(1, 4);
    link(2, 5); link(2, 6); link(2, 7);
    link(3, 8); link(3, 9);
    assert_tree_integrity(tree, true);
  }

  auto link(Node_index parent, Node_index child) -> void {
    tree.at(parent).children.push_back(child);
    tree.at(child).parent = parent;
  }

  // Naive reference: walk up from both nodes
  auto slow_lca(Node_index u, Node_index v) const -> Node_index {
    auto ancestors_of_u = Node_set{};
    for (auto a = u; a != k_no_node; a = tree.at(a).parent) {
      ancestors_of_u.insert(a);
    }
    for (auto a = v; a != k_no_node; a = tree.at(a).parent) {
      if (ancestors_of_u.contains(a)) { return a; }
    }
    return k_no_node;
  }
};

TEST_F(Tree_lca_test, no_pairs) {
  EXPECT_THAT(find_lcas_offline(tree, {}), testing::IsEmpty());
}

TEST_F(Tree_lca_test, simple_pairs) {
  auto lcas = find_lcas_offline(tree, {{8, 9}, {8, 4}, {9, 7}, {5, 7}, {6, 6}});
  EXPECT_THAT(lcas, testing::ElementsAre(3, 1, 0, 2, 6));
}

TEST_F(Tree_lca_test, ancestor_and_descendant) {
  auto lcas = find_lcas_offline(tree, {{1, 9}, {9, 1}, {0, 5}, {3, 8}});
  EXPECT_THAT(lcas, testing::ElementsAre(1, 1, 0, 3));
}

TEST_F(Tree_lca_test, all_pairs_match_naive_walk) {
  auto pairs = std::vector<std::pair<Node_index, Node_index>>{};
  for (auto u = 0; u != tree.size(); ++u) {
    for (auto v = 0; v != tree.size(); ++v) {
      pairs.emplace_back(u, v);
    }
  }

  auto lcas = find_lcas_offline(tree, pairs);
  ASSERT_THAT(lcas, testing::SizeIs(pairs.size()));
  for (auto k = 0; k != std::ssize(pairs); ++k) {
    const auto& [u, v] = pairs[k];
    EXPECT_THAT(lcas[k], testing::Eq(slow_lca(u, v))) << u << ", " << v;
  }
}

}  // namespace lineage
