#include "tree.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace lineage {

struct Test_node : public Nary_node {
  std::string str{};
};

// Builds
//
//          a
//        / | \        .
//       b  c  d
//      / \            .
//     e   f
//
// with index order a, b, c, d, e, f
static auto make_test_tree() -> Tree<Test_node> {
  auto tree = Tree<Test_node>{6};
  auto names = std::vector<std::string>{"a", "b", "c", "d", "e", "f"};
  for (auto i = 0; i != 6; ++i) {
    tree.at(i).str = names[i];
  }
  tree.root = 0;
  tree.at(0).children = {1, 2, 3};
  tree.at(1).parent = 0;
  tree.at(2).parent = 0;
  tree.at(3).parent = 0;
  tree.at(1).children = {4, 5};
  tree.at(4).parent = 1;
  tree.at(5).parent = 1;
  return tree;
}

static auto strs_of(const Tree<Test_node>& tree, auto&& nodes) -> std::vector<std::string> {
  auto result = std::vector<std::string>{};
  for (const auto& node : nodes) {
    result.push_back(tree.at(node).str);
  }
  return result;
}

TEST(Tree_test, nary_empty) {
  auto tree = Tree<Nary_node>{};

  EXPECT_THAT(tree.nodes, testing::IsEmpty());
  EXPECT_THAT(tree.root, testing::Eq(k_no_node));
  assert_tree_integrity(tree, true);
}

TEST(Tree_test, nary_simple) {
  auto tree = Tree<Nary_node>{2};
  auto i = 0;
  auto j = 1;
  auto k = tree.add_node();

  tree.at(i).children = {j, k};
  tree.at(j).parent = i;
  tree.at(k).parent = i;
  tree.root = i;

  assert_tree_integrity(tree, true);

  EXPECT_THAT(tree.size(), testing::Eq(3));
  EXPECT_THAT(tree.at(i).parent, testing::Eq(k_no_node));
  EXPECT_THAT(tree.at(i).children, testing::ElementsAre(1, 2));
  EXPECT_TRUE(tree.at(i).is_inner_node());
  EXPECT_TRUE(tree.at(j).is_tip());
}

TEST(Tree_test, empty_traversals) {
  auto tree = Tree<Test_node>{};

  for (const auto& node : pre_order_traversal(tree)) {
    FAIL() << "Tree is empty" << node;
  }
  for (const auto& node : post_order_traversal(tree)) {
    FAIL() << "Tree is empty" << node;
  }
  for (const auto& node : index_order_traversal(tree)) {
    FAIL() << "Tree is empty" << node;
  }
  for (const auto& [node, children_so_far] : traversal(tree)) {
    FAIL() << "Tree is empty" << node << children_so_far;
  }
}

TEST(Tree_test, nary_traversals) {
  auto tree = make_test_tree();
  assert_tree_integrity(tree, true);

  EXPECT_THAT(strs_of(tree, pre_order_traversal(tree)), testing::ElementsAre("a", "b", "e", "f", "c", "d"));
  EXPECT_THAT(strs_of(tree, post_order_traversal(tree)), testing::ElementsAre("e", "f", "b", "c", "d", "a"));

  auto visits = std::vector<std::string>{};
  for (const auto& [node, children_so_far] : traversal(tree)) {
    visits.push_back(absl::StrFormat("(%s, %d)", tree.at(node).str, children_so_far));
  }
  EXPECT_THAT(visits, testing::ElementsAre(
      "(a, 0)",
      "(b, 0)",
      "(e, 0)",
      "(b, 1)",
      "(f, 0)",
      "(b, 2)",
      "(a, 1)",
      "(c, 0)",
      "(a, 2)",
      "(d, 0)",
      "(a, 3)"));
}

TEST(Tree_test, traversals_from_inner_node) {
  auto tree = make_test_tree();

  EXPECT_THAT(strs_of(tree, pre_order_traversal(tree, 1)), testing::ElementsAre("b", "e", "f"));
  EXPECT_THAT(strs_of(tree, post_order_traversal(tree, 1)), testing::ElementsAre("e", "f", "b"));
  EXPECT_THAT(strs_of(tree, pre_order_traversal(tree, 3)), testing::ElementsAre("d"));
}

TEST(Tree_test, erase_nodes_renumbers_survivors) {
  auto tree = make_test_tree();

  // Detach c from a, then erase it
  std::erase(tree.at(0).children, 2);
  auto old_to_new = erase_nodes(tree, Node_set{2});
  assert_tree_integrity(tree, true);

  EXPECT_THAT(old_to_new, testing::ElementsAre(0, 1, k_no_node, 2, 3, 4));
  EXPECT_THAT(tree.size(), testing::Eq(5));
  EXPECT_THAT(strs_of(tree, index_order_traversal(tree)), testing::ElementsAre("a", "b", "d", "e", "f"));
  EXPECT_THAT(strs_of(tree, pre_order_traversal(tree)), testing::ElementsAre("a", "b", "e", "f", "d"));
  EXPECT_THAT(tree.at(3).parent, testing::Eq(1));
}

TEST(Tree_test, erase_nodes_moves_root) {
  auto tree = make_test_tree();

  // Make b the root, dropping a, c and d
  tree.at(1).parent = k_no_node;
  tree.root = 1;
  erase_nodes(tree, Node_set{0, 2, 3});
  assert_tree_integrity(tree, true);

  EXPECT_THAT(tree.root, testing::Eq(0));
  EXPECT_THAT(strs_of(tree, pre_order_traversal(tree)), testing::ElementsAre("b", "e", "f"));
}

TEST(Tree_test, erase_nothing) {
  auto tree = make_test_tree();
  auto old_to_new = erase_nodes(tree, Node_set{});

  EXPECT_THAT(old_to_new, testing::ElementsAre(0, 1, 2, 3, 4, 5));
  EXPECT_THAT(tree.size(), testing::Eq(6));
}

}  // namespace lineage
