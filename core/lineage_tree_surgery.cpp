#include "lineage_tree.h"

#include <algorithm>

#include "absl/strings/str_format.h"

namespace lineage {

auto Lineage_tree::add_leaf(std::string_view parent, const std::string& node) -> void {
  auto p = node_of(parent);
  if (node.empty()) {
    throw Tree_validation_error("Node names must be non-empty");
  }
  if (has_node(node)) {
    throw Tree_validation_error(absl::StrFormat("Node '%s' already exists in the tree", node));
  }
  if (tree_.at(p).is_tip()) {
    throw Tree_validation_error(absl::StrFormat("Cannot add a leaf under leaf '%s'", parent));
  }

  auto new_leaf = Lineage_node{};
  new_leaf.parent = p;
  new_leaf.name = node;
  new_leaf.t = tree_.at(p).t;
  new_leaf.branch_length = 0.0;
  auto n = tree_.add_node(std::move(new_leaf));
  tree_.at(p).children.push_back(n);
  index_of_.try_emplace(node, n);

  cache_.clear_all();
  register_data_with_tree();  // Gives the new leaf an all-missing row, if there is a character matrix
}

auto Lineage_tree::remove_leaf_and_prune_lineage(std::string_view node) -> void {
  auto n = node_of(node);
  if (not tree_.at(n).is_tip()) {
    throw Tree_validation_error(absl::StrFormat("Node '%s' is not a leaf", node));
  }

  if (n == tree_.root) {
    // Only node in the tree
    tree_ = Tree<Lineage_node>{};
    index_of_.clear();
  } else {
    auto doomed = Node_set{};
    auto cur = n;
    while (cur != tree_.root && tree_.at(cur).is_tip()) {
      doomed.insert(cur);
      auto p = tree_.at(cur).parent;
      std::erase(tree_.at(p).children, cur);
      cur = p;
    }
    erase(doomed);
  }

  cache_.clear_all();
  register_data_with_tree();
}

auto Lineage_tree::collapse_unifurcations(std::optional<std::string_view> source) -> void {
  check_initialized();
  auto src = source.has_value() ? node_of(*source) : tree_.root;

  auto doomed = Node_set{};
  auto post_order = std::vector<Node_index>{};
  for (const auto& node : post_order_traversal(tree_, src)) {
    post_order.push_back(node);
  }

  for (const auto& node : post_order) {
    auto& n = tree_.at(node);
    if (std::ssize(n.children) != 1) { continue; }
    auto only_child = n.children.front();

    if (node == src) {
      // `src` itself stays put: absorb its only child instead (unless it's a leaf, which must survive)
      if (tree_.at(only_child).is_tip()) { continue; }

      auto grandchildren = tree_.at(only_child).children;
      for (const auto& grandchild : grandchildren) {
        tree_.at(grandchild).parent = node;
        tree_.at(grandchild).branch_length += tree_.at(only_child).branch_length;
      }
      n.children = std::move(grandchildren);
      doomed.insert(only_child);

    } else {
      // Splice `node` out, keeping `only_child` in its place among its siblings
      auto p = n.parent;
      std::ranges::replace(tree_.at(p).children, node, only_child);
      tree_.at(only_child).parent = p;
      tree_.at(only_child).branch_length += n.branch_length;
      doomed.insert(node);
    }
  }

  erase(doomed);
  cache_.clear_all();
}

auto Lineage_tree::collapse_mutationless_edges(bool infer_ancestral_characters) -> void {
  check_initialized();
  if (infer_ancestral_characters) {
    reconstruct_ancestral_characters();
  }

  auto doomed = Node_set{};
  auto post_order = std::vector<Node_index>{};
  for (const auto& node : post_order_traversal(tree_)) {
    post_order.push_back(node);
  }

  for (const auto& node : post_order) {
    if (tree_.at(node).is_tip()) { continue; }

    auto old_children = tree_.at(node).children;
    auto new_children = std::vector<Node_index>{};
    for (const auto& child : old_children) {
      const auto& c = tree_.at(child);
      if (c.is_inner_node() && c.character_states == tree_.at(node).character_states) {
        for (const auto& grandchild : c.children) {
          tree_.at(grandchild).parent = node;
          tree_.at(grandchild).branch_length += c.branch_length;
          new_children.push_back(grandchild);
        }
        doomed.insert(child);
      } else {
        new_children.push_back(child);
      }
    }
    tree_.at(node).children = std::move(new_children);
  }

  erase(doomed);
  cache_.clear_all();
}

}  // namespace lineage
