#ifndef LINEAGE_TREE_H_
#define LINEAGE_TREE_H_

#include <vector>
#include <ranges>
#include <stack>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/log/check.h"
#include "cppcoro/generator.hpp"

#include "estd.h"

namespace lineage {

// Trees and Nodes
// ===============

// Trees consist of a contiguous list of nodes.  Internally, nodes are referred to by their index
// into such a list, using `Node_index`.  The public face of a lineage tree names nodes by strings
// (see lineage_tree.h); indices are an implementation detail that may be renumbered whenever nodes
// are erased (see `erase_nodes` below).
//
// By convention, variables holding indices have names like `node`, not `node_index`.
// By convention, the node objects themselves are almost never given a name; we prefer instead
// indirect access via a tree, e.g., to get the parent node of node i, write `tree.at(i).parent`.
using Node_index = int;

// Sentinel value for a blank reference to a node (like `nullptr`)
inline constexpr Node_index k_no_node = -1;

// Stores a `T` for every node in a tree, indexed by a node's index
template<typename T, typename Alloc = std::allocator<T>>
using Node_vector = std::vector<T, Alloc>;

// Stores a `T` for a small number of nodes in a tree, indexed by a node's index
template<typename T>
using Node_map = absl::flat_hash_map<Node_index, T>;

// Stores a set of nodes in a tree, represented by their index
using Node_set = absl::flat_hash_set<Node_index>;

// Nodes are the basic building block for trees.  Node<C> encodes topological info for navigating trees,
// using the container C for the child indices.  Concrete node classes derive from Node<C>, usually
// through `Nary_node` (no restrictions on number of children per node).
// The `Node_like` concept is used to restrict template parameters to descendants of Node<C> for some C.
//
// Example:
//
//  struct My_node : public Nary_node {
//    std::string name;
//    double t;
//  };
//
//  auto tree = Tree<My_node>{};
//  auto node = tree.add_node();
//  tree.at(node).t = 42.0;
//
template<typename Child_indices>
struct Node {
  Node_index parent{k_no_node};
  Child_indices children{};

  auto is_inner_node() const -> bool { return not children.empty(); }
  auto is_tip() const -> bool { return children.empty(); }

  auto operator==(const Node& that) const -> bool = default;
};
template<typename N>
concept Node_like = requires(N node){
  // N should be descended from Node<C> for some C
  []<typename C>(const Node<C>&){}(node);
};

auto operator<<(std::ostream& os, const Node_like auto& node) -> std::ostream& {
  return os << absl::StreamFormat(
      "Node{parent=%d, children=[%s]}",
      node.parent,
      absl::StrJoin(node.children, ", "));
}

using Nary_node = Node<std::vector<Node_index>>;


// A Tree groups together a set of nodes, one of which is a root, and operations
// to access data for those nodes (`tree.at(node)`).  Concrete trees derive from Tree<N>
// or hold one.  The `Tree_like` concept is used to restrict template parameters to
// descendants of Tree<N> for some N.
template<Node_like Node>
struct Tree {
  Node_index root;
  Node_vector<Node> nodes;

  Tree() : root{k_no_node}, nodes{} {}
  explicit Tree(Node_index num_nodes) : root{k_no_node}, nodes(num_nodes, Node{}) {}

  auto size() const -> Node_index { return std::ssize(nodes); }
  auto empty() const -> bool { return nodes.empty(); }

  auto at(Node_index i) -> Node& { return nodes.at(i); }
  auto at(Node_index i) const -> const Node& { return nodes.at(i); }

  // Often enough, we need to access the parent node of i.
  // Use tree.at_parent_of(i) instead of tree.at(tree.at(i).parent) for clarity
  auto at_parent_of(Node_index i) -> Node& { return at(at(i).parent); }
  auto at_parent_of(Node_index i) const -> const Node& { return at(at(i).parent); }

  // Likewise for the root
  auto at_root() -> Node& { return at(root); }
  auto at_root() const -> const Node& { return at(root); }

  auto add_node(const Node& node) -> Node_index {
    auto new_node_index = std::ssize(nodes);
    nodes.push_back(node);
    return new_node_index;
  }
  auto add_node(Node&& node = {}) -> Node_index {
    auto new_node_index = std::ssize(nodes);
    nodes.push_back(std::move(node));
    return new_node_index;
  }
};
template<typename T>
concept Tree_like = requires(T tree){
  // T should be descended from Tree<N> for some N
  []<typename N>(const Tree<N>&){}(tree);
};


// Tree Traversals
// ===============

// Perform a depth-first walk through the subtree rooted at `start`, yielding a node every time it is
// visited even transiently.  The standard pre-order and post-order traversals are specializations of
// this walk (see below).  The general walk is something useful if you need to update information on
// entering and/or exiting every node: a node with k children is visited k+1 times, with
// `children_so_far` going from 0 (entering) to k (exiting).
namespace detail {
struct Node_visitation { Node_index node; int children_so_far; };
};
auto traversal(const Tree_like auto& tree, Node_index start) -> cppcoro::generator<detail::Node_visitation> {
  if (start == k_no_node) { co_return; }

  auto work_stack = std::stack<detail::Node_visitation>{};
  work_stack.emplace(start, -1);

  while (not work_stack.empty()) {
    auto [node, children_so_far] = work_stack.top();
    work_stack.pop();

    if (children_so_far != -1) {
      co_yield detail::Node_visitation{node, children_so_far};
    } else {
      const auto& children = tree.at(node).children;
      auto num_children = static_cast<int>(std::ssize(children));
      work_stack.emplace(node, num_children);
      for (auto i = num_children - 1; i >= 0; --i) {
        work_stack.emplace(children[i], -1);
        work_stack.emplace(node, i);
      }
    }
  }
}
auto traversal(const Tree_like auto& tree) -> cppcoro::generator<detail::Node_visitation> {
  return traversal(tree, tree.root);
}

auto pre_order_traversal(const Tree_like auto& tree, Node_index start) -> cppcoro::generator<Node_index> {
  for (const auto& [node, children_so_far] : traversal(tree, start)) {
    if (children_so_far == 0) {
      co_yield Node_index{node};
    }
  }
}
auto pre_order_traversal(const Tree_like auto& tree) -> cppcoro::generator<Node_index> {
  return pre_order_traversal(tree, tree.root);
}

auto post_order_traversal(const Tree_like auto& tree, Node_index start) -> cppcoro::generator<Node_index> {
  for (const auto& [node, children_so_far] : traversal(tree, start)) {
    if (children_so_far == std::ssize(tree.at(node).children)) {
      co_yield Node_index{node};
    }
  }
}
auto post_order_traversal(const Tree_like auto& tree) -> cppcoro::generator<Node_index> {
  return post_order_traversal(tree, tree.root);
}

auto index_order_traversal(const Tree_like auto& tree) {
  return std::views::iota(0, tree.size());
}


// Assertions
// ==========

inline auto assert_node_integrity(const Tree_like auto& tree, Node_index node, bool force = false) -> void {
  if (estd::is_debug_enabled || force) {
    auto parent = tree.at(node).parent;
    if (parent != k_no_node) {
      CHECK_GE(parent, 0);
      CHECK_LT(parent, std::ssize(tree.nodes));

      CHECK_EQ(std::ranges::count(tree.at(parent).children, node), 1);
    }

    for (const auto& child : tree.at(node).children) {
      CHECK_GE(child, 0);
      CHECK_LT(child, std::ssize(tree.nodes));

      CHECK_EQ(tree.at(child).parent, node);
    }
  }
}

inline auto assert_tree_integrity(const Tree_like auto& tree, bool force = false) -> void {
  if (estd::is_debug_enabled || force) {
    if (tree.empty()) {
      CHECK_EQ(tree.root, k_no_node);
      return;
    }

    auto root = tree.root;
    CHECK_NE(root, k_no_node);
    CHECK_GE(root, 0);
    CHECK_LT(root, tree.size());
    CHECK_EQ(tree.at(root).parent, k_no_node);

    auto visited = Node_vector<bool>(tree.size(), false);
    for (const auto& node : pre_order_traversal(tree)) {
      CHECK(!visited[node]) << node;
      visited[node] = true;
      assert_node_integrity(tree, node, force);
    }

    CHECK(std::ranges::all_of(visited, [](bool v) { return v == true; }))
        << std::ranges::count(visited, true) << " vs " << std::ssize(visited);
  }
}

// Generic operations
// ==================

// Removes every node in `doomed` from the node list, renumbering the survivors so that they stay
// contiguous and in their original relative order.  The doomed nodes must already be unreachable
// from the surviving ones (i.e., no survivor names a doomed node as parent or child).
// Returns the map from old indices to new indices (`k_no_node` for erased nodes).
template<Tree_like T>
auto erase_nodes(T& tree, const Node_set& doomed) -> Node_vector<Node_index> {
  auto old_to_new = Node_vector<Node_index>(tree.size(), k_no_node);
  auto next = Node_index{0};
  for (const auto& node : index_order_traversal(tree)) {
    if (not doomed.contains(node)) {
      old_to_new[node] = next++;
    }
  }

  auto survivors = decltype(tree.nodes){};
  survivors.reserve(next);
  for (const auto& node : index_order_traversal(tree)) {
    if (old_to_new[node] == k_no_node) { continue; }

    auto& n = tree.at(node);
    if (n.parent != k_no_node) {
      n.parent = old_to_new.at(n.parent);
      CHECK_NE(n.parent, k_no_node) << "Surviving node " << node << " has an erased parent";
    }
    for (auto& child : n.children) {
      child = old_to_new.at(child);
      CHECK_NE(child, k_no_node) << "Surviving node " << node << " has an erased child";
    }
    survivors.push_back(std::move(n));
  }
  tree.nodes = std::move(survivors);
  tree.root = tree.root == k_no_node ? k_no_node : old_to_new.at(tree.root);

  return old_to_new;
}

}  // namespace lineage

#endif // LINEAGE_TREE_H_
