#ifndef LINEAGE_TREE_LCA_H_
#define LINEAGE_TREE_LCA_H_

#include <utility>
#include <vector>

#include "tree.h"

namespace lineage {

// Lowest common ancestors of many pairs at once
// =============================================
//
// Tarjan's offline algorithm: a single depth-first walk over the tree, merging each finished subtree into
// its parent's set in a union-find structure whose representative remembers the deepest open ancestor.
// When a node is exited, the LCA of that node and any already-exited partner is the open ancestor of the
// partner's set.  Total cost is O(n + q) up to the inverse Ackermann factor, rather than one
// root-to-node walk per pair.
//
// result[k] is the LCA of pairs[k].first and pairs[k].second.
template<Tree_like T>
auto find_lcas_offline(const T& tree, const std::vector<std::pair<Node_index, Node_index>>& pairs)
    -> std::vector<Node_index> {

  auto result = std::vector<Node_index>(pairs.size(), k_no_node);
  if (tree.empty() || pairs.empty()) { return result; }

  // queries_at[u] = indices into `pairs` that mention u
  auto queries_at = Node_vector<std::vector<int>>(tree.size());
  for (auto k = 0; k != std::ssize(pairs); ++k) {
    const auto& [u, v] = pairs[k];
    if (u == v) {
      result[k] = u;
    } else {
      queries_at[u].push_back(k);
      queries_at[v].push_back(k);
    }
  }

  // Union-find with path halving
  auto set_parent = Node_vector<Node_index>(tree.size(), k_no_node);
  auto open_ancestor = Node_vector<Node_index>(tree.size(), k_no_node);
  auto exited = Node_vector<bool>(tree.size(), false);
  auto find = [&set_parent](Node_index x) {
    while (set_parent[x] != x) {
      set_parent[x] = set_parent[set_parent[x]];
      x = set_parent[x];
    }
    return x;
  };

  for (const auto& [node, children_so_far] : traversal(tree)) {
    if (children_so_far == 0) {
      // Entering `node`
      set_parent[node] = node;
      open_ancestor[node] = node;
    } else {
      // Just finished child number `children_so_far - 1`: merge its set into ours
      auto child = tree.at(node).children[children_so_far - 1];
      auto child_root = find(child);
      auto node_root = find(node);
      set_parent[child_root] = node_root;
      open_ancestor[node_root] = node;
    }

    if (children_so_far == std::ssize(tree.at(node).children)) {
      // Exiting `node`
      exited[node] = true;
      for (const auto& k : queries_at[node]) {
        const auto& [u, v] = pairs[k];
        auto partner = (u == node ? v : u);
        if (exited[partner] && result[k] == k_no_node) {
          result[k] = open_ancestor[find(partner)];
        }
      }
    }
  }

  return result;
}

}  // namespace lineage

#endif // LINEAGE_TREE_LCA_H_
