#include "lineage_tree.h"

#include <algorithm>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_format.h"

#include "tree_lca.h"

namespace lineage {

// LCAs
// ====

auto Lineage_tree::compute_lcas(const std::vector<std::pair<Node_index, Node_index>>& pairs) const
    -> std::vector<Node_index> {

  auto result = std::vector<Node_index>(pairs.size(), k_no_node);
  auto uncached = std::vector<std::pair<Node_index, Node_index>>{};
  auto uncached_at = std::vector<int>{};
  for (auto k = 0; k != std::ssize(pairs); ++k) {
    auto [u, v] = pairs[k];
    if (u > v) { std::swap(u, v); }
    auto it = cache_.lcas.find(std::pair{u, v});
    if (it != cache_.lcas.end()) {
      result[k] = it->second;
    } else {
      uncached.emplace_back(u, v);
      uncached_at.push_back(k);
    }
  }

  if (not uncached.empty()) {
    auto lcas = find_lcas_offline(tree_, uncached);
    for (auto i = 0; i != std::ssize(uncached); ++i) {
      cache_.lcas.try_emplace(uncached[i], lcas[i]);
      result[uncached_at[i]] = lcas[i];
    }
  }
  return result;
}

auto Lineage_tree::find_lcas_of_pairs(std::optional<std::vector<std::pair<std::string, std::string>>> pairs) const
    -> std::vector<std::pair<std::pair<std::string, std::string>, std::string>> {

  check_initialized();
  if (not pairs.has_value()) {
    pairs.emplace();
    for (auto i = 0; i != tree_.size(); ++i) {
      for (auto j = i; j != tree_.size(); ++j) {
        pairs->emplace_back(name_of(i), name_of(j));
      }
    }
  }

  auto index_pairs = std::vector<std::pair<Node_index, Node_index>>{};
  index_pairs.reserve(pairs->size());
  for (const auto& [a, b] : *pairs) {
    index_pairs.emplace_back(node_of(a), node_of(b));
  }

  auto lcas = compute_lcas(index_pairs);

  auto result = std::vector<std::pair<std::pair<std::string, std::string>, std::string>>{};
  result.reserve(pairs->size());
  for (auto k = 0; k != std::ssize(*pairs); ++k) {
    result.emplace_back((*pairs)[k], name_of(lcas[k]));
  }
  return result;
}

auto Lineage_tree::find_lca(const std::vector<std::string>& nodes) const -> std::string {
  check_initialized();

  // Deduplicate, keeping the caller's order
  auto seen = absl::flat_hash_set<Node_index>{};
  auto current = std::vector<Node_index>{};
  for (const auto& name : nodes) {
    auto n = node_of(name);
    if (seen.insert(n).second) {
      current.push_back(n);
    }
  }
  if (std::ssize(current) < 2) {
    throw Tree_validation_error(absl::StrFormat(
        "At least two distinct nodes are needed to find an LCA, got %d", std::ssize(current)));
  }

  // Replace the set by the distinct LCAs of all its pairs until one node remains
  while (std::ssize(current) > 1) {
    auto pairs = std::vector<std::pair<Node_index, Node_index>>{};
    for (auto i = 0; i != std::ssize(current); ++i) {
      for (auto j = i + 1; j != std::ssize(current); ++j) {
        pairs.emplace_back(current[i], current[j]);
      }
    }

    seen.clear();
    auto next = std::vector<Node_index>{};
    for (const auto& lca : compute_lcas(pairs)) {
      if (seen.insert(lca).second) {
        next.push_back(lca);
      }
    }
    current = std::move(next);
  }
  return name_of(current.front());
}

// Distances
// =========

// Fills in the distance from `source` to every node with one descending walk over `source`'s subtree,
// then for each ancestor, one descending walk into its other subtrees:
//
//              A2          d(x) = t(src) - t(A2) + t(x) - t(A2)   for x under A2 but not under A1
//             /  \         .
//           A1    ...      d(x) = t(src) - t(A1) + t(x) - t(A1)   for x under A1 but not under src
//          /  \            .
//        src   ...         d(x) = t(x) - t(src)                   for x under src
//
auto Lineage_tree::fill_distances_from(Node_index source) const -> void {
  auto& d = cache_.distances[source];
  auto t_source = tree_.at(source).t;

  for (const auto& x : pre_order_traversal(tree_, source)) {
    d[x] = tree_.at(x).t - t_source;
  }

  auto prev = source;
  for (auto a = tree_.at(source).parent; a != k_no_node; prev = a, a = tree_.at(a).parent) {
    auto t_a = tree_.at(a).t;
    auto up = t_source - t_a;
    d[a] = up;
    for (const auto& child : tree_.at(a).children) {
      if (child == prev) { continue; }
      for (const auto& x : pre_order_traversal(tree_, child)) {
        d[x] = up + (tree_.at(x).t - t_a);
      }
    }
  }

  cache_.complete_distances.insert(source);
}

auto Lineage_tree::get_distance(std::string_view a, std::string_view b) const -> double {
  auto u = node_of(a);
  auto v = node_of(b);
  if (u == v) { return 0.0; }

  auto u_it = cache_.distances.find(u);
  if (u_it != cache_.distances.end()) {
    auto it = u_it->second.find(v);
    if (it != u_it->second.end()) { return it->second; }
  }

  auto lca = compute_lcas({{u, v}}).front();
  auto t_lca = tree_.at(lca).t;
  auto result = (tree_.at(u).t - t_lca) + (tree_.at(v).t - t_lca);
  cache_.distances[u][v] = result;
  cache_.distances[v][u] = result;
  return result;
}

auto Lineage_tree::get_distances(std::string_view node, bool leaves_only) const
    -> absl::flat_hash_map<std::string, double> {

  auto source = node_of(node);
  if (not cache_.complete_distances.contains(source)) {
    fill_distances_from(source);
  }

  auto result = absl::flat_hash_map<std::string, double>{};
  for (const auto& [target, distance] : cache_.distances.at(source)) {
    if (leaves_only && not tree_.at(target).is_tip()) { continue; }
    result.try_emplace(name_of(target), distance);
  }
  return result;
}

}  // namespace lineage
