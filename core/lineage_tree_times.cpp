#include "lineage_tree.h"

#include <algorithm>

#include "absl/strings/str_format.h"

#include "estd.h"

namespace lineage {

auto Lineage_tree::set_time(std::string_view node, double t) -> void {
  auto n = node_of(node);
  if (not (t >= 0.0)) {
    throw Tree_validation_error(absl::StrFormat("Node '%s' cannot have invalid time %g", node, t));
  }

  if (n != tree_.root) {
    auto parent_t = tree_.at_parent_of(n).t;
    if (t < parent_t) {
      throw Time_consistency_error(absl::StrFormat(
          "New time %g for node '%s' is less than the time of its parent (%g)", t, node, parent_t));
    }
  }
  for (const auto& child : tree_.at(n).children) {
    if (t > tree_.at(child).t) {
      throw Time_consistency_error(absl::StrFormat(
          "New time %g for node '%s' is greater than the time of its child '%s' (%g)",
          t, node, name_of(child), tree_.at(child).t));
    }
  }

  tree_.at(n).t = t;
  if (n != tree_.root) {
    tree_.at(n).branch_length = t - tree_.at_parent_of(n).t;
  }
  for (const auto& child : tree_.at(n).children) {
    tree_.at(child).branch_length = tree_.at(child).t - t;
  }
  cache_.clear_distances();
}

auto Lineage_tree::set_times(const absl::flat_hash_map<std::string, double>& times) -> void {
  check_initialized();

  auto new_t = Node_vector<double>(tree_.size());
  for (const auto& node : index_order_traversal(tree_)) {
    new_t[node] = tree_.at(node).t;
  }
  for (const auto& [name, t] : times) {
    auto n = node_of(name);
    if (not (t >= 0.0)) {
      throw Tree_validation_error(absl::StrFormat("Node '%s' cannot have invalid time %g", name, t));
    }
    new_t[n] = t;
  }

  // Validate everything before touching anything
  for (const auto& node : index_order_traversal(tree_)) {
    if (node == tree_.root) { continue; }
    auto parent = tree_.at(node).parent;
    if (new_t[parent] > new_t[node]) {
      throw Time_consistency_error(absl::StrFormat(
          "Time of node '%s' (%g) is less than the time of its parent '%s' (%g)",
          name_of(node), new_t[node], name_of(parent), new_t[parent]));
    }
  }

  for (const auto& node : index_order_traversal(tree_)) {
    auto& n = tree_.at(node);
    n.t = new_t[node];
    if (node != tree_.root) {
      n.branch_length = new_t[node] - new_t[n.parent];
    }
  }
  cache_.clear_distances();
}

auto Lineage_tree::get_time(std::string_view node) const -> double {
  return tree_.at(node_of(node)).t;
}

auto Lineage_tree::get_times() const -> absl::flat_hash_map<std::string, double> {
  check_initialized();
  auto result = absl::flat_hash_map<std::string, double>{};
  for (const auto& n : tree_.nodes) {
    result.try_emplace(n.name, n.t);
  }
  return result;
}

auto Lineage_tree::rederive_times(Node_index start) -> void {
  for (const auto& node : pre_order_traversal(tree_, start)) {
    if (node != tree_.root) {
      tree_.at(node).t = tree_.at_parent_of(node).t + tree_.at(node).branch_length;
    }
  }
}

auto Lineage_tree::set_branch_length(std::string_view parent, std::string_view child, double length) -> void {
  auto c = edge_of(parent, child);
  if (not (length >= 0.0)) {
    throw Tree_validation_error(absl::StrFormat(
        "Edge '%s' -> '%s' cannot have negative length %g", parent, child, length));
  }

  tree_.at(c).branch_length = length;
  rederive_times(c);
  cache_.clear_distances();
}

auto Lineage_tree::set_branch_lengths(
    const std::vector<std::pair<std::pair<std::string, std::string>, double>>& lengths)
    -> void {

  auto children = std::vector<Node_index>{};
  children.reserve(lengths.size());
  for (const auto& [edge, length] : lengths) {
    const auto& [parent, child] = edge;
    children.push_back(edge_of(parent, child));
    if (not (length >= 0.0)) {
      throw Tree_validation_error(absl::StrFormat(
          "Edge '%s' -> '%s' cannot have negative length %g", parent, child, length));
    }
  }

  for (auto i = 0; i != std::ssize(lengths); ++i) {
    tree_.at(children[i]).branch_length = lengths[i].second;
  }
  rederive_times(tree_.root);
  cache_.clear_distances();
}

auto Lineage_tree::get_branch_length(std::string_view parent, std::string_view child) const -> double {
  return tree_.at(edge_of(parent, child)).branch_length;
}

// Depths are measured from the root
auto Lineage_tree::get_mean_depth_of_tree() const -> double {
  check_initialized();
  auto depths = std::vector<double>{};
  for (const auto& n : tree_.nodes) {
    if (n.is_tip()) {
      depths.push_back(n.t - tree_.at_root().t);
    }
  }
  return estd::ranges::sum(depths) / std::ssize(depths);
}

auto Lineage_tree::get_max_depth_of_tree() const -> double {
  check_initialized();
  auto result = 0.0;
  for (const auto& n : tree_.nodes) {
    if (n.is_tip()) {
      result = std::max(result, n.t - tree_.at_root().t);
    }
  }
  return result;
}

}  // namespace lineage
