#include "lineage_tree.h"

#include <cmath>

#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/strings/str_format.h"

#include "estd.h"
#include "newick.h"

namespace lineage {

Lineage_tree::Lineage_tree(Lineage_tree_config config) : config_{std::move(config)} {}

// Internal helpers
// ================

auto Lineage_tree::check_initialized() const -> void {
  if (not is_initialized()) {
    throw Uninitialized_tree_error{};
  }
}

auto Lineage_tree::node_of(std::string_view name) const -> Node_index {
  check_initialized();
  auto it = index_of_.find(name);
  if (it == index_of_.end()) {
    throw Tree_validation_error(absl::StrFormat("Node '%s' is not in the tree", name));
  }
  return it->second;
}

auto Lineage_tree::edge_of(std::string_view parent, std::string_view child) const -> Node_index {
  auto p = node_of(parent);
  auto c = node_of(child);
  if (tree_.at(c).parent != p) {
    throw Tree_validation_error(absl::StrFormat("Edge '%s' -> '%s' is not in the tree", parent, child));
  }
  return c;
}

auto Lineage_tree::names_of(const std::vector<Node_index>& nodes) const -> std::vector<std::string> {
  auto result = std::vector<std::string>{};
  result.reserve(nodes.size());
  for (const auto& node : nodes) {
    result.push_back(name_of(node));
  }
  return result;
}

auto Lineage_tree::rebuild_index() -> void {
  index_of_.clear();
  for (const auto& node : index_order_traversal(tree_)) {
    index_of_.try_emplace(tree_.at(node).name, node);
  }
}

auto Lineage_tree::erase(const Node_set& doomed) -> void {
  if (doomed.empty()) { return; }
  erase_nodes(tree_, doomed);
  rebuild_index();
}

auto Lineage_tree::register_data_with_tree() -> void {
  auto leaf_names = absl::flat_hash_set<std::string>{};
  auto ordered_leaves = std::vector<std::string>{};
  if (is_initialized()) {
    for (const auto& node : pre_order_traversal(tree_)) {
      if (tree_.at(node).is_tip()) {
        leaf_names.insert(name_of(node));
        ordered_leaves.push_back(name_of(node));
      }
    }
  }

  if (current_matrix_.has_value()) {
    for (const auto& sample : std::vector<std::string>{current_matrix_->sample_names()}) {
      if (not leaf_names.contains(sample)) {
        current_matrix_->erase_row(sample);
      }
    }
    auto num_characters = current_matrix_->num_characters();
    for (const auto& leaf : ordered_leaves) {
      if (not current_matrix_->contains(leaf)) {
        auto states = State_vector(num_characters, Missing_state{});
        tree_.at(index_of_.at(leaf)).character_states = states;
        current_matrix_->set_row(leaf, std::move(states));
      }
    }
  }

  if (cell_meta_.has_value()) {
    for (const auto& key : std::vector<std::string>{cell_meta_->row_keys()}) {
      if (not leaf_names.contains(key)) {
        cell_meta_->erase_row(key);
      }
    }
    for (const auto& leaf : ordered_leaves) {
      if (not cell_meta_->contains(leaf)) {
        cell_meta_->add_blank_row(leaf);
      }
    }
  }

  if (dissimilarity_map_.has_value()) {
    for (const auto& sample : std::vector<std::string>{dissimilarity_map_->sample_names()}) {
      if (not leaf_names.contains(sample)) {
        dissimilarity_map_->erase_sample(sample);
      }
    }
    for (const auto& leaf : ordered_leaves) {
      if (not dissimilarity_map_->contains(leaf)) {
        dissimilarity_map_->add_sample(leaf);
      }
    }
  }
}

// Ingestion
// =========

auto Lineage_tree::populate_tree(const Raw_topology& topology) -> void {
  // Gather node names in order of first appearance
  auto names = std::vector<std::string>{};
  auto index = absl::flat_hash_map<std::string, Node_index>{};
  auto intern = [&](const std::string& name) {
    if (name.empty()) {
      throw Tree_validation_error("Node names must be non-empty");
    }
    auto [it, inserted] = index.try_emplace(name, std::ssize(names));
    if (inserted) {
      names.push_back(name);
    }
    return it->second;
  };
  for (const auto& name : topology.nodes) {
    intern(name);
  }
  for (const auto& edge : topology.edges) {
    intern(edge.parent);
    intern(edge.child);
  }
  if (names.empty()) {
    throw Tree_validation_error("Cannot populate a tree from an empty topology");
  }

  auto new_tree = Tree<Lineage_node>(std::ssize(names));
  for (auto i = 0; i != std::ssize(names); ++i) {
    new_tree.at(i).name = names[i];
  }
  for (const auto& edge : topology.edges) {
    auto p = index.at(edge.parent);
    auto c = index.at(edge.child);
    if (p == c) {
      throw Tree_validation_error(absl::StrFormat("Node '%s' cannot be its own parent", edge.child));
    }
    if (new_tree.at(c).parent != k_no_node) {
      throw Tree_validation_error(absl::StrFormat(
          "Node '%s' has more than one parent ('%s' and '%s')",
          edge.child, names[new_tree.at(c).parent], edge.parent));
    }
    auto length = edge.length.value_or(1.0);
    if (not (length >= 0.0)) {
      throw Tree_validation_error(absl::StrFormat(
          "Edge '%s' -> '%s' has invalid length %g", edge.parent, edge.child, length));
    }
    new_tree.at(c).parent = p;
    new_tree.at(c).branch_length = length;
    new_tree.at(p).children.push_back(c);
  }

  auto roots = std::vector<Node_index>{};
  for (const auto& node : index_order_traversal(new_tree)) {
    if (new_tree.at(node).parent == k_no_node) {
      roots.push_back(node);
    }
  }
  if (std::ssize(roots) != 1) {
    throw Tree_validation_error(absl::StrFormat(
        "Tree must have exactly one root, found %d", std::ssize(roots)));
  }
  new_tree.root = roots.front();

  // Every node must be reachable from the root (otherwise some other component is a cycle)
  auto num_reached = 0;
  new_tree.at_root().t = 0.0;
  new_tree.at_root().branch_length = 0.0;
  for (const auto& node : pre_order_traversal(new_tree)) {
    ++num_reached;
    if (node != new_tree.root) {
      new_tree.at(node).t = new_tree.at_parent_of(node).t + new_tree.at(node).branch_length;
    }
  }
  if (num_reached != new_tree.size()) {
    throw Tree_validation_error(absl::StrFormat(
        "Tree is not connected or contains a cycle (%d of %d nodes reachable from the root)",
        num_reached, new_tree.size()));
  }

  if (original_matrix_.has_value()) {
    current_matrix_ = original_matrix_;
    for (auto& node : new_tree.nodes) {
      if (original_matrix_->contains(node.name)) {
        node.character_states = original_matrix_->row(node.name);
      }
    }
  }

  tree_ = std::move(new_tree);
  index_of_ = std::move(index);
  cache_.clear_all();
  register_data_with_tree();

  assert_lineage_tree_integrity(*this);
}

auto Lineage_tree::populate_tree(std::string_view newick) -> void {
  populate_tree(parse_newick(newick));
}

// Topology
// ========

auto Lineage_tree::root() const -> std::string {
  check_initialized();
  return name_of(tree_.root);
}

auto Lineage_tree::leaves() const -> std::vector<std::string> {
  check_initialized();
  if (not cache_.leaves.has_value()) {
    auto result = std::vector<std::string>{};
    for (const auto& node : index_order_traversal(tree_)) {
      if (tree_.at(node).is_tip()) {
        result.push_back(name_of(node));
      }
    }
    cache_.leaves = std::move(result);
  }
  return *cache_.leaves;
}

auto Lineage_tree::internal_nodes() const -> std::vector<std::string> {
  check_initialized();
  if (not cache_.internal_nodes.has_value()) {
    auto result = std::vector<std::string>{};
    for (const auto& node : index_order_traversal(tree_)) {
      if (tree_.at(node).is_inner_node()) {
        result.push_back(name_of(node));
      }
    }
    cache_.internal_nodes = std::move(result);
  }
  return *cache_.internal_nodes;
}

auto Lineage_tree::nodes() const -> std::vector<std::string> {
  check_initialized();
  if (not cache_.nodes.has_value()) {
    auto result = std::vector<std::string>{};
    for (const auto& node : index_order_traversal(tree_)) {
      result.push_back(name_of(node));
    }
    cache_.nodes = std::move(result);
  }
  return *cache_.nodes;
}

auto Lineage_tree::edges() const -> std::vector<std::pair<std::string, std::string>> {
  check_initialized();
  if (not cache_.edges.has_value()) {
    auto result = std::vector<std::pair<std::string, std::string>>{};
    for (const auto& node : index_order_traversal(tree_)) {
      for (const auto& child : tree_.at(node).children) {
        result.emplace_back(name_of(node), name_of(child));
      }
    }
    cache_.edges = std::move(result);
  }
  return *cache_.edges;
}

auto Lineage_tree::parent(std::string_view node) const -> std::string {
  auto n = node_of(node);
  if (n == tree_.root) {
    throw Tree_validation_error(absl::StrFormat("Root node '%s' has no parent", node));
  }
  return name_of(tree_.at(n).parent);
}

auto Lineage_tree::children(std::string_view node) const -> std::vector<std::string> {
  return names_of(tree_.at(node_of(node)).children);
}

auto Lineage_tree::is_leaf(std::string_view node) const -> bool {
  return tree_.at(node_of(node)).is_tip();
}

auto Lineage_tree::is_root(std::string_view node) const -> bool {
  return node_of(node) == tree_.root;
}

auto Lineage_tree::is_internal_node(std::string_view node) const -> bool {
  return tree_.at(node_of(node)).is_inner_node();
}

auto Lineage_tree::depth_first_traverse_nodes(std::optional<std::string_view> source, bool postorder) const
    -> std::vector<std::string> {
  check_initialized();
  auto start = source.has_value() ? node_of(*source) : tree_.root;
  auto result = std::vector<std::string>{};
  if (postorder) {
    for (const auto& node : post_order_traversal(tree_, start)) {
      result.push_back(name_of(node));
    }
  } else {
    for (const auto& node : pre_order_traversal(tree_, start)) {
      result.push_back(name_of(node));
    }
  }
  return result;
}

auto Lineage_tree::depth_first_traverse_edges(std::optional<std::string_view> source) const
    -> std::vector<std::pair<std::string, std::string>> {
  check_initialized();
  auto start = source.has_value() ? node_of(*source) : tree_.root;
  auto result = std::vector<std::pair<std::string, std::string>>{};
  for (const auto& node : pre_order_traversal(tree_, start)) {
    if (node != start) {
      result.emplace_back(name_of(tree_.at(node).parent), name_of(node));
    }
  }
  return result;
}

auto Lineage_tree::get_all_ancestors(std::string_view node) const -> std::vector<std::string> {
  auto n = node_of(node);
  auto it = cache_.ancestors.find(n);
  if (it == cache_.ancestors.end()) {
    auto result = std::vector<std::string>{};
    for (auto a = tree_.at(n).parent; a != k_no_node; a = tree_.at(a).parent) {
      result.push_back(name_of(a));
    }
    it = cache_.ancestors.try_emplace(n, std::move(result)).first;
  }
  return it->second;
}

auto Lineage_tree::leaves_in_subtree(std::string_view node) const -> std::vector<std::string> {
  auto n = node_of(node);
  if (not cache_.subtree_leaves.has_value()) {
    // One post-order pass fills in the whole table
    auto table = Node_vector<std::vector<std::string>>(tree_.size());
    for (const auto& x : post_order_traversal(tree_)) {
      if (tree_.at(x).is_tip()) {
        table[x].push_back(name_of(x));
      } else {
        for (const auto& child : tree_.at(x).children) {
          table[x].insert(table[x].end(), table[child].begin(), table[child].end());
        }
      }
    }
    cache_.subtree_leaves = std::move(table);
  }
  return cache_.subtree_leaves->at(n);
}

// Relabeling
// ==========

auto Lineage_tree::relabel_nodes(const absl::flat_hash_map<std::string, std::string>& relabel_map) -> void {
  check_initialized();
  for (const auto& [old_name, new_name] : relabel_map) {
    node_of(old_name);
    if (new_name.empty()) {
      throw Tree_validation_error(absl::StrFormat("Cannot relabel '%s' to an empty name", old_name));
    }
  }
  auto renamed = [&relabel_map](const std::string& name) -> const std::string& {
    auto it = relabel_map.find(name);
    return it == relabel_map.end() ? name : it->second;
  };

  auto new_names = absl::flat_hash_set<std::string>{};
  for (const auto& node : tree_.nodes) {
    auto [_, inserted] = new_names.insert(renamed(node.name));
    if (not inserted) {
      throw Tree_validation_error(absl::StrFormat(
          "Relabeling would give two nodes the name '%s'", renamed(node.name)));
    }
  }

  // Side tables may hold rows that are not nodes, so a renamed node can still collide there
  auto check_unique = [&renamed](const std::vector<std::string>& keys, std::string_view table) {
    auto seen = absl::flat_hash_set<std::string>{};
    for (const auto& key : keys) {
      if (not seen.insert(renamed(key)).second) {
        throw Tree_validation_error(absl::StrFormat(
            "Relabeling would give two rows of the %s the name '%s'", table, renamed(key)));
      }
    }
  };
  if (current_matrix_.has_value()) { check_unique(current_matrix_->sample_names(), "character matrix"); }
  if (cell_meta_.has_value()) { check_unique(cell_meta_->row_keys(), "cell metadata"); }
  if (dissimilarity_map_.has_value()) { check_unique(dissimilarity_map_->sample_names(), "dissimilarity map"); }

  // Rebuild the leaf-indexed tables under the new names (renaming rows one by one could collide mid-way)
  auto new_matrix = std::optional<Character_matrix>{};
  if (current_matrix_.has_value()) {
    new_matrix.emplace(current_matrix_->num_characters());
    for (const auto& sample : current_matrix_->sample_names()) {
      new_matrix->set_row(renamed(sample), current_matrix_->row(sample));
    }
  }
  auto new_cell_meta = std::optional<Metadata_table>{};
  if (cell_meta_.has_value()) {
    new_cell_meta.emplace(cell_meta_->columns());
    for (const auto& key : cell_meta_->row_keys()) {
      auto values = std::vector<Metadata_table::Cell>{};
      for (const auto& column : cell_meta_->columns()) {
        values.push_back(cell_meta_->at(key, column));
      }
      new_cell_meta->set_row(renamed(key), std::move(values));
    }
  }
  auto new_dissimilarity_map = std::optional<Dissimilarity_map>{};
  if (dissimilarity_map_.has_value()) {
    const auto& samples = dissimilarity_map_->sample_names();
    auto relabeled_samples = std::vector<std::string>{};
    for (const auto& sample : samples) {
      relabeled_samples.push_back(renamed(sample));
    }
    new_dissimilarity_map.emplace(relabeled_samples);
    for (auto i = 0; i != std::ssize(samples); ++i) {
      for (auto j = i + 1; j != std::ssize(samples); ++j) {
        new_dissimilarity_map->set(
            relabeled_samples[i], relabeled_samples[j], dissimilarity_map_->at(samples[i], samples[j]));
      }
    }
  }

  current_matrix_ = std::move(new_matrix);
  cell_meta_ = std::move(new_cell_meta);
  dissimilarity_map_ = std::move(new_dissimilarity_map);

  for (auto& node : tree_.nodes) {
    node.name = std::string{renamed(node.name)};
  }
  rebuild_index();
  cache_.clear_all();
}

// Node attributes
// ===============

auto Lineage_tree::set_attribute(std::string_view node, const std::string& name, Attribute_value value) -> void {
  tree_.at(node_of(node)).attributes.insert_or_assign(name, std::move(value));
}

auto Lineage_tree::get_attribute(std::string_view node, std::string_view name) const -> const Attribute_value& {
  const auto& attributes = tree_.at(node_of(node)).attributes;
  auto it = attributes.find(name);
  if (it == attributes.end()) {
    throw Missing_attribute_error(absl::StrFormat("Attribute '%s' not detected for node '%s'", name, node));
  }
  return it->second;
}

auto Lineage_tree::filter_nodes(const std::function<bool(std::string_view node)>& condition) const
    -> std::vector<std::string> {
  check_initialized();
  auto result = std::vector<std::string>{};
  for (const auto& node : post_order_traversal(tree_)) {
    if (condition(name_of(node))) {
      result.push_back(name_of(node));
    }
  }
  return result;
}

// Leaf-indexed tables
// ===================

auto Lineage_tree::set_dissimilarity_map(Dissimilarity_map dissimilarity_map) -> void {
  if (current_matrix_.has_value()) {
    auto matrix_samples = absl::flat_hash_set<std::string>(
        current_matrix_->sample_names().begin(), current_matrix_->sample_names().end());
    auto map_samples = absl::flat_hash_set<std::string>(
        dissimilarity_map.sample_names().begin(), dissimilarity_map.sample_names().end());
    if (matrix_samples != map_samples) {
      warning_hook_(Tree_warnings::Dissimilarity_samples_mismatch{
          .num_matrix_samples = current_matrix_->num_samples(),
          .num_map_samples = dissimilarity_map.num_samples()});
    }
  }
  dissimilarity_map_ = std::move(dissimilarity_map);
}

auto Lineage_tree::compute_dissimilarity_map(
    const Dissimilarity_function& dissimilarity_function,
    std::optional<Prior_transformation> prior_transformation)
    -> void {

  if (not current_matrix_.has_value()) {
    throw Tree_validation_error("No character matrix is detected in this tree");
  }
  if (current_matrix_->is_ambiguous()) {
    warning_hook_(Tree_warnings::Ambiguous_character_matrix{
        .num_ambiguous_samples = current_matrix_->num_ambiguous_samples()});
  }

  auto weights = std::optional<Character_weights>{};
  if (priors_.has_value()) {
    weights = transform_priors(*priors_, prior_transformation.value_or(config_.prior_transformation));
  }

  set_dissimilarity_map(compute_pairwise_dissimilarities(
      *current_matrix_,
      dissimilarity_function,
      weights.has_value() ? &*weights : nullptr,
      config_.missing_state_indicator));
}

// Serialization
// =============

auto Lineage_tree::get_newick(bool record_branch_lengths) const -> std::string {
  check_initialized();
  return to_newick(*this, record_branch_lengths);
}

auto Lineage_tree::get_tree_topology() const -> Raw_topology {
  check_initialized();
  auto result = Raw_topology{};
  for (const auto& node : pre_order_traversal(tree_)) {
    result.add_node(name_of(node));
    if (node != tree_.root) {
      result.add_edge(name_of(tree_.at(node).parent), name_of(node), tree_.at(node).branch_length);
    }
  }
  return result;
}

// Assertions
// ==========

auto assert_lineage_tree_integrity(const Lineage_tree& tree, bool force) -> void {
  if (estd::is_debug_enabled || force) {
    const auto& topology = tree.topology();
    assert_tree_integrity(topology, force);
    if (topology.empty()) { return; }

    auto num_leaves = 0;
    auto names = absl::flat_hash_set<std::string>{};
    for (const auto& node : index_order_traversal(topology)) {
      const auto& n = topology.at(node);
      CHECK(tree.has_node(n.name)) << n.name;
      CHECK(names.insert(n.name).second) << "Duplicate node name " << n.name;
      if (n.is_tip()) { ++num_leaves; }

      if (node == topology.root) {
        CHECK_EQ(n.branch_length, 0.0) << n.name;
      } else {
        CHECK_GE(n.branch_length, 0.0) << n.name;
        auto expected_t = topology.at_parent_of(node).t + n.branch_length;
        CHECK_LE(std::abs(n.t - expected_t), 1e-9 * std::max(1.0, std::abs(expected_t)))
            << absl::StreamFormat("time(%s) = %g, but time(parent) + length = %g", n.name, n.t, expected_t);
      }
    }

    if (tree.has_character_matrix()) {
      const auto& matrix = tree.get_current_character_matrix();
      CHECK_EQ(matrix.num_samples(), num_leaves);
      for (const auto& node : index_order_traversal(topology)) {
        const auto& n = topology.at(node);
        if (n.is_tip()) {
          CHECK(matrix.contains(n.name)) << n.name;
          CHECK(matrix.row(n.name) == n.character_states) << n.name;
        }
      }
    }
  }
}

}  // namespace lineage
