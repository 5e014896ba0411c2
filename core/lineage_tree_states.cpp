#include "lineage_tree.h"

#include <algorithm>
#include <stdexcept>

#include "absl/container/flat_hash_set.h"
#include "absl/random/distributions.h"
#include "absl/strings/str_format.h"

#include "ancestral_reconstruction.h"

namespace lineage {

auto most_frequent_candidate(const std::vector<int>& candidates, absl::BitGenRef bitgen) -> int {
  if (candidates.empty()) {
    throw std::invalid_argument("most_frequent_candidate(): no candidates to choose from");
  }

  auto counts = absl::flat_hash_map<int, int>{};
  for (const auto& c : candidates) {
    ++counts[c];
  }
  auto max_count = 0;
  for (const auto& [_, count] : counts) {
    max_count = std::max(max_count, count);
  }

  auto winners = std::vector<int>{};
  for (const auto& [state, count] : counts) {
    if (count == max_count) {
      winners.push_back(state);
    }
  }
  std::ranges::sort(winners);  // Map iteration order is unspecified

  if (std::ssize(winners) == 1) {
    return winners.front();
  }
  return winners[absl::Uniform<std::size_t>(bitgen, 0, winners.size())];
}

// Character matrices
// ==================

auto Lineage_tree::set_character_matrix(Character_matrix matrix) -> void {
  if (is_initialized()) {
    initialize_character_states_at_leaves(std::move(matrix));
  } else {
    original_matrix_ = matrix;
    current_matrix_ = std::move(matrix);
  }
}

auto Lineage_tree::initialize_character_states_at_leaves(Character_matrix matrix) -> void {
  check_initialized();

  auto leaf_names = leaves();
  auto leaf_set = absl::flat_hash_set<std::string>(leaf_names.begin(), leaf_names.end());
  auto sample_set = absl::flat_hash_set<std::string>(
      matrix.sample_names().begin(), matrix.sample_names().end());
  if (leaf_set != sample_set) {
    throw Tree_validation_error(absl::StrFormat(
        "Samples in the character matrix (%d) do not match the leaves of the tree (%d)",
        matrix.num_samples(), std::ssize(leaf_names)));
  }

  for (const auto& leaf : leaf_names) {
    tree_.at(index_of_.at(leaf)).character_states = matrix.row(leaf);
  }
  original_matrix_ = matrix;
  current_matrix_ = std::move(matrix);
}

auto Lineage_tree::initialize_all_character_states(
    const absl::flat_hash_map<std::string, State_vector>& states)
    -> void {

  check_initialized();
  for (const auto& n : tree_.nodes) {
    if (not states.contains(n.name)) {
      throw Tree_validation_error(absl::StrFormat("No character states given for node '%s'", n.name));
    }
  }
  if (std::ssize(states) != tree_.size()) {
    throw Tree_validation_error("Character states given for nodes that are not in the tree");
  }
  auto num_characters = std::ssize(states.begin()->second);
  for (const auto& [name, node_states] : states) {
    if (std::ssize(node_states) != num_characters) {
      throw Tree_validation_error(absl::StrFormat(
          "Node '%s' has %d characters, but others have %d", name, std::ssize(node_states), num_characters));
    }
  }

  auto matrix = Character_matrix{static_cast<int>(num_characters)};
  for (const auto& node : index_order_traversal(tree_)) {
    auto& n = tree_.at(node);
    n.character_states = states.at(n.name);
    if (n.is_tip()) {
      matrix.set_row(n.name, n.character_states);
    }
  }
  original_matrix_ = matrix;
  current_matrix_ = std::move(matrix);
}

auto Lineage_tree::get_original_character_matrix() const -> const Character_matrix& {
  if (not original_matrix_.has_value()) {
    throw Tree_validation_error("Character matrix does not exist");
  }
  return *original_matrix_;
}

auto Lineage_tree::get_current_character_matrix() const -> const Character_matrix& {
  if (not current_matrix_.has_value()) {
    throw Tree_validation_error("Character matrix does not exist");
  }
  return *current_matrix_;
}

auto Lineage_tree::n_cell() const -> int {
  if (current_matrix_.has_value()) {
    return current_matrix_->num_samples();
  }
  check_initialized();
  return static_cast<int>(std::ranges::count_if(tree_.nodes, [](const auto& n) { return n.is_tip(); }));
}

auto Lineage_tree::n_character() const -> int {
  if (current_matrix_.has_value()) {
    return current_matrix_->num_characters();
  }
  check_initialized();
  for (const auto& n : tree_.nodes) {
    if (n.is_tip() && not n.character_states.empty()) {
      return static_cast<int>(std::ssize(n.character_states));
    }
  }
  throw Tree_validation_error("Character states have not been initialized");
}

// Node states
// ===========

auto Lineage_tree::get_character_states(std::string_view node) const -> State_vector {
  return tree_.at(node_of(node)).character_states;
}

auto Lineage_tree::store_character_states(Node_index node, State_vector states) -> void {
  auto& n = tree_.at(node);
  if (n.is_tip() && current_matrix_.has_value()) {
    current_matrix_->set_row(n.name, states);
  }
  n.character_states = std::move(states);
}

auto Lineage_tree::set_character_states(std::string_view node, State_vector states) -> void {
  auto n = node_of(node);
  auto num_characters = n_character();
  if (std::ssize(states) != num_characters) {
    throw Tree_validation_error(absl::StrFormat(
        "Input character states for node '%s' have %d characters, but the tree has %d",
        node, std::ssize(states), num_characters));
  }
  if (tree_.at(n).is_tip() && tree_.at(n).character_states.empty()) {
    throw Tree_validation_error(absl::StrFormat(
        "Leaf '%s' has no character states; initialize them from a character matrix first", node));
  }
  store_character_states(n, std::move(states));
}

auto Lineage_tree::is_ambiguous(std::string_view node) const -> bool {
  return lineage::is_ambiguous(tree_.at(node_of(node)).character_states);
}

auto Lineage_tree::collapse_ambiguous_characters() -> void {
  check_initialized();
  for (const auto& node : index_order_traversal(tree_)) {
    const auto& states = tree_.at(node).character_states;
    if (not lineage::is_ambiguous(states)) { continue; }

    auto collapsed = State_vector{};
    collapsed.reserve(states.size());
    for (const auto& s : states) {
      collapsed.push_back(collapse_ambiguity(s));
    }
    store_character_states(node, std::move(collapsed));
  }
}

auto Lineage_tree::resolve_ambiguous_characters(const Ambiguity_resolver& resolver) -> void {
  check_initialized();
  for (const auto& node : index_order_traversal(tree_)) {
    const auto& states = tree_.at(node).character_states;
    if (not lineage::is_ambiguous(states)) { continue; }

    auto resolved = State_vector{};
    resolved.reserve(states.size());
    for (const auto& s : states) {
      if (const auto* ambiguous = std::get_if<Ambiguous_state>(&s)) {
        resolved.push_back(resolver(ambiguous->candidates));
      } else {
        resolved.push_back(s);
      }
    }
    store_character_states(node, std::move(resolved));
  }
}

auto Lineage_tree::resolve_ambiguous_characters(absl::BitGenRef bitgen) -> void {
  resolve_ambiguous_characters([bitgen](const std::vector<int>& candidates) {
    return most_frequent_candidate(candidates, bitgen);
  });
}

// Ancestral reconstruction
// ========================

auto Lineage_tree::reconstruct_ancestral_characters() -> void {
  check_initialized();

  // Validate the leaves up front so that a failure leaves every state untouched
  auto num_characters = std::optional<std::ptrdiff_t>{};
  for (const auto& n : tree_.nodes) {
    if (not n.is_tip()) { continue; }
    if (n.character_states.empty()) {
      throw Tree_validation_error(absl::StrFormat("Leaf '%s' has no character states", n.name));
    }
    if (num_characters.has_value() && *num_characters != std::ssize(n.character_states)) {
      throw Tree_validation_error(absl::StrFormat(
          "Leaf '%s' has %d characters, but other leaves have %d",
          n.name, std::ssize(n.character_states), *num_characters));
    }
    num_characters = std::ssize(n.character_states);
  }

  auto children_states = std::vector<State_vector>{};
  for (const auto& node : post_order_traversal(tree_)) {
    if (tree_.at(node).is_tip()) { continue; }

    children_states.clear();
    for (const auto& child : tree_.at(node).children) {
      children_states.push_back(tree_.at(child).character_states);
    }
    tree_.at(node).character_states = lca_characters(children_states);
  }
}

auto Lineage_tree::get_mutations_along_edge(std::string_view parent, std::string_view child) const
    -> std::vector<std::pair<int, Character_state>> {

  auto c = edge_of(parent, child);
  const auto& parent_states = tree_.at_parent_of(c).character_states;
  const auto& child_states = tree_.at(c).character_states;
  if (parent_states.size() != child_states.size()) {
    throw Tree_validation_error(absl::StrFormat(
        "Nodes '%s' and '%s' have different numbers of characters (%d vs %d)",
        parent, child, std::ssize(parent_states), std::ssize(child_states)));
  }

  auto result = std::vector<std::pair<int, Character_state>>{};
  for (auto i = 0; i != std::ssize(child_states); ++i) {
    if (parent_states[i] != child_states[i]) {
      result.emplace_back(i, child_states[i]);
    }
  }
  return result;
}

}  // namespace lineage
