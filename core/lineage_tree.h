#ifndef LINEAGE_LINEAGE_TREE_H_
#define LINEAGE_LINEAGE_TREE_H_

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/random/bit_gen_ref.h"

#include "tree.h"
#include "character_state.h"
#include "character_matrix.h"
#include "dissimilarity.h"
#include "metadata_table.h"
#include "raw_topology.h"
#include "tree_errors.h"
#include "tree_warnings.h"

namespace lineage {

// Lineage trees
// =============
//
// A Lineage_tree is a rooted tree over uniquely named nodes (leaves are sampled cells) together with
// everything a lineage-reconstruction pipeline hangs off it:
//
// - a time for every node and a length for every edge, kept consistent so that for every edge u -> v,
//   time(v) == time(u) + length(u, v);
// - a character-state vector per node (see character_state.h), and the character matrix of the leaves;
// - leaf-indexed side tables (dissimilarity map, cell metadata), kept in step with the leaf set;
// - free-form node attributes.
//
// Example:
//
//            root           t = 0
//           /    \          .
//          x      c         t = 1
//         / \               .
//        a   b              t = 2
//
//   auto topology = Raw_topology{};
//   topology.add_edge("root", "x");
//   topology.add_edge("root", "c");
//   topology.add_edge("x", "a");
//   topology.add_edge("x", "b");
//   auto tree = Lineage_tree{};
//   tree.populate_tree(topology);
//   tree.find_lca({"a", "b"});    // "x"
//   tree.get_distance("a", "c");  // 3.0
//
// Nodes are stored in a contiguous arena (`Tree<Lineage_node>`) and named via a name -> index map.
// Node indices are renumbered whenever surgery erases nodes, so they never leak out of the public API.
//
// Derived structural facts (leaf lists, ancestor chains, subtree leaves, distances...) are cached
// lazily; see Structural_cache.
//
// A Lineage_tree is not thread-safe, not even for concurrent reads: queries fill the cache.

struct Lineage_tree_config {
  // Integer that encodes Missing_state in integer tables and in calls to dissimilarity functions
  int missing_state_indicator = -1;

  // Name of a sample to be treated as the root by downstream solvers, if any
  std::optional<std::string> root_sample_name = std::nullopt;

  // Used by compute_dissimilarity_map when no transformation is given explicitly
  Prior_transformation prior_transformation = Prior_transformation::k_negative_log;
};

struct Lineage_node : public Nary_node {
  std::string name{};
  double t{0.0};
  double branch_length{0.0};  // Length of the edge from the parent (0 at the root)
  State_vector character_states{};
  absl::flat_hash_map<std::string, Attribute_value> attributes{};
};

// Cached structural facts, all computed lazily from the topology.  Every topology mutation and every
// relabeling clears all of it; time changes clear only `distances`.
struct Structural_cache {
  std::optional<std::vector<std::string>> leaves{};
  std::optional<std::vector<std::string>> internal_nodes{};
  std::optional<std::vector<std::string>> nodes{};
  std::optional<std::vector<std::pair<std::string, std::string>>> edges{};
  Node_map<std::vector<std::string>> ancestors{};                    // Closest ancestor first
  std::optional<Node_vector<std::vector<std::string>>> subtree_leaves{};
  absl::flat_hash_map<std::pair<Node_index, Node_index>, Node_index> lcas{};
  Node_map<Node_map<double>> distances{};
  Node_set complete_distances{};                                     // Sources with every target cached

  auto clear_all() -> void { *this = Structural_cache{}; }
  auto clear_distances() -> void {
    distances.clear();
    complete_distances.clear();
  }
};

// Given the candidate states of an ambiguous character, returns the one to keep
using Ambiguity_resolver = std::function<int(const std::vector<int>& candidates)>;

// The default resolver: most frequent candidate, ties broken uniformly at random.
// `bitgen` is only consulted when there is a tie.  Throws std::invalid_argument if `candidates` is empty.
auto most_frequent_candidate(const std::vector<int>& candidates, absl::BitGenRef bitgen) -> int;

class Lineage_tree {
 public:
  explicit Lineage_tree(Lineage_tree_config config = {});

  auto config() const -> const Lineage_tree_config& { return config_; }
  auto missing_state_indicator() const -> int { return config_.missing_state_indicator; }
  auto is_initialized() const -> bool { return not tree_.empty(); }

  // Read-only view of the underlying arena, for generic tree algorithms
  auto topology() const -> const Tree<Lineage_node>& { return tree_; }

  auto set_warning_hook(Tree_warning_hook hook) -> void { warning_hook_ = std::move(hook); }

  // Ingestion
  // ---------

  // Replaces the whole topology.  Validates that there is exactly one root, that every node has at
  // most one parent and that all nodes are connected; throws Tree_validation_error otherwise.
  // Missing edge lengths are 1; the root sits at time 0.  Leaves found in the character matrix (if
  // any) get their states from it.
  auto populate_tree(const Raw_topology& topology) -> void;
  auto populate_tree(std::string_view newick) -> void;

  // Topology
  // --------

  auto root() const -> std::string;
  auto leaves() const -> std::vector<std::string>;
  auto internal_nodes() const -> std::vector<std::string>;  // Includes the root unless it is a leaf
  auto nodes() const -> std::vector<std::string>;
  auto edges() const -> std::vector<std::pair<std::string, std::string>>;
  auto has_node(std::string_view node) const -> bool { return index_of_.contains(node); }

  auto parent(std::string_view node) const -> std::string;  // Throws Tree_validation_error at the root
  auto children(std::string_view node) const -> std::vector<std::string>;
  auto is_leaf(std::string_view node) const -> bool;
  auto is_root(std::string_view node) const -> bool;
  auto is_internal_node(std::string_view node) const -> bool;

  // Pre- or post-order walk from `source` (default: root)
  auto depth_first_traverse_nodes(std::optional<std::string_view> source = std::nullopt, bool postorder = true) const
      -> std::vector<std::string>;
  auto depth_first_traverse_edges(std::optional<std::string_view> source = std::nullopt) const
      -> std::vector<std::pair<std::string, std::string>>;
  auto get_all_ancestors(std::string_view node) const -> std::vector<std::string>;
  auto leaves_in_subtree(std::string_view node) const -> std::vector<std::string>;

  // Times and branch lengths
  // ------------------------

  // Throws Time_consistency_error if `t` would put `node` before its parent or after any child
  auto set_time(std::string_view node, double t) -> void;

  // Nodes absent from `times` keep their current time.  All edges are checked before anything changes.
  auto set_times(const absl::flat_hash_map<std::string, double>& times) -> void;

  auto get_time(std::string_view node) const -> double;
  auto get_times() const -> absl::flat_hash_map<std::string, double>;

  // Shifts the times of the whole subtree under `child` to keep times and lengths consistent
  auto set_branch_length(std::string_view parent, std::string_view child, double length) -> void;
  auto set_branch_lengths(const std::vector<std::pair<std::pair<std::string, std::string>, double>>& lengths) -> void;
  auto get_branch_length(std::string_view parent, std::string_view child) const -> double;

  auto get_mean_depth_of_tree() const -> double;
  auto get_max_depth_of_tree() const -> double;

  // Character states
  // ----------------

  // Before the tree is populated, only stores the matrix; afterwards, behaves like
  // initialize_character_states_at_leaves
  auto set_character_matrix(Character_matrix matrix) -> void;

  // `matrix` must have one row per leaf, no more and no less
  auto initialize_character_states_at_leaves(Character_matrix matrix) -> void;

  // `states` must cover every node with vectors of equal length
  auto initialize_all_character_states(const absl::flat_hash_map<std::string, State_vector>& states) -> void;

  auto has_character_matrix() const -> bool { return current_matrix_.has_value(); }
  auto get_original_character_matrix() const -> const Character_matrix&;
  auto get_current_character_matrix() const -> const Character_matrix&;
  auto n_cell() const -> int;
  auto n_character() const -> int;

  auto get_character_states(std::string_view node) const -> State_vector;
  auto set_character_states(std::string_view node, State_vector states) -> void;
  auto is_ambiguous(std::string_view node) const -> bool;

  // Replaces every ambiguous state by the set of its distinct candidates
  auto collapse_ambiguous_characters() -> void;

  // Replaces every ambiguous state by a single one
  auto resolve_ambiguous_characters(const Ambiguity_resolver& resolver) -> void;
  auto resolve_ambiguous_characters(absl::BitGenRef bitgen) -> void;

  // Fills in the states of all internal nodes under Camin-Sokal parsimony (see ancestral_reconstruction.h)
  auto reconstruct_ancestral_characters() -> void;

  // (character index, new state) for every character that differs between `parent` and `child`
  auto get_mutations_along_edge(std::string_view parent, std::string_view child) const
      -> std::vector<std::pair<int, Character_state>>;

  // Surgery
  // -------

  // Attaches a new leaf named `node` under internal node `parent`, with zero-length branch
  auto add_leaf(std::string_view parent, const std::string& node) -> void;

  // Removes leaf `node`, then any ancestors left childless (but never the root).
  // Removing the only node of a tree leaves it uninitialized.
  auto remove_leaf_and_prune_lineage(std::string_view node) -> void;

  // Splices out every internal node with exactly one child under `source` (default: root), adding its
  // branch length to its child's.  Node times are unchanged.
  auto collapse_unifurcations(std::optional<std::string_view> source = std::nullopt) -> void;

  // Splices out every internal node whose state vector equals its parent's
  auto collapse_mutationless_edges(bool infer_ancestral_characters) -> void;

  // Renames nodes and the rows of all leaf-indexed tables.  Unmentioned nodes keep their names.
  auto relabel_nodes(const absl::flat_hash_map<std::string, std::string>& relabel_map) -> void;

  // LCAs and distances
  // ------------------

  // With no argument, every unordered pair of nodes, including each node paired with itself
  auto find_lcas_of_pairs(
      std::optional<std::vector<std::pair<std::string, std::string>>> pairs = std::nullopt) const
      -> std::vector<std::pair<std::pair<std::string, std::string>, std::string>>;

  // Throws Tree_validation_error unless at least two distinct nodes are given
  auto find_lca(const std::vector<std::string>& nodes) const -> std::string;

  // Distances are sums of branch lengths along tree paths, i.e., time differences via the LCA
  auto get_distance(std::string_view a, std::string_view b) const -> double;
  auto get_distances(std::string_view node, bool leaves_only = false) const
      -> absl::flat_hash_map<std::string, double>;

  // Node attributes
  // ---------------

  auto set_attribute(std::string_view node, const std::string& name, Attribute_value value) -> void;
  auto get_attribute(std::string_view node, std::string_view name) const -> const Attribute_value&;
  auto filter_nodes(const std::function<bool(std::string_view node)>& condition) const -> std::vector<std::string>;

  // Leaf-indexed tables and priors
  // ------------------------------

  auto get_dissimilarity_map() const -> const std::optional<Dissimilarity_map>& { return dissimilarity_map_; }
  auto set_dissimilarity_map(Dissimilarity_map dissimilarity_map) -> void;
  auto compute_dissimilarity_map(
      const Dissimilarity_function& dissimilarity_function,
      std::optional<Prior_transformation> prior_transformation = std::nullopt)
      -> void;

  auto cell_meta() const -> const std::optional<Metadata_table>& { return cell_meta_; }
  auto set_cell_meta(Metadata_table cell_meta) -> void { cell_meta_ = std::move(cell_meta); }
  auto character_meta() const -> const std::optional<Metadata_table>& { return character_meta_; }
  auto set_character_meta(Metadata_table character_meta) -> void { character_meta_ = std::move(character_meta); }

  auto priors() const -> const std::optional<Priors>& { return priors_; }
  auto set_priors(Priors priors) -> void { priors_ = std::move(priors); }

  // Serialization
  // -------------

  // Throws Tree_validation_error if any node name contains a ','
  auto get_newick(bool record_branch_lengths = false) const -> std::string;
  auto get_tree_topology() const -> Raw_topology;

 private:
  Lineage_tree_config config_;
  Tree<Lineage_node> tree_{};
  absl::flat_hash_map<std::string, Node_index> index_of_{};
  mutable Structural_cache cache_{};

  std::optional<Character_matrix> original_matrix_{};
  std::optional<Character_matrix> current_matrix_{};
  std::optional<Priors> priors_{};
  std::optional<Dissimilarity_map> dissimilarity_map_{};
  std::optional<Metadata_table> cell_meta_{};
  std::optional<Metadata_table> character_meta_{};

  Tree_warning_hook warning_hook_{default_tree_warning_hook};

  auto check_initialized() const -> void;
  auto node_of(std::string_view name) const -> Node_index;  // Also checks initialization
  auto edge_of(std::string_view parent, std::string_view child) const -> Node_index;  // Returns child
  auto name_of(Node_index node) const -> const std::string& { return tree_.at(node).name; }
  auto names_of(const std::vector<Node_index>& nodes) const -> std::vector<std::string>;

  auto rebuild_index() -> void;
  auto erase(const Node_set& doomed) -> void;
  auto rederive_times(Node_index start) -> void;
  auto compute_lcas(const std::vector<std::pair<Node_index, Node_index>>& pairs) const -> std::vector<Node_index>;
  auto fill_distances_from(Node_index source) const -> void;

  // Sets states without validation, mirroring leaf states into the current character matrix
  auto store_character_states(Node_index node, State_vector states) -> void;

  // Brings the character matrix, cell metadata and dissimilarity map in line with the leaf set:
  // rows of departed leaves are dropped; new leaves get all-missing rows, blank metadata rows and
  // infinitely distant dissimilarities.
  auto register_data_with_tree() -> void;
};

// Checks the arena's parent/child links, that time(v) == time(u) + length(u, v) on every edge, that the
// name index is accurate and that the current character matrix has exactly one row per leaf
auto assert_lineage_tree_integrity(const Lineage_tree& tree, bool force = false) -> void;

}  // namespace lineage

#endif // LINEAGE_LINEAGE_TREE_H_
