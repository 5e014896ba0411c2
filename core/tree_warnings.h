#ifndef LINEAGE_TREE_WARNINGS_H_
#define LINEAGE_TREE_WARNINGS_H_

#include <functional>
#include <variant>

namespace lineage {

// Tree warning objects
namespace Tree_warnings {

// The samples of a supplied dissimilarity map are not those of the current character matrix
struct Dissimilarity_samples_mismatch {
  int num_matrix_samples;
  int num_map_samples;
};

// Dissimilarities are being computed over a character matrix that still holds ambiguous states,
// so the scoring function must cope with Ambiguous_state entries
struct Ambiguous_character_matrix {
  int num_ambiguous_samples;
};

}  // namespace Tree_warnings

using Tree_warning = std::variant<
  Tree_warnings::Dissimilarity_samples_mismatch,
  Tree_warnings::Ambiguous_character_matrix
  >;

using Tree_warning_hook = std::function<void(const Tree_warning&)>;

auto default_tree_warning_hook(const Tree_warning& warning) -> void;

}  // namespace lineage

#endif // LINEAGE_TREE_WARNINGS_H_
