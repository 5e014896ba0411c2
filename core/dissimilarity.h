#ifndef LINEAGE_DISSIMILARITY_H_
#define LINEAGE_DISSIMILARITY_H_

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "character_matrix.h"

namespace lineage {

// Priors and weights
// ==================

// priors[character][state] is the probability of `character` mutating to `state`
using Priors = absl::flat_hash_map<int, absl::flat_hash_map<int, double>>;

// Same layout as Priors, but holding a transformed probability (e.g., -log p) per state
using Character_weights = absl::flat_hash_map<int, absl::flat_hash_map<int, double>>;

enum class Prior_transformation {
  k_negative_log,        // w = -log(p)
  k_inverse,             // w = 1/p
  k_square_root_inverse  // w = sqrt(1/p)
};

// Accepts "negative_log", "inverse" or "square_root_inverse"; throws Tree_validation_error otherwise
auto parse_prior_transformation(std::string_view name) -> Prior_transformation;

// Throws Tree_validation_error if any probability is not in (0, 1]
auto transform_priors(const Priors& priors, Prior_transformation transformation) -> Character_weights;


// Dissimilarity maps
// ==================

// A symmetric table of pairwise dissimilarities between samples, independent of any tree.
// The diagonal is always 0.  Samples keep their insertion order.
class Dissimilarity_map {
 public:
  Dissimilarity_map() = default;

  // All off-diagonal entries start at +infinity
  explicit Dissimilarity_map(std::vector<std::string> samples);

  auto num_samples() const -> int { return static_cast<int>(std::ssize(names_)); }
  auto sample_names() const -> const std::vector<std::string>& { return names_; }
  auto contains(std::string_view sample) const -> bool { return index_.contains(sample); }

  // Throw std::out_of_range for unknown samples
  auto at(std::string_view a, std::string_view b) const -> double;
  auto set(std::string_view a, std::string_view b, double d) -> void;

  // New samples start at +infinity from everybody else
  auto add_sample(const std::string& sample) -> void;
  auto erase_sample(std::string_view sample) -> bool;

  auto operator==(const Dissimilarity_map& that) const -> bool = default;

 private:
  std::vector<std::string> names_{};
  absl::flat_hash_map<std::string, int> index_{};
  std::vector<std::vector<double>> d_{};  // d_[i][j] for samples i & j

  auto index_of(std::string_view sample) const -> int;
};


// Pluggable scoring
// =================

// Scores the dissimilarity between two samples' state vectors.  `weights` is null when no priors are
// available.  `missing_state_indicator` is the integer code of Missing_state in the caller's tables.
using Dissimilarity_function = std::function<double(
    const State_vector& a,
    const State_vector& b,
    int missing_state_indicator,
    const Character_weights* weights)>;

// Scores every unordered pair of rows in `character_matrix` once
auto compute_pairwise_dissimilarities(
    const Character_matrix& character_matrix,
    const Dissimilarity_function& dissimilarity_function,
    const Character_weights* weights,
    int missing_state_indicator)
    -> Dissimilarity_map;

}  // namespace lineage

#endif // LINEAGE_DISSIMILARITY_H_
