#include "dissimilarity.h"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "absl/strings/str_format.h"

#include "tree_errors.h"

namespace lineage {

auto parse_prior_transformation(std::string_view name) -> Prior_transformation {
  if (name == "negative_log") { return Prior_transformation::k_negative_log; }
  if (name == "inverse") { return Prior_transformation::k_inverse; }
  if (name == "square_root_inverse") { return Prior_transformation::k_square_root_inverse; }
  throw Tree_validation_error(absl::StrFormat(
      "Prior transformation '%s' not supported (use negative_log, inverse or square_root_inverse)", name));
}

auto transform_priors(const Priors& priors, Prior_transformation transformation) -> Character_weights {
  auto weights = Character_weights{};
  for (const auto& [character, state_probs] : priors) {
    auto& character_weights = weights[character];
    for (const auto& [state, p] : state_probs) {
      if (not (p > 0.0 && p <= 1.0)) {
        throw Tree_validation_error(absl::StrFormat(
            "Prior probability for state %d of character %d must be in (0, 1], got %g", state, character, p));
      }
      switch (transformation) {
        case Prior_transformation::k_negative_log:
          character_weights[state] = -std::log(p);
          break;
        case Prior_transformation::k_inverse:
          character_weights[state] = 1.0 / p;
          break;
        case Prior_transformation::k_square_root_inverse:
          character_weights[state] = std::sqrt(1.0 / p);
          break;
      }
    }
  }
  return weights;
}

Dissimilarity_map::Dissimilarity_map(std::vector<std::string> samples) {
  for (const auto& sample : samples) {
    add_sample(sample);
  }
}

auto Dissimilarity_map::index_of(std::string_view sample) const -> int {
  auto it = index_.find(sample);
  if (it == index_.end()) {
    throw std::out_of_range(absl::StrFormat("No sample '%s' in dissimilarity map", sample));
  }
  return it->second;
}

auto Dissimilarity_map::at(std::string_view a, std::string_view b) const -> double {
  return d_[index_of(a)][index_of(b)];
}

auto Dissimilarity_map::set(std::string_view a, std::string_view b, double d) -> void {
  auto i = index_of(a);
  auto j = index_of(b);
  if (i == j) {
    throw std::invalid_argument(absl::StrFormat(
        "Dissimilarity of sample '%s' to itself is fixed at 0", a));
  }
  d_[i][j] = d;
  d_[j][i] = d;
}

auto Dissimilarity_map::add_sample(const std::string& sample) -> void {
  if (contains(sample)) {
    throw std::invalid_argument(absl::StrFormat("Sample '%s' already in dissimilarity map", sample));
  }
  constexpr auto inf = std::numeric_limits<double>::infinity();
  for (auto& row : d_) {
    row.push_back(inf);
  }
  auto new_row = std::vector<double>(names_.size() + 1, inf);
  new_row.back() = 0.0;
  d_.push_back(std::move(new_row));

  index_.try_emplace(sample, num_samples());
  names_.push_back(sample);
}

auto Dissimilarity_map::erase_sample(std::string_view sample) -> bool {
  auto it = index_.find(sample);
  if (it == index_.end()) { return false; }

  auto i = it->second;
  names_.erase(names_.begin() + i);
  d_.erase(d_.begin() + i);
  for (auto& row : d_) {
    row.erase(row.begin() + i);
  }

  index_.clear();
  for (auto j = 0; j != num_samples(); ++j) {
    index_.try_emplace(names_[j], j);
  }
  return true;
}

auto compute_pairwise_dissimilarities(
    const Character_matrix& character_matrix,
    const Dissimilarity_function& dissimilarity_function,
    const Character_weights* weights,
    int missing_state_indicator)
    -> Dissimilarity_map {

  const auto& samples = character_matrix.sample_names();
  auto result = Dissimilarity_map{samples};
  for (auto i = 0; i != std::ssize(samples); ++i) {
    const auto& row_i = character_matrix.row(samples[i]);
    for (auto j = i + 1; j != std::ssize(samples); ++j) {
      const auto& row_j = character_matrix.row(samples[j]);
      result.set(samples[i], samples[j],
                 dissimilarity_function(row_i, row_j, missing_state_indicator, weights));
    }
  }
  return result;
}

}  // namespace lineage
