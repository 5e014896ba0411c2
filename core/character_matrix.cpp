#include "character_matrix.h"

#include <algorithm>
#include <stdexcept>

#include "absl/strings/str_format.h"

#include "tree_errors.h"

namespace lineage {

auto Character_matrix::from_ints(
    const std::vector<std::pair<std::string, std::vector<int>>>& rows,
    int missing_state_indicator)
    -> Character_matrix {

  auto result = Character_matrix{rows.empty() ? 0 : static_cast<int>(std::ssize(rows.front().second))};
  for (const auto& [sample, values] : rows) {
    if (result.contains(sample)) {
      throw Tree_validation_error(absl::StrFormat(
          "Sample '%s' appears more than once in the character matrix", sample));
    }
    result.set_row(sample, states_from_ints(values, missing_state_indicator));
  }
  return result;
}

auto Character_matrix::row(std::string_view sample) const -> const State_vector& {
  auto it = index_.find(sample);
  if (it == index_.end()) {
    throw std::out_of_range(absl::StrFormat("No sample '%s' in character matrix", sample));
  }
  return rows_[it->second];
}

auto Character_matrix::set_row(const std::string& sample, State_vector states) -> void {
  if (sample.empty()) {
    throw Tree_validation_error("Sample names in a character matrix must be non-empty strings");
  }
  if (std::ssize(states) != num_characters_) {
    throw Tree_validation_error(absl::StrFormat(
        "Row for sample '%s' has %d characters, but the character matrix has %d",
        sample, std::ssize(states), num_characters_));
  }

  auto it = index_.find(sample);
  if (it != index_.end()) {
    rows_[it->second] = std::move(states);
  } else {
    index_.try_emplace(sample, num_samples());
    names_.push_back(sample);
    rows_.push_back(std::move(states));
  }
}

auto Character_matrix::erase_row(std::string_view sample) -> bool {
  auto it = index_.find(sample);
  if (it == index_.end()) { return false; }

  auto i = it->second;
  names_.erase(names_.begin() + i);
  rows_.erase(rows_.begin() + i);
  reindex();
  return true;
}

auto Character_matrix::is_ambiguous() const -> bool {
  return std::ranges::any_of(rows_, [](const auto& r) { return lineage::is_ambiguous(r); });
}

auto Character_matrix::num_ambiguous_samples() const -> int {
  return static_cast<int>(std::ranges::count_if(rows_, [](const auto& r) { return lineage::is_ambiguous(r); }));
}

auto Character_matrix::reindex() -> void {
  index_.clear();
  for (auto i = 0; i != num_samples(); ++i) {
    index_.try_emplace(names_[i], i);
  }
}

}  // namespace lineage
