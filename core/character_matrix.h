#ifndef LINEAGE_CHARACTER_MATRIX_H_
#define LINEAGE_CHARACTER_MATRIX_H_

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "character_state.h"

namespace lineage {

// A table of character states with one row per sample (cell) and one column per character.
// Rows keep their insertion order.  Unlike a tree node's state vector, a row may be looked up by
// sample name in O(1).
class Character_matrix {
 public:
  Character_matrix() = default;
  explicit Character_matrix(int num_characters) : num_characters_{num_characters} {}

  // Builds a matrix from integer rows, mapping `missing_state_indicator` to Missing_state.
  // Throws Tree_validation_error on empty or repeated sample names, or rows of unequal length.
  static auto from_ints(
      const std::vector<std::pair<std::string, std::vector<int>>>& rows,
      int missing_state_indicator)
      -> Character_matrix;

  auto num_characters() const -> int { return num_characters_; }
  auto num_samples() const -> int { return static_cast<int>(std::ssize(rows_)); }

  auto contains(std::string_view sample) const -> bool { return index_.contains(sample); }
  auto sample_names() const -> const std::vector<std::string>& { return names_; }

  // Throws std::out_of_range if `sample` has no row
  auto row(std::string_view sample) const -> const State_vector&;

  // Inserts a new row at the end or replaces an existing one in place
  auto set_row(const std::string& sample, State_vector states) -> void;
  auto erase_row(std::string_view sample) -> bool;

  // True iff any entry of any row is an Ambiguous_state
  auto is_ambiguous() const -> bool;
  auto num_ambiguous_samples() const -> int;

  auto operator==(const Character_matrix& that) const -> bool {
    return num_characters_ == that.num_characters_ && names_ == that.names_ && rows_ == that.rows_;
  }

 private:
  int num_characters_{0};
  std::vector<std::string> names_{};
  std::vector<State_vector> rows_{};
  absl::flat_hash_map<std::string, int> index_{};

  auto reindex() -> void;
};

}  // namespace lineage

#endif // LINEAGE_CHARACTER_MATRIX_H_
