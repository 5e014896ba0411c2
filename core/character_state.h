#ifndef LINEAGE_CHARACTER_STATE_H_
#define LINEAGE_CHARACTER_STATE_H_

#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

namespace lineage {

// Character states
// ================
//
// A character is one target site of a lineage-tracing barcode; its state in a given cell is an
// integer code for the indel outcome observed there.  A state is one of:
//
// - Missing_state: not observed (dropout, or unresolved during reconstruction)
// - int: a single observed state (0 conventionally means "uncut")
// - Ambiguous_state: several candidate states, possibly repeated; repetition encodes the relative
//   abundance of each candidate (e.g., several reads of the same cell disagreeing)
//
// When exchanged with integer tables, Missing_state is encoded by the tree's missing-state indicator.

struct Missing_state {
  auto operator==(const Missing_state&) const -> bool = default;
};

struct Ambiguous_state {
  std::vector<int> candidates;

  auto operator==(const Ambiguous_state& that) const -> bool = default;
};

using Character_state = std::variant<Missing_state, int, Ambiguous_state>;

// One state per character, in character order
using State_vector = std::vector<Character_state>;

inline auto is_missing(const Character_state& s) -> bool { return std::holds_alternative<Missing_state>(s); }
inline auto is_ambiguous(const Character_state& s) -> bool { return std::holds_alternative<Ambiguous_state>(s); }
auto is_ambiguous(const State_vector& states) -> bool;

// Keeps only the distinct candidates of an ambiguous state, in ascending order.  Other states are
// returned unchanged.
auto collapse_ambiguity(const Character_state& s) -> Character_state;

// Converts an integer row, mapping `missing_state_indicator` to Missing_state
auto states_from_ints(const std::vector<int>& values, int missing_state_indicator) -> State_vector;

auto operator<<(std::ostream& os, const Missing_state&) -> std::ostream&;
auto operator<<(std::ostream& os, const Ambiguous_state& s) -> std::ostream&;
auto operator<<(std::ostream& os, const Character_state& s) -> std::ostream&;

}  // namespace lineage

#endif // LINEAGE_CHARACTER_STATE_H_
