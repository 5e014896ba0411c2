#include "character_state.h"

#include <algorithm>

namespace lineage {

auto is_ambiguous(const State_vector& states) -> bool {
  return std::ranges::any_of(states, [](const auto& s) { return is_ambiguous(s); });
}

auto collapse_ambiguity(const Character_state& s) -> Character_state {
  if (not is_ambiguous(s)) { return s; }

  auto candidates = std::get<Ambiguous_state>(s).candidates;
  std::ranges::sort(candidates);
  auto [first, last] = std::ranges::unique(candidates);
  candidates.erase(first, last);
  return Ambiguous_state{std::move(candidates)};
}

auto states_from_ints(const std::vector<int>& values, int missing_state_indicator) -> State_vector {
  auto result = State_vector{};
  result.reserve(values.size());
  for (const auto& v : values) {
    if (v == missing_state_indicator) {
      result.push_back(Missing_state{});
    } else {
      result.push_back(v);
    }
  }
  return result;
}

auto operator<<(std::ostream& os, const Missing_state&) -> std::ostream& {
  return os << "?";
}

auto operator<<(std::ostream& os, const Ambiguous_state& s) -> std::ostream& {
  return os << "(" << absl::StrJoin(s.candidates, ",") << ")";
}

auto operator<<(std::ostream& os, const Character_state& s) -> std::ostream& {
  std::visit([&os](const auto& v) { os << v; }, s);
  return os;
}

}  // namespace lineage
