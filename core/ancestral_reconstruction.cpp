#include "ancestral_reconstruction.h"

#include "absl/log/check.h"

namespace lineage {

auto lca_characters(std::span<const State_vector> children_states) -> State_vector {
  CHECK(not children_states.empty());
  auto num_characters = std::ssize(children_states.front());
  for (const auto& states : children_states) {
    CHECK_EQ(std::ssize(states), num_characters);
  }

  auto result = State_vector(num_characters, Missing_state{});
  for (auto i = 0; i != num_characters; ++i) {
    const auto& first = children_states.front()[i];
    if (is_missing(first)) { continue; }

    auto all_agree = true;
    for (const auto& states : children_states.subspan(1)) {
      if (states[i] != first) {
        all_agree = false;
        break;
      }
    }
    if (all_agree) {
      result[i] = first;
    }
  }
  return result;
}

}  // namespace lineage
