#include "character_state.h"

#include <sstream>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace lineage {

TEST(Character_state_test, kinds) {
  auto missing = Character_state{Missing_state{}};
  auto single = Character_state{3};
  auto ambiguous = Character_state{Ambiguous_state{{1, 2}}};

  EXPECT_TRUE(is_missing(missing));
  EXPECT_FALSE(is_missing(single));
  EXPECT_FALSE(is_ambiguous(single));
  EXPECT_TRUE(is_ambiguous(ambiguous));

  EXPECT_FALSE(is_ambiguous(State_vector{single, missing}));
  EXPECT_TRUE(is_ambiguous(State_vector{single, ambiguous}));
}

TEST(Character_state_test, collapse_ambiguity) {
  EXPECT_THAT(collapse_ambiguity(Ambiguous_state{{3, 1, 3, 3, 2, 1}}),
              testing::Eq(Character_state{Ambiguous_state{{1, 2, 3}}}));
  EXPECT_THAT(collapse_ambiguity(5), testing::Eq(Character_state{5}));
  EXPECT_THAT(collapse_ambiguity(Missing_state{}), testing::Eq(Character_state{Missing_state{}}));
}

TEST(Character_state_test, collapse_ambiguity_is_idempotent) {
  auto once = collapse_ambiguity(Ambiguous_state{{4, 4, 0, 7}});
  EXPECT_THAT(collapse_ambiguity(once), testing::Eq(once));
}

TEST(Character_state_test, from_ints) {
  auto states = states_from_ints({0, -1, 4}, -1);
  EXPECT_THAT(states, testing::ElementsAre(
      Character_state{0}, Character_state{Missing_state{}}, Character_state{4}));
  EXPECT_THAT(states_from_ints({7, 99}, 99), testing::ElementsAre(
      Character_state{7}, Character_state{Missing_state{}}));
}

TEST(Character_state_test, output) {
  auto os = std::ostringstream{};
  os << Character_state{7} << " " << Character_state{Missing_state{}} << " "
     << Character_state{Ambiguous_state{{1, 2}}};
  EXPECT_THAT(os.str(), testing::StrEq("7 ? (1,2)"));
}

}  // namespace lineage
