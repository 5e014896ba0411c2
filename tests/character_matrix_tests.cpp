#include "character_matrix.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "tree_errors.h"

namespace lineage {

TEST(Character_matrix_test, from_ints) {
  auto m = Character_matrix::from_ints({{"a", {1, 0, -1}}, {"b", {1, 2, 0}}}, -1);

  EXPECT_THAT(m.num_characters(), testing::Eq(3));
  EXPECT_THAT(m.num_samples(), testing::Eq(2));
  EXPECT_THAT(m.sample_names(), testing::ElementsAre("a", "b"));
  EXPECT_THAT(m.row("a"), testing::ElementsAre(
      Character_state{1}, Character_state{0}, Character_state{Missing_state{}}));
  EXPECT_FALSE(m.is_ambiguous());
}

TEST(Character_matrix_test, from_ints_rejects_bad_rows) {
  EXPECT_THROW(Character_matrix::from_ints({{"a", {1}}, {"a", {2}}}, -1), Tree_validation_error);
  EXPECT_THROW(Character_matrix::from_ints({{"a", {1, 2}}, {"b", {2}}}, -1), Tree_validation_error);
  EXPECT_THROW(Character_matrix::from_ints({{"", {1}}}, -1), Tree_validation_error);
}

TEST(Character_matrix_test, set_and_erase_rows) {
  auto m = Character_matrix{2};
  m.set_row("x", {1, 2});
  m.set_row("y", {3, Missing_state{}});
  m.set_row("z", {0, 0});

  m.set_row("y", {3, 4});  // Replaces in place
  EXPECT_THAT(m.sample_names(), testing::ElementsAre("x", "y", "z"));
  EXPECT_THAT(m.row("y"), testing::ElementsAre(Character_state{3}, Character_state{4}));

  EXPECT_TRUE(m.erase_row("x"));
  EXPECT_FALSE(m.erase_row("x"));
  EXPECT_THAT(m.sample_names(), testing::ElementsAre("y", "z"));
  EXPECT_THAT(m.row("z"), testing::ElementsAre(Character_state{0}, Character_state{0}));
  EXPECT_THROW(m.row("x"), std::out_of_range);

  EXPECT_THROW(m.set_row("w", {1}), Tree_validation_error);
}

TEST(Character_matrix_test, ambiguity) {
  auto m = Character_matrix{2};
  m.set_row("x", {1, 2});
  m.set_row("y", {Ambiguous_state{{1, 3}}, 2});
  m.set_row("z", {Ambiguous_state{{0, 0}}, Ambiguous_state{{5, 6}}});

  EXPECT_TRUE(m.is_ambiguous());
  EXPECT_THAT(m.num_ambiguous_samples(), testing::Eq(2));
}

}  // namespace lineage
