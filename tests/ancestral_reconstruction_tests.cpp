#include "ancestral_reconstruction.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace lineage {

TEST(Ancestral_reconstruction_test, agreement_is_inherited) {
  auto children = std::vector<State_vector>{
    {1, 0, 2},
    {1, 0, 2}};
  EXPECT_THAT(lca_characters(children), testing::ElementsAre(
      Character_state{1}, Character_state{0}, Character_state{2}));
}

TEST(Ancestral_reconstruction_test, disagreement_or_missing_is_missing) {
  auto children = std::vector<State_vector>{
    {1, Missing_state{}, 2, 5},
    {1, 3,               2, 6}};
  EXPECT_THAT(lca_characters(children), testing::ElementsAre(
      Character_state{1}, Character_state{Missing_state{}}, Character_state{2}, Character_state{Missing_state{}}));
}

TEST(Ancestral_reconstruction_test, many_children) {
  auto children = std::vector<State_vector>{
    {4, 1},
    {4, 1},
    {4, 2}};
  EXPECT_THAT(lca_characters(children), testing::ElementsAre(
      Character_state{4}, Character_state{Missing_state{}}));
}

TEST(Ancestral_reconstruction_test, single_child) {
  auto children = std::vector<State_vector>{{3, Missing_state{}}};
  EXPECT_THAT(lca_characters(children), testing::ElementsAre(
      Character_state{3}, Character_state{Missing_state{}}));
}

}  // namespace lineage
