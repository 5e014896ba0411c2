#include "metadata_table.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace lineage {

TEST(Metadata_table_test, rows_and_columns) {
  auto table = Metadata_table{{"cluster", "umi_count"}};
  table.set_row("cell1", {Attribute_value{std::string{"A"}}, Attribute_value{int64_t{12}}});
  table.add_blank_row("cell2");

  EXPECT_THAT(table.row_keys(), testing::ElementsAre("cell1", "cell2"));
  EXPECT_THAT(table.num_rows(), testing::Eq(2));
  EXPECT_THAT(table.at("cell1", "umi_count"), testing::Optional(Attribute_value{int64_t{12}}));
  EXPECT_FALSE(table.at("cell2", "cluster").has_value());

  table.set("cell2", "cluster", Attribute_value{std::string{"B"}});
  EXPECT_THAT(table.at("cell2", "cluster"), testing::Optional(Attribute_value{std::string{"B"}}));

  EXPECT_THROW(table.at("cell3", "cluster"), std::out_of_range);
  EXPECT_THROW(table.at("cell1", "tissue"), std::out_of_range);
  EXPECT_THROW(table.set_row("cell3", {std::nullopt}), std::invalid_argument);
}

TEST(Metadata_table_test, erase_row) {
  auto table = Metadata_table{{"x"}};
  table.set_row("a", {Attribute_value{1.0}});
  table.set_row("b", {Attribute_value{2.0}});
  table.set_row("c", {Attribute_value{3.0}});

  EXPECT_TRUE(table.erase_row("b"));
  EXPECT_FALSE(table.erase_row("b"));
  EXPECT_THAT(table.row_keys(), testing::ElementsAre("a", "c"));
  EXPECT_THAT(table.at("c", "x"), testing::Optional(Attribute_value{3.0}));
  EXPECT_FALSE(table.contains("b"));
}

}  // namespace lineage
