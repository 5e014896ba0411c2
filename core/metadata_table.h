#ifndef LINEAGE_METADATA_TABLE_H_
#define LINEAGE_METADATA_TABLE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"

namespace lineage {

// Values that may decorate nodes (see Lineage_tree::set_attribute) or fill metadata tables
using Attribute_value = std::variant<bool, int64_t, double, std::string>;

// A table of auxiliary data with named columns and one row per key (a cell name for cell metadata,
// a character index rendered as a string for character metadata).  Blank entries are std::nullopt.
class Metadata_table {
 public:
  using Cell = std::optional<Attribute_value>;

  Metadata_table() = default;
  explicit Metadata_table(std::vector<std::string> columns) : columns_{std::move(columns)} {}

  auto columns() const -> const std::vector<std::string>& { return columns_; }
  auto row_keys() const -> const std::vector<std::string>& { return keys_; }
  auto num_rows() const -> int { return static_cast<int>(std::ssize(keys_)); }
  auto contains(std::string_view key) const -> bool { return index_.contains(key); }

  // Throws std::out_of_range on unknown rows or columns
  auto at(std::string_view key, std::string_view column) const -> const Cell&;
  auto set(std::string_view key, std::string_view column, Cell value) -> void;

  // Throws std::invalid_argument if `values` does not have one entry per column
  auto set_row(const std::string& key, std::vector<Cell> values) -> void;
  auto add_blank_row(const std::string& key) -> void;
  auto erase_row(std::string_view key) -> bool;

  auto operator==(const Metadata_table& that) const -> bool = default;

 private:
  std::vector<std::string> columns_{};
  std::vector<std::string> keys_{};
  std::vector<std::vector<Cell>> rows_{};
  absl::flat_hash_map<std::string, int> index_{};

  auto row_index_of(std::string_view key) const -> int;
  auto column_index_of(std::string_view column) const -> int;
};

}  // namespace lineage

#endif // LINEAGE_METADATA_TABLE_H_
