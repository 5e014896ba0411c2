#include "metadata_table.h"

#include <algorithm>
#include <stdexcept>

#include "absl/strings/str_format.h"

namespace lineage {

auto Metadata_table::row_index_of(std::string_view key) const -> int {
  auto it = index_.find(key);
  if (it == index_.end()) {
    throw std::out_of_range(absl::StrFormat("No row '%s' in metadata table", key));
  }
  return it->second;
}

auto Metadata_table::column_index_of(std::string_view column) const -> int {
  auto it = std::ranges::find(columns_, column);
  if (it == columns_.end()) {
    throw std::out_of_range(absl::StrFormat("No column '%s' in metadata table", column));
  }
  return static_cast<int>(it - columns_.begin());
}

auto Metadata_table::at(std::string_view key, std::string_view column) const -> const Cell& {
  return rows_[row_index_of(key)][column_index_of(column)];
}

auto Metadata_table::set(std::string_view key, std::string_view column, Cell value) -> void {
  rows_[row_index_of(key)][column_index_of(column)] = std::move(value);
}

auto Metadata_table::set_row(const std::string& key, std::vector<Cell> values) -> void {
  if (values.size() != columns_.size()) {
    throw std::invalid_argument(absl::StrFormat(
        "Metadata row '%s' has %d values, but the table has %d columns",
        key, std::ssize(values), std::ssize(columns_)));
  }
  auto it = index_.find(key);
  if (it != index_.end()) {
    rows_[it->second] = std::move(values);
  } else {
    index_.try_emplace(key, num_rows());
    keys_.push_back(key);
    rows_.push_back(std::move(values));
  }
}

auto Metadata_table::add_blank_row(const std::string& key) -> void {
  set_row(key, std::vector<Cell>(columns_.size(), std::nullopt));
}

auto Metadata_table::erase_row(std::string_view key) -> bool {
  auto it = index_.find(key);
  if (it == index_.end()) { return false; }

  auto i = it->second;
  keys_.erase(keys_.begin() + i);
  rows_.erase(rows_.begin() + i);
  index_.clear();
  for (auto j = 0; j != num_rows(); ++j) {
    index_.try_emplace(keys_[j], j);
  }
  return true;
}

}  // namespace lineage
