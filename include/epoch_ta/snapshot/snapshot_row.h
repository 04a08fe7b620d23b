//
// Created by adesola on 3/21/25.
//

#pragma once
#include <algorithm>
#include <cstdint>
#include <epoch_core/macros.h>
#include <string>
#include <vector>

namespace epoch_ta::snapshot {

// Latest-value row keyed by a caller supplied column list
// [date, code, field1, field2, ...]. values[i] belongs to columns[i + 2].
template <typename T> struct BasicSnapshotRow {
  std::vector<std::string> columns{};
  std::string date{};
  std::string code{};
  std::vector<T> values{};

  [[nodiscard]] T Get(std::string const &field) const {
    AssertFromStream(columns.size() >= 2, "snapshot row has no identity columns");
    auto it = std::ranges::find(columns.begin() + 2, columns.end(), field);
    AssertFromFormat(it != columns.end(), "{} is not a snapshot field", field);
    return values.at(static_cast<size_t>(
        std::distance(columns.begin() + 2, it)));
  }

  [[nodiscard]] std::vector<std::string> Fields() const {
    if (columns.size() < 2) {
      return {};
    }
    return {columns.begin() + 2, columns.end()};
  }
};

using IndicatorRow = BasicSnapshotRow<double>;
using PatternRow = BasicSnapshotRow<int64_t>;

[[nodiscard]] std::string ToJson(IndicatorRow const &row);
[[nodiscard]] std::string ToJson(PatternRow const &row);

} // namespace epoch_ta::snapshot
