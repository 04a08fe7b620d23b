//
// Created by adesola on 3/11/25.
//
#include <algorithm>
#include <arrow/type.h>
#include <epoch_core/macros.h>
#include <epoch_ta/indicators/indicator_step.h>

namespace epoch_ta::indicator {

FieldStore FieldStore::FromBars(epoch_frame::DataFrame const &bars) {
  FieldStore store(bars.num_rows());
  const auto columnNames = bars.column_names();
  for (auto const &column : bar::ALL_COLUMNS) {
    const std::string name{column};
    if (std::ranges::find(columnNames, name) == columnNames.end()) {
      continue;
    }
    // volume may arrive as an integer column
    store.Set(name, bars[name]
                        .cast(arrow::float64())
                        .contiguous_array()
                        .to_vector<double>());
  }
  return store;
}

std::span<const double> FieldStore::Get(std::string const &name) const {
  auto it = m_columns.find(name);
  AssertFromFormat(it != m_columns.end(), "Field '{}' is not available",
                   name);
  return it->second;
}

void FieldStore::Set(std::string const &name, Column column) {
  AssertFromFormat(column.size() == m_rows,
                   "Field '{}' has {} rows, expected {}", name, column.size(),
                   m_rows);
  AssertFromFormat(!m_columns.contains(name), "Field '{}' is already assigned",
                   name);
  m_columns.emplace(name, std::move(column));
}

std::vector<std::span<const double>>
IndicatorStepBase::Inputs(FieldStore const &store) const {
  std::vector<std::span<const double>> inputs;
  inputs.reserve(m_reads.size());
  for (auto const &read : m_reads) {
    inputs.emplace_back(store.Get(read));
  }
  return inputs;
}

} // namespace epoch_ta::indicator
