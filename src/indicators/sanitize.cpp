//
// Created by adesola on 3/11/25.
//
#include <algorithm>
#include <cmath>
#include <epoch_ta/indicators/sanitize.h>

namespace epoch_ta::indicator {

double SanitizeValue(double value, epoch_core::SanitizeMode mode) {
  switch (mode) {
  case epoch_core::SanitizeMode::NaN:
    return std::isnan(value) ? 0.0 : value;
  case epoch_core::SanitizeMode::NaNAndInf:
    return std::isfinite(value) ? value : 0.0;
  default:
    return value;
  }
}

void Sanitize(std::vector<double> &column, epoch_core::SanitizeMode mode) {
  if (mode == epoch_core::SanitizeMode::None ||
      mode == epoch_core::SanitizeMode::Null) {
    return;
  }
  std::ranges::transform(column, column.begin(), [mode](double value) {
    return SanitizeValue(value, mode);
  });
}

double FiniteOrZero(double value) {
  return std::isfinite(value) ? value : 0.0;
}

bool AllFinite(std::span<const double> column) {
  return std::ranges::all_of(column,
                             [](double value) { return std::isfinite(value); });
}

} // namespace epoch_ta::indicator
