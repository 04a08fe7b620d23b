//
// Created by adesola on 3/11/25.
//

#pragma once
#include <epoch_ta/core/constants.h>
#include <span>
#include <vector>

namespace epoch_ta::indicator {

[[nodiscard]] double SanitizeValue(double value, epoch_core::SanitizeMode mode);

// Applied in place to a freshly produced column. SanitizeMode::None and
// SanitizeMode::Null leave the column untouched.
void Sanitize(std::vector<double> &column, epoch_core::SanitizeMode mode);

// Replaces NaN and +/-Infinity with zero regardless of mode.
[[nodiscard]] double FiniteOrZero(double value);

[[nodiscard]] bool AllFinite(std::span<const double> column);

} // namespace epoch_ta::indicator
