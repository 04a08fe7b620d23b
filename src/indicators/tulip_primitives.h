//
// Created by adesola on 3/12/25.
//

#pragma once
#include <epoch_ta/indicators/indicator_step.h>
#include <indicators.h>

namespace epoch_ta::indicator::tulip {

// Throws when the library has no indicator with this name.
const ti_indicator_info *FindIndicator(std::string const &name);

// Warm-up rows the primitive consumes before its first output.
size_t Start(ti_indicator_info const &info, std::vector<double> const &options);

// Runs the primitive over equally sized inputs. Every output has the input
// length, with NaN in the warm-up rows.
std::vector<Column> Run(std::string const &name,
                        std::vector<std::span<const double>> const &inputs,
                        std::vector<double> const &options);

} // namespace epoch_ta::indicator::tulip
