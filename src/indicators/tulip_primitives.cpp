//
// Created by adesola on 3/12/25.
//
#include "tulip_primitives.h"
#include <epoch_core/macros.h>
#include <limits>

namespace epoch_ta::indicator::tulip {

const ti_indicator_info *FindIndicator(std::string const &name) {
  const ti_indicator_info *info = ti_find_indicator(name.c_str());
  AssertFromFormat(info != nullptr, "Unknown tulip indicator: {}", name);
  return info;
}

size_t Start(ti_indicator_info const &info,
             std::vector<double> const &options) {
  const int start = info.start(options.data());
  AssertFromFormat(start >= 0, "Invalid options for tulip indicator {}",
                   info.name);
  return static_cast<size_t>(start);
}

std::vector<Column> Run(std::string const &name,
                        std::vector<std::span<const double>> const &inputs,
                        std::vector<double> const &options) {
  auto const &info = *FindIndicator(name);
  AssertFromFormat(inputs.size() == static_cast<size_t>(info.inputs),
                   "{} expects {} inputs, got {}", name, info.inputs,
                   inputs.size());
  AssertFromFormat(options.size() == static_cast<size_t>(info.options),
                   "{} expects {} options, got {}", name, info.options,
                   options.size());

  const size_t nRows = inputs.empty() ? 0 : inputs.front().size();
  std::vector<Column> outputs(
      info.outputs,
      Column(nRows, std::numeric_limits<double>::quiet_NaN()));

  const size_t start = Start(info, options);
  if (start >= nRows) {
    return outputs;
  }

  std::vector<const TI_REAL *> inputPtrs;
  inputPtrs.reserve(inputs.size());
  for (auto const &input : inputs) {
    AssertFromFormat(input.size() == nRows, "{} inputs differ in length",
                     name);
    inputPtrs.push_back(input.data());
  }

  std::vector<TI_REAL *> outputPtrs;
  outputPtrs.reserve(outputs.size());
  for (auto &output : outputs) {
    outputPtrs.push_back(output.data() + start);
  }

  const int rc = info.indicator(static_cast<int>(nRows), inputPtrs.data(),
                                options.data(), outputPtrs.data());
  AssertFromFormat(rc == TI_OKAY, "tulip {} failed with code {}", name, rc);
  return outputs;
}

} // namespace epoch_ta::indicator::tulip
