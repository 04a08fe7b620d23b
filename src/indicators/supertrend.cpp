//
// Created by adesola on 3/12/25.
//
#include <epoch_core/macros.h>
#include <epoch_ta/indicators/supertrend.h>

namespace epoch_ta::indicator {

TrendBandState TrendBandRecurrence::Run(std::span<const double> high,
                                        std::span<const double> low,
                                        std::span<const double> close,
                                        std::span<const double> atr) const {
  const size_t nRows = close.size();
  AssertFromFormat(high.size() == nRows && low.size() == nRows &&
                       atr.size() == nRows,
                   "supertrend inputs differ in length");

  std::vector<double> rawUpper(nRows);
  std::vector<double> rawLower(nRows);
  for (size_t i = 0; i < nRows; ++i) {
    const double mid = (high[i] + low[i]) / 2.0;
    const double offset = m_options.multiplier * atr[i];
    rawUpper[i] = mid + offset;
    rawLower[i] = mid - offset;
  }
  return RunOnBands(close, rawUpper, rawLower);
}

TrendBandState
TrendBandRecurrence::RunOnBands(std::span<const double> close,
                                std::span<const double> rawUpper,
                                std::span<const double> rawLower) const {
  const size_t nRows = close.size();
  AssertFromFormat(rawUpper.size() == nRows && rawLower.size() == nRows,
                   "supertrend bands differ in length");

  TrendBandState state{.upperBand = std::vector<double>(nRows),
                       .lowerBand = std::vector<double>(nRows),
                       .trendLine = std::vector<double>(nRows)};
  if (nRows == 0) {
    return state;
  }

  auto &ub = state.upperBand;
  auto &lb = state.lowerBand;
  auto &line = state.trendLine;

  ub[0] = rawUpper[0];
  lb[0] = rawLower[0];
  bool onUpper = close[0] <= ub[0];
  line[0] = onUpper ? ub[0] : lb[0];

  for (size_t i = 1; i < nRows; ++i) {
    const double prevClose = close[i - 1];

    ub[i] = (rawUpper[i] < ub[i - 1] || prevClose > ub[i - 1]) ? rawUpper[i]
                                                              : ub[i - 1];
    lb[i] = (rawLower[i] > lb[i - 1] || prevClose < lb[i - 1]) ? rawLower[i]
                                                              : lb[i - 1];

    bool fromUpper = onUpper;
    if (line[i - 1] == ub[i - 1]) {
      fromUpper = true;
    } else if (line[i - 1] == lb[i - 1]) {
      fromUpper = false;
    } else if (m_options.fallback == epoch_core::TrendFallback::CarryValue) {
      line[i] = line[i - 1];
      continue;
    }

    onUpper = fromUpper ? close[i] <= ub[i] : !(close[i] > lb[i]);
    line[i] = onUpper ? ub[i] : lb[i];
  }
  return state;
}

} // namespace epoch_ta::indicator
