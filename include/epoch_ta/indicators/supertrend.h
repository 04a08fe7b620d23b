//
// Created by adesola on 3/12/25.
//

#pragma once
#include <epoch_ta/core/constants.h>
#include <span>
#include <vector>

namespace epoch_ta::indicator {

struct SupertrendOptions {
  double multiplier{defaults::SUPERTREND_MULTIPLIER};
  epoch_core::TrendFallback fallback{epoch_core::TrendFallback::SideCarry};
};

// Three parallel buffers sized to the windowed row count.
struct TrendBandState {
  std::vector<double> upperBand;
  std::vector<double> lowerBand;
  std::vector<double> trendLine;
};

/**
 * @brief Banded trend state machine (Supertrend).
 *
 * Bands ratchet toward price and only reset when price closes through them.
 * The trend line sits on the upper band in a down trend and flips to the
 * lower band once close breaks above it (and back again).
 *
 * The recurrence always restarts from row 0 of whatever window it is given.
 */
class TrendBandRecurrence {
public:
  explicit TrendBandRecurrence(SupertrendOptions options = {})
      : m_options(options) {}

  // Raw bands are mid(high, low) +/- multiplier * atr.
  [[nodiscard]] TrendBandState Run(std::span<const double> high,
                                   std::span<const double> low,
                                   std::span<const double> close,
                                   std::span<const double> atr) const;

  [[nodiscard]] TrendBandState
  RunOnBands(std::span<const double> close, std::span<const double> rawUpper,
             std::span<const double> rawLower) const;

  [[nodiscard]] SupertrendOptions const &GetOptions() const {
    return m_options;
  }

private:
  SupertrendOptions m_options;
};

} // namespace epoch_ta::indicator
