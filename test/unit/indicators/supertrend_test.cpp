//
// Created by adesola on 3/12/25.
//

#include "common/bar_fixtures.h"
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <epoch_core/catch_defs.h>
#include <epoch_ta/indicators/supertrend.h>
#include <limits>

using namespace epoch_ta::indicator;
using namespace epoch_ta::test;

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
} // namespace

TEST_CASE("TrendBandRecurrence ratchets and flips", "[supertrend]") {
  const TrendBandRecurrence recurrence;

  const std::vector<double> close{10.0, 11.0, 13.0, 9.0};
  const std::vector<double> rawUpper{12.0, 13.0, 12.5, 14.0};
  const std::vector<double> rawLower{8.0, 9.0, 9.5, 10.0};

  const auto state = recurrence.RunOnBands(close, rawUpper, rawLower);

  // row 0 starts on the upper band since close <= upper
  // row 1 keeps the tighter upper band (13 > 12, prev close below it)
  // row 2 closes above the upper band and flips to the lower band
  // row 3 resets the upper band (prev close broke it) and closes below lower
  REQUIRE(state.upperBand == std::vector<double>{12.0, 12.0, 12.0, 14.0});
  REQUIRE(state.lowerBand == std::vector<double>{8.0, 9.0, 9.5, 10.0});
  REQUIRE(state.trendLine == std::vector<double>{12.0, 12.0, 9.5, 14.0});
}

TEST_CASE("TrendBandRecurrence initial row", "[supertrend]") {
  const TrendBandRecurrence recurrence;

  SECTION("close above the upper band starts on the lower band") {
    const auto state = recurrence.RunOnBands(std::vector<double>{20.0},
                                             std::vector<double>{12.0},
                                             std::vector<double>{8.0});
    REQUIRE(state.trendLine[0] == 8.0);
  }

  SECTION("empty input") {
    const auto state = recurrence.RunOnBands({}, {}, {});
    REQUIRE(state.trendLine.empty());
  }
}

TEST_CASE("TrendBandRecurrence line always sits on a band", "[supertrend]") {
  const auto closes = WaveCloses(300);
  const auto bars = MakeBars(closes);
  const auto high = ColumnOf(bars, epoch_ta::bar::HIGH);
  const auto low = ColumnOf(bars, epoch_ta::bar::LOW);

  std::vector<double> atr(closes.size());
  for (size_t i = 0; i < closes.size(); ++i) {
    atr[i] = high[i] - low[i];
  }

  for (double multiplier : {1.0, 2.0, 3.0}) {
    const TrendBandRecurrence recurrence{
        SupertrendOptions{.multiplier = multiplier}};
    const auto state = recurrence.Run(high, low, closes, atr);
    REQUIRE(state.trendLine.size() == closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
      const bool onBand = state.trendLine[i] == state.upperBand[i] ||
                          state.trendLine[i] == state.lowerBand[i];
      REQUIRE(onBand);
    }
  }
}

TEST_CASE("TrendBandRecurrence undefined previous line", "[supertrend]") {
  // row 0 has no lower band and closes above the upper band, so the line
  // starts undefined and matches neither band on row 1
  const std::vector<double> close{15.0, 11.0};
  const std::vector<double> rawUpper{12.0, 13.0};
  const std::vector<double> rawLower{NaN, 9.0};

  SECTION("SideCarry resolves from the tracked side") {
    const TrendBandRecurrence recurrence{
        SupertrendOptions{.fallback = epoch_core::TrendFallback::SideCarry}};
    const auto state = recurrence.RunOnBands(close, rawUpper, rawLower);
    REQUIRE(std::isnan(state.trendLine[0]));
    REQUIRE(state.upperBand[1] == 13.0);
    REQUIRE(state.trendLine[1] == 13.0);
  }

  SECTION("CarryValue repeats the previous line") {
    const TrendBandRecurrence recurrence{
        SupertrendOptions{.fallback = epoch_core::TrendFallback::CarryValue}};
    const auto state = recurrence.RunOnBands(close, rawUpper, rawLower);
    REQUIRE(std::isnan(state.trendLine[1]));
  }
}

TEST_CASE("TrendBandRecurrence rejects mismatched inputs", "[supertrend]") {
  const TrendBandRecurrence recurrence;
  REQUIRE_THROWS(recurrence.RunOnBands(std::vector<double>{1.0, 2.0},
                                       std::vector<double>{1.0},
                                       std::vector<double>{1.0, 2.0}));
}
