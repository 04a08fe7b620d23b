//
// Created by adesola on 3/13/25.
//

#include "common/bar_fixtures.h"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <epoch_core/catch_defs.h>
#include <epoch_ta/core/window_controller.h>
#include <epoch_ta/indicators/default_steps.h>
#include <epoch_ta/indicators/sanitize.h>
#include <epoch_ta/indicators/steps.h>

using namespace epoch_ta;
using namespace epoch_ta::indicator;
using namespace epoch_ta::test;
using Catch::Approx;

namespace {
IndicatorPipeline MakeSmaPipeline(size_t period) {
  IndicatorStepList steps;
  steps.push_back(
      MakeSmaStep(bar::CLOSE, period, Published(std::format("sma_{}", period))));
  return IndicatorPipeline{std::move(steps)};
}
} // namespace

TEST_CASE("IndicatorPipeline construction", "[indicator_pipeline]") {
  SECTION("reading a field before it is written is rejected") {
    IndicatorStepList steps;
    steps.push_back(std::make_unique<ElementwiseStep>(
        std::vector<std::string>{"later"}, Published("early"),
        [](std::span<const double> row) { return row[0]; }));
    steps.push_back(MakeSmaStep(bar::CLOSE, 3, Published("later")));
    REQUIRE_THROWS(IndicatorPipeline{std::move(steps)});
  }

  SECTION("writing a field twice is rejected") {
    IndicatorStepList steps;
    steps.push_back(MakeSmaStep(bar::CLOSE, 3, Published("avg")));
    steps.push_back(MakeEmaStep(bar::CLOSE, 3, Published("avg")));
    REQUIRE_THROWS(IndicatorPipeline{std::move(steps)});
  }

  SECTION("overwriting a bar column is rejected") {
    IndicatorStepList steps;
    steps.push_back(MakeSmaStep(bar::CLOSE, 3, Published(bar::CLOSE)));
    REQUIRE_THROWS(IndicatorPipeline{std::move(steps)});
  }

  SECTION("unknown tulip primitive is rejected") {
    REQUIRE_THROWS(TulipStep("not_an_indicator", {bar::CLOSE}, {3},
                             {Published("x")}));
  }

  SECTION("tulip option count is checked") {
    REQUIRE_THROWS(TulipStep("sma", {bar::CLOSE}, {3, 4}, {Published("x")}));
  }
}

TEST_CASE("IndicatorPipeline warm-up", "[indicator_pipeline]") {
  const auto pipeline = MakeSmaPipeline(5);
  const auto bars = MakeBars(LinearCloses(10, 10.0));

  const auto output = pipeline.Run(bars);
  const auto sma = ColumnOf(output, "sma_5");

  REQUIRE(output.num_rows() == 10);
  for (size_t i = 0; i < 4; ++i) {
    REQUIRE(sma[i] == 0.0);
  }
  REQUIRE(sma[4] == Approx(12.0));
  REQUIRE(sma[9] == Approx(17.0));

  REQUIRE(pipeline.RequiredLookback() == 5);
  REQUIRE(pipeline.LookbackOf("sma_5") == 5);
  REQUIRE_THROWS(pipeline.LookbackOf("sma_6"));
}

TEST_CASE("IndicatorPipeline warm-up flows into dependent fields",
          "[indicator_pipeline]") {
  IndicatorStepList steps;
  steps.push_back(MakeSmaStep(bar::CLOSE, 3, Scratch("avg")));
  steps.push_back(std::make_unique<ShiftStep>("avg", 2, Scratch("avg_sf2")));
  steps.push_back(std::make_unique<ElementwiseStep>(
      std::vector<std::string>{bar::CLOSE, "avg_sf2"}, Published("gap"),
      [](std::span<const double> row) { return row[0] - row[1]; }));
  const IndicatorPipeline pipeline{std::move(steps)};

  // sma warm-up (2) + shift (2)
  REQUIRE(pipeline.LookbackOf("gap") == 5);
  REQUIRE(pipeline.PublishedFields() == std::vector<std::string>{"gap"});

  const auto output = pipeline.Run(MakeBars(LinearCloses(8, 10.0)));
  const auto gap = ColumnOf(output, "gap");

  // avg is zero-filled before the shift reads it
  REQUIRE(gap[0] == 10.0);
  REQUIRE(gap[3] == 13.0);
  REQUIRE(gap[4] == Approx(14.0 - 11.0));
  REQUIRE_FALSE(output.contains("avg"));
  REQUIRE_FALSE(output.contains("avg_sf2"));
}

TEST_CASE("Default indicator set", "[indicator_pipeline][default]") {
  const auto pipeline = MakeDefaultPipeline();
  const auto bars = MakeBars(WaveCloses(300));
  const auto output = pipeline->Run(bars);

  SECTION("row count and order match the input") {
    REQUIRE(output.num_rows() == bars.num_rows());
    REQUIRE(ColumnOf(output, bar::CLOSE) == ColumnOf(bars, bar::CLOSE));
  }

  SECTION("every published field is present and finite") {
    for (auto const &field : pipeline->PublishedFields()) {
      INFO(field);
      REQUIRE(output.contains(field));
      REQUIRE(AllFinite(ColumnOf(output, field)));
    }
  }

  SECTION("the documented fields are published") {
    for (auto const *field :
         {"macd", "macds", "macdh", "kdjk", "kdjd", "kdjj", "boll", "boll_ub",
          "boll_lb", "trix", "trix_20_sma", "cr", "cr-ma1", "cr-ma2", "cr-ma3",
          "rsi", "rsi_6", "rsi_12", "rsi_24", "vr", "vr_6_sma", "tr", "atr",
          "pdi", "mdi", "dx", "adx", "adxr", "wr_6", "wr_10", "wr_14", "cci",
          "cci_84", "dma", "tema", "mfi", "vwma", "ppo", "stochrsi_k", "wt1",
          "wt2", "supertrend", "supertrend_ub", "supertrend_lb", "roc", "obv",
          "sar", "psy", "ar", "br", "emv", "emva", "bias", "dpo", "vhf", "rvi",
          "fi", "force_2", "force_13", "ene", "vol_5", "vol_10", "ma20",
          "ma200"}) {
      INFO(field);
      REQUIRE(output.contains(field));
    }
  }

  SECTION("scratch fields are not published") {
    REQUIRE_FALSE(output.contains("prev_close"));
    REQUIRE_FALSE(output.contains("m_price"));
    REQUIRE_FALSE(output.contains("c_m_11"));
  }

  SECTION("kdjj is 3k - 2d") {
    const auto k = ColumnOf(output, "kdjk");
    const auto d = ColumnOf(output, "kdjd");
    const auto j = ColumnOf(output, "kdjj");
    for (size_t i = 0; i < j.size(); ++i) {
      REQUIRE(j[i] == 3.0 * k[i] - 2.0 * d[i]);
    }
  }

  SECTION("supertrend sits on one of its bands") {
    const auto line = ColumnOf(output, "supertrend");
    const auto ub = ColumnOf(output, "supertrend_ub");
    const auto lb = ColumnOf(output, "supertrend_lb");
    for (size_t i = 0; i < line.size(); ++i) {
      REQUIRE((line[i] == ub[i] || line[i] == lb[i]));
    }
  }

  SECTION("slowest field sets the required lookback") {
    REQUIRE(pipeline->LookbackOf("ma200") == 200);
    REQUIRE(pipeline->RequiredLookback() >= 200);
    const auto ma200 = ColumnOf(output, "ma200");
    REQUIRE(ma200[198] == 0.0);
    REQUIRE(ma200[199] != 0.0);
  }
}

TEST_CASE("Default indicator set on trending bars",
          "[indicator_pipeline][default]") {
  const auto pipeline = MakeDefaultPipeline();
  const auto closes = LinearCloses(80, 10.0);
  const auto output = pipeline->Run(MakeBars(closes));

  SECTION("dpo reads 0 until the shifted average exists") {
    const auto dpo = ColumnOf(output, "dpo");
    for (size_t i = 0; i <= 10; ++i) {
      REQUIRE(dpo[i] == 0.0);
    }
    // close[11] - mean(close[0..10])
    REQUIRE(dpo[11] == Approx(21.0 - 15.0));
  }

  SECTION("psy counts rising closes") {
    REQUIRE(ColumnOf(output, "psy")[40] == Approx(100.0));
  }

  SECTION("roc is reported in percent") {
    // (close[20] - close[8]) / close[8]
    REQUIRE(ColumnOf(output, "roc")[20] == Approx((30.0 - 18.0) / 18.0 * 100.0));
  }

  SECTION("vr with no falling volume reads 0 instead of infinity") {
    const auto vr = ColumnOf(output, "vr");
    REQUIRE(AllFinite(vr));
    for (size_t i = 26; i < vr.size(); ++i) {
      REQUIRE(vr[i] == 0.0);
    }
  }
}

TEST_CASE("Capacity ratio with no downside volume reads 0",
          "[indicator_pipeline][default]") {
  const auto closes = WaveCloses(60);
  std::vector<double> opens, highs, lows, volumes, amounts;
  for (double close : closes) {
    opens.push_back(close);
    highs.push_back(close + 1.0);
    lows.push_back(close - 1.0);
    volumes.push_back(1000.0);
    // traded price always below the low, so the m_l leg sums to zero
    amounts.push_back((close - 5.0) * 1000.0);
  }
  const auto bars = MakeBarsWith(opens, highs, lows, closes, volumes, amounts);

  const auto output = MakeDefaultPipeline()->Run(bars);
  const auto cr = ColumnOf(output, "cr");
  REQUIRE(AllFinite(cr));
  for (double value : cr) {
    REQUIRE(value == 0.0);
  }
}

TEST_CASE("IndicatorPipeline::Compute", "[indicator_pipeline][window]") {
  const auto pipeline = MakeDefaultPipeline();
  const auto bars = MakeBars(WaveCloses(250));

  SECTION("output window bounds the row count") {
    REQUIRE(pipeline->Compute(bars, WindowSpec{.output_window = 5}).num_rows() ==
            5);
    REQUIRE(
        pipeline->Compute(bars, WindowSpec{.output_window = 1000}).num_rows() ==
        250);
    REQUIRE(pipeline->Compute(bars, WindowSpec{}).num_rows() == 250);
  }

  SECTION("the last row is the end date row") {
    const auto output = pipeline->Compute(
        bars, WindowSpec{.end_date = DateTimeOf(199), .output_window = 10});
    REQUIRE(output.num_rows() == 10);
    REQUIRE(ColumnOf(output, bar::CLOSE).back() ==
            ColumnOf(bars, bar::CLOSE)[199]);
  }

  SECTION("calc window restarts the recurrences on the tail") {
    const auto computed = pipeline->Compute(
        bars, WindowSpec{.calc_window = 60, .output_window = 1});
    const auto direct = pipeline->Run(WindowController::Tail(bars, 60));

    for (auto const *field : {"macd", "supertrend", "sar", "obv", "ma20"}) {
      INFO(field);
      REQUIRE(ColumnOf(computed, field)[0] == ColumnOf(direct, field).back());
    }
    // too few rows for ma200
    REQUIRE(ColumnOf(computed, "ma200")[0] == 0.0);
  }
}

TEST_CASE("Default indicator set on degenerate bars",
          "[indicator_pipeline][default]") {
  const auto pipeline = MakeDefaultPipeline();

  SECTION("a zero-volume bar drops out of the capacity ratio") {
    constexpr size_t nRows = 80;
    constexpr size_t emptyBar = 40;
    std::vector<double> opens(nRows, 50.0), highs(nRows, 51.0),
        lows(nRows, 49.0), closes(nRows, 50.0), volumes(nRows, 1000.0),
        amounts(nRows, 50000.0);
    volumes[emptyBar] = 0.0;
    amounts[emptyBar] = 0.0;

    const auto output = pipeline->Run(
        MakeBarsWith(opens, highs, lows, closes, volumes, amounts));
    const auto cr = ColumnOf(output, "cr");

    // every full window holds equal h_m and m_l legs; the bar after the
    // empty one adds nothing to either
    for (size_t i = 26; i < nRows; ++i) {
      INFO(i);
      REQUIRE(cr[i] == 100.0);
    }
  }

  SECTION("a zero-amount bar keeps ease of movement finite") {
    const auto bars = MakeBars(WaveCloses(80));
    auto amounts = ColumnOf(bars, bar::AMOUNT);
    amounts[30] = 0.0;
    const auto output = pipeline->Run(MakeBarsWith(
        ColumnOf(bars, bar::OPEN), ColumnOf(bars, bar::HIGH),
        ColumnOf(bars, bar::LOW), ColumnOf(bars, bar::CLOSE),
        ColumnOf(bars, bar::VOLUME), amounts));

    for (auto const &field : pipeline->PublishedFields()) {
      INFO(field);
      REQUIRE(AllFinite(ColumnOf(output, field)));
    }
  }
}
