//
// Created by adesola on 3/10/25.
//

#include "common/bar_fixtures.h"
#include <catch2/catch_test_macros.hpp>
#include <epoch_core/catch_defs.h>
#include <epoch_ta/core/window_controller.h>

using namespace epoch_ta;
using namespace epoch_ta::test;

TEST_CASE("WindowController::Slice", "[window]") {
  const auto bars = MakeBars(LinearCloses(10));

  SECTION("no limits keeps every row") {
    const auto sliced = WindowController::Slice(bars, WindowSpec{});
    REQUIRE(sliced.num_rows() == 10);
  }

  SECTION("end date is inclusive") {
    const auto sliced = WindowController::Slice(bars, DateTimeOf(6), std::nullopt);
    REQUIRE(sliced.num_rows() == 7);
    REQUIRE(ColumnOf(sliced, bar::CLOSE).back() == 16.0);
  }

  SECTION("end date before the first bar leaves nothing") {
    const auto sliced = WindowController::Slice(
        bars, epoch_frame::DateTime::from_date_str("2019-12-31"), std::nullopt);
    REQUIRE(sliced.num_rows() == 0);
  }

  SECTION("end date after the last bar keeps every row") {
    const auto sliced = WindowController::Slice(
        bars, epoch_frame::DateTime::from_date_str("2021-01-01"), std::nullopt);
    REQUIRE(sliced.num_rows() == 10);
  }

  SECTION("calc window keeps the tail ending at the end date") {
    const auto sliced =
        WindowController::Slice(bars, WindowSpec{.end_date = DateTimeOf(6),
                                                 .calc_window = 3});
    REQUIRE(ColumnOf(sliced, bar::CLOSE) == std::vector<double>{14, 15, 16});
  }

  SECTION("calc window larger than the data keeps everything") {
    const auto sliced = WindowController::Slice(bars, std::nullopt, 50);
    REQUIRE(sliced.num_rows() == 10);
  }
}

TEST_CASE("WindowController::Truncate", "[window]") {
  const auto bars = MakeBars(LinearCloses(10));

  SECTION("keeps the last rows in order") {
    const auto truncated = WindowController::Truncate(bars, 4);
    REQUIRE(ColumnOf(truncated, bar::CLOSE) ==
            std::vector<double>{16, 17, 18, 19});
  }

  SECTION("row count is min(window, rows)") {
    REQUIRE(WindowController::Truncate(bars, 1).num_rows() == 1);
    REQUIRE(WindowController::Truncate(bars, 10).num_rows() == 10);
    REQUIRE(WindowController::Truncate(bars, 120).num_rows() == 10);
  }

  SECTION("unbounded keeps every row") {
    REQUIRE(WindowController::Truncate(bars, std::nullopt).num_rows() == 10);
  }
}

TEST_CASE("WindowController::CountUpTo", "[window]") {
  const auto bars = MakeBars(LinearCloses(5));

  REQUIRE(WindowController::CountUpTo(bars, std::nullopt) == 5);
  REQUIRE(WindowController::CountUpTo(bars, DateTimeOf(0)) == 1);
  REQUIRE(WindowController::CountUpTo(bars, DateTimeOf(3)) == 4);
  REQUIRE(WindowController::CountUpTo(
              bars, epoch_frame::DateTime::from_date_str("2019-06-01")) == 0);
}
