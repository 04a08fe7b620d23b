//
// Created by adesola on 3/11/25.
//

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <epoch_core/catch_defs.h>
#include <epoch_ta/indicators/sanitize.h>
#include <limits>

using namespace epoch_ta::indicator;
using epoch_core::SanitizeMode;

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
constexpr double Inf = std::numeric_limits<double>::infinity();
} // namespace

TEST_CASE("SanitizeValue", "[sanitize]") {
  SECTION("NaN mode only replaces NaN") {
    REQUIRE(SanitizeValue(NaN, SanitizeMode::NaN) == 0.0);
    REQUIRE(SanitizeValue(1.5, SanitizeMode::NaN) == 1.5);
    REQUIRE(std::isinf(SanitizeValue(Inf, SanitizeMode::NaN)));
  }

  SECTION("NaNAndInf mode replaces every non-finite value") {
    REQUIRE(SanitizeValue(NaN, SanitizeMode::NaNAndInf) == 0.0);
    REQUIRE(SanitizeValue(Inf, SanitizeMode::NaNAndInf) == 0.0);
    REQUIRE(SanitizeValue(-Inf, SanitizeMode::NaNAndInf) == 0.0);
    REQUIRE(SanitizeValue(-2.0, SanitizeMode::NaNAndInf) == -2.0);
  }

  SECTION("None mode passes values through") {
    REQUIRE(std::isnan(SanitizeValue(NaN, SanitizeMode::None)));
    REQUIRE(SanitizeValue(3.0, SanitizeMode::None) == 3.0);
  }
}

TEST_CASE("Sanitize column", "[sanitize]") {
  SECTION("NaNAndInf") {
    std::vector<double> column{NaN, 1.0, Inf, -Inf, 2.0};
    Sanitize(column, SanitizeMode::NaNAndInf);
    REQUIRE(column == std::vector<double>{0.0, 1.0, 0.0, 0.0, 2.0});
    REQUIRE(AllFinite(column));
  }

  SECTION("NaN keeps infinities") {
    std::vector<double> column{NaN, Inf};
    Sanitize(column, SanitizeMode::NaN);
    REQUIRE(column[0] == 0.0);
    REQUIRE(std::isinf(column[1]));
    REQUIRE_FALSE(AllFinite(column));
  }

  SECTION("None leaves the column untouched") {
    std::vector<double> column{NaN, 4.0};
    Sanitize(column, SanitizeMode::None);
    REQUIRE(std::isnan(column[0]));
    REQUIRE(column[1] == 4.0);
  }
}

TEST_CASE("FiniteOrZero", "[sanitize]") {
  REQUIRE(FiniteOrZero(NaN) == 0.0);
  REQUIRE(FiniteOrZero(-Inf) == 0.0);
  REQUIRE(FiniteOrZero(7.25) == 7.25);
}
