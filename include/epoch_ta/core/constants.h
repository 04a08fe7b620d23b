//
// Created by adesola on 3/10/25.
//

#pragma once
#include <array>
#include <epoch_core/enum_wrapper.h>
#include <string_view>

// NaN      -> replace NaN with 0
// NaNAndInf-> replace NaN and +/-Infinity with 0
// None     -> finite by construction, left untouched
CREATE_ENUM(SanitizeMode, NaN, NaNAndInf, None);

// How the trend line resolves when its previous value matches neither
// previous band.
CREATE_ENUM(TrendFallback, SideCarry, CarryValue);

namespace epoch_ta::bar {
constexpr auto OPEN = "open";
constexpr auto HIGH = "high";
constexpr auto LOW = "low";
constexpr auto CLOSE = "close";
constexpr auto VOLUME = "volume";
constexpr auto AMOUNT = "amount";
constexpr auto PERCENT_CHANGE = "p_change";

constexpr std::array<std::string_view, 7> ALL_COLUMNS{
    OPEN, HIGH, LOW, CLOSE, VOLUME, AMOUNT, PERCENT_CHANGE};
constexpr std::array<std::string_view, 4> OHLC_COLUMNS{OPEN, HIGH, LOW,
                                                       CLOSE};
} // namespace epoch_ta::bar

namespace epoch_ta::snapshot {
constexpr auto DATE_COLUMN = "date";
constexpr auto CODE_COLUMN = "code";
constexpr auto DATE_FORMAT = "%Y-%m-%d";
} // namespace epoch_ta::snapshot

namespace epoch_ta::defaults {
constexpr size_t INDICATOR_OUTPUT_WINDOW = 120;
constexpr size_t PATTERN_OUTPUT_WINDOW = 120;
constexpr size_t SNAPSHOT_LOOKBACK = 90;
constexpr double SUPERTREND_MULTIPLIER = 3.0;
constexpr int64_t SIGNAL_BULLISH = 100;
constexpr int64_t SIGNAL_BEARISH = -100;
constexpr int64_t SIGNAL_NONE = 0;
} // namespace epoch_ta::defaults
