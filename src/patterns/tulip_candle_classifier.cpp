//
// Created by adesola on 3/17/25.
//
#include <candles.h>
#include <epoch_core/macros.h>
#include <epoch_ta/core/constants.h>
#include <epoch_ta/patterns/tulip_candle_classifier.h>
#include <memory>
#include <span>
#include <unordered_set>

namespace epoch_ta::pattern {

namespace {
using CandleResultPtr = std::unique_ptr<tc_result, decltype(&tc_result_free)>;

tc_config MakeConfig(CandleThresholds const &thresholds) {
  tc_config config = *tc_config_default();
  if (thresholds.period) {
    config.period = *thresholds.period;
  }
  if (thresholds.body_none) {
    config.body_none = *thresholds.body_none;
  }
  if (thresholds.body_short) {
    config.body_short = *thresholds.body_short;
  }
  if (thresholds.body_long) {
    config.body_long = *thresholds.body_long;
  }
  if (thresholds.wick_none) {
    config.wick_none = *thresholds.wick_none;
  }
  if (thresholds.wick_long) {
    config.wick_long = *thresholds.wick_long;
  }
  if (thresholds.near) {
    config.near = *thresholds.near;
  }
  return config;
}
} // namespace

bool IsBearishCandle(std::string const &name) {
  static const std::unordered_set<std::string> kBearish{
      "hanging_man", "shooting_star", "gravestone_doji"};
  return name.ends_with("_bear") || name.contains("black") ||
         name.starts_with("evening_") || kBearish.contains(name);
}

std::vector<std::string> AvailableCandlePatterns() {
  std::vector<std::string> names;
  names.reserve(tc_candle_count());
  for (auto const &info :
       std::span(tc_candles, tc_candles + tc_candle_count())) {
    names.emplace_back(info.name);
  }
  return names;
}

TulipCandleClassifier::TulipCandleClassifier(std::string const &name,
                                             CandleThresholds thresholds)
    : m_name(name),
      m_hitSignal(IsBearishCandle(name) ? defaults::SIGNAL_BEARISH
                                        : defaults::SIGNAL_BULLISH),
      m_thresholds(thresholds) {
  const tc_candle_info *info = tc_find_candle(name.c_str());
  AssertFromFormat(info != nullptr, "Unknown candle pattern: {}", name);
  m_pattern = info->pattern;
}

SignalColumn TulipCandleClassifier::Classify(CandleInputs const &bars) const {
  const size_t nRows = bars.size();
  AssertFromFormat(bars.open.size() == nRows && bars.high.size() == nRows &&
                       bars.low.size() == nRows,
                   "{}: candle inputs differ in length", m_name);

  SignalColumn signals(nRows, defaults::SIGNAL_NONE);
  if (nRows == 0) {
    return signals;
  }

  const tc_config config = MakeConfig(m_thresholds);
  CandleResultPtr result{tc_result_new(), &tc_result_free};
  AssertFromFormat(result != nullptr, "{}: failed to allocate candle result",
                   m_name);

  const TC_REAL *inputs[] = {bars.open.data(), bars.high.data(),
                             bars.low.data(), bars.close.data()};
  const int rc = tc_run(m_pattern, static_cast<int>(nRows), inputs, &config,
                        result.get());
  AssertFromFormat(rc == TC_OKAY, "{}: tc_run failed with code {}", m_name,
                   rc);

  for (size_t i = 0; i < nRows; ++i) {
    if (tc_result_at(result.get(), static_cast<int>(i)) & m_pattern) {
      signals[i] = m_hitSignal;
    }
  }
  return signals;
}

} // namespace epoch_ta::pattern
