//
// Created by adesola on 3/17/25.
//

#pragma once
#include "pattern_classifier.h"
#include <optional>

namespace epoch_ta::pattern {

// Overrides for the candle library's body/wick thresholds. Unset fields keep
// the library defaults.
struct CandleThresholds {
  std::optional<int> period{};
  std::optional<double> body_none{};
  std::optional<double> body_short{};
  std::optional<double> body_long{};
  std::optional<double> wick_none{};
  std::optional<double> wick_long{};
  std::optional<double> near{};
};

/**
 * @brief One Tulip candle pattern as a classifier.
 *
 * A hit reports -100 for bearish formations and 100 otherwise, neutral
 * formations such as doji included.
 */
class TulipCandleClassifier : public IPatternClassifier {
public:
  explicit TulipCandleClassifier(std::string const &name,
                                 CandleThresholds thresholds = {});

  [[nodiscard]] std::string GetName() const override { return m_name; }

  [[nodiscard]] SignalColumn Classify(CandleInputs const &bars) const override;

  [[nodiscard]] int64_t HitSignal() const { return m_hitSignal; }

private:
  std::string m_name;
  uint64_t m_pattern;
  int64_t m_hitSignal;
  CandleThresholds m_thresholds;
};

[[nodiscard]] bool IsBearishCandle(std::string const &name);

// Every pattern the candle library knows, in library order.
[[nodiscard]] std::vector<std::string> AvailableCandlePatterns();

} // namespace epoch_ta::pattern
