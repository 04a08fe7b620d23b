//
// Created by adesola on 3/17/25.
//

#pragma once
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace epoch_ta::pattern {

// One signal per bar: -100 bearish, 0 none, 100 bullish.
using SignalColumn = std::vector<int64_t>;

struct CandleInputs {
  std::span<const double> open;
  std::span<const double> high;
  std::span<const double> low;
  std::span<const double> close;

  [[nodiscard]] size_t size() const { return close.size(); }
};

class IPatternClassifier {
public:
  virtual ~IPatternClassifier() = default;

  [[nodiscard]] virtual std::string GetName() const = 0;

  // Throws on failure; the engine isolates the failure to this pattern.
  [[nodiscard]] virtual SignalColumn Classify(CandleInputs const &bars) const = 0;
};

using PatternClassifierPtr = std::shared_ptr<const IPatternClassifier>;

} // namespace epoch_ta::pattern
