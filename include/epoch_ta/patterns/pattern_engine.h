//
// Created by adesola on 3/18/25.
//

#pragma once
#include "pattern_classifier.h"
#include "tulip_candle_classifier.h"
#include <epoch_frame/dataframe.h>
#include <epoch_ta/core/window_spec.h>

namespace epoch_ta::pattern {

/**
 * @brief Runs independent candle classifiers over a bar series.
 *
 * A classifier that throws, or returns the wrong number of rows, loses its
 * column for that run and is logged; the remaining classifiers are
 * unaffected. Consumers read a missing column as "no signal".
 */
class PatternEngine {
public:
  explicit PatternEngine(std::vector<PatternClassifierPtr> classifiers);

  // One int64 column per classifier that succeeded, indexed like the bars.
  [[nodiscard]] epoch_frame::DataFrame
  Classify(epoch_frame::DataFrame const &bars) const;

  [[nodiscard]] epoch_frame::DataFrame
  Compute(epoch_frame::DataFrame const &bars, WindowSpec const &spec) const;

  [[nodiscard]] std::vector<std::string> PatternNames() const;

private:
  std::vector<PatternClassifierPtr> m_classifiers;
};

using PatternEnginePtr = std::shared_ptr<const PatternEngine>;

// Wraps the named candle patterns, or every library pattern when `enabled`
// is empty.
PatternEnginePtr MakeCandlePatternEngine(std::vector<std::string> const &enabled,
                                         CandleThresholds const &thresholds = {});

} // namespace epoch_ta::pattern
