//
// Created by adesola on 3/18/25.
//
#include <arrow/type.h>
#include <epoch_core/macros.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_ta/core/constants.h>
#include <epoch_ta/core/window_controller.h>
#include <epoch_ta/patterns/pattern_engine.h>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace epoch_ta::pattern {

PatternEngine::PatternEngine(std::vector<PatternClassifierPtr> classifiers)
    : m_classifiers(std::move(classifiers)) {
  std::unordered_set<std::string> names;
  for (auto const &classifier : m_classifiers) {
    AssertFromStream(classifier != nullptr, "Pattern classifier is null");
    AssertFromFormat(names.insert(classifier->GetName()).second,
                     "Duplicate pattern classifier: {}",
                     classifier->GetName());
  }
}

std::vector<std::string> PatternEngine::PatternNames() const {
  std::vector<std::string> names;
  names.reserve(m_classifiers.size());
  for (auto const &classifier : m_classifiers) {
    names.push_back(classifier->GetName());
  }
  return names;
}

epoch_frame::DataFrame
PatternEngine::Classify(epoch_frame::DataFrame const &bars) const {
  const auto nRows = bars.num_rows();

  std::vector<std::vector<double>> ohlc;
  ohlc.reserve(bar::OHLC_COLUMNS.size());
  for (auto const &column : bar::OHLC_COLUMNS) {
    ohlc.push_back(bars[std::string{column}]
                       .cast(arrow::float64())
                       .contiguous_array()
                       .to_vector<double>());
  }
  const CandleInputs inputs{
      .open = ohlc[0], .high = ohlc[1], .low = ohlc[2], .close = ohlc[3]};

  std::vector<std::string> names;
  std::vector<std::vector<int64_t>> columns;
  for (auto const &classifier : m_classifiers) {
    const auto name = classifier->GetName();
    try {
      auto signals = classifier->Classify(inputs);
      AssertFromFormat(signals.size() == nRows,
                       "returned {} rows for {} bars", signals.size(), nRows);
      names.push_back(name);
      columns.push_back(std::move(signals));
    } catch (std::exception const &exp) {
      SPDLOG_WARN("Pattern '{}' failed and is reported as no signal: {}", name,
                  exp.what());
    }
  }

  return epoch_frame::make_dataframe<int64_t>(bars.index(), columns, names);
}

epoch_frame::DataFrame
PatternEngine::Compute(epoch_frame::DataFrame const &bars,
                       WindowSpec const &spec) const {
  auto sliced = WindowController::Slice(bars, spec);
  return WindowController::Truncate(Classify(sliced), spec.output_window);
}

PatternEnginePtr MakeCandlePatternEngine(std::vector<std::string> const &enabled,
                                         CandleThresholds const &thresholds) {
  const auto names = enabled.empty() ? AvailableCandlePatterns() : enabled;
  std::vector<PatternClassifierPtr> classifiers;
  classifiers.reserve(names.size());
  for (auto const &name : names) {
    classifiers.push_back(
        std::make_shared<TulipCandleClassifier>(name, thresholds));
  }
  return std::make_shared<const PatternEngine>(std::move(classifiers));
}

} // namespace epoch_ta::pattern
