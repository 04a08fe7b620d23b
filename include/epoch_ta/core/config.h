//
// Created by adesola on 3/20/25.
//

#pragma once
#include "constants.h"
#include "window_spec.h"
#include <epoch_ta/indicators/supertrend.h>
#include <epoch_ta/patterns/tulip_candle_classifier.h>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace epoch_ta {

struct IndicatorConfig {
  std::optional<size_t> output_window{defaults::INDICATOR_OUTPUT_WINDOW};
  std::optional<size_t> calc_window{};
};

struct PatternConfig {
  std::optional<size_t> output_window{defaults::PATTERN_OUTPUT_WINDOW};
  std::optional<size_t> calc_window{};
  // empty means every candle pattern the library provides
  std::vector<std::string> enabled{};
  pattern::CandleThresholds candle{};
};

struct SnapshotConfig {
  size_t lookback{defaults::SNAPSHOT_LOOKBACK};
  // widen the lookback to the slowest field instead of letting it read 0
  bool extend_to_required_lookback{false};
};

struct RuntimeConfig {
  bool parallel{true};
};

struct EngineConfig {
  IndicatorConfig indicators{};
  PatternConfig patterns{};
  SnapshotConfig snapshot{};
  indicator::SupertrendOptions supertrend{};
  RuntimeConfig runtime{};

  [[nodiscard]] WindowSpec
  IndicatorWindow(std::optional<epoch_frame::DateTime> endDate = {}) const {
    return WindowSpec{.end_date = std::move(endDate),
                      .calc_window = indicators.calc_window,
                      .output_window = indicators.output_window};
  }

  [[nodiscard]] WindowSpec
  PatternWindow(std::optional<epoch_frame::DateTime> endDate = {}) const {
    return WindowSpec{.end_date = std::move(endDate),
                      .calc_window = patterns.calc_window,
                      .output_window = patterns.output_window};
  }
};

// Missing keys keep their defaults. Throws std::runtime_error on invalid
// values (non-positive windows, unknown enum names).
EngineConfig LoadEngineConfig(YAML::Node const &root);

EngineConfig LoadEngineConfigFile(std::filesystem::path const &path);

} // namespace epoch_ta
