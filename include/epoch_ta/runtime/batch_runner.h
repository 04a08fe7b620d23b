//
// Created by adesola on 3/24/25.
//

#pragma once
#include <epoch_ta/core/config.h>
#include <epoch_ta/indicators/indicator_pipeline.h>
#include <epoch_ta/patterns/pattern_engine.h>
#include <epoch_ta/snapshot/snapshot_extractor.h>
#include <unordered_map>

namespace epoch_ta::runtime {

using AssetDataFrameMap = std::unordered_map<std::string, epoch_frame::DataFrame>;

struct BatchRequest {
  // YYYY-MM-DD; empty means "use every bar" and skips the snapshots
  std::string asOfDate{};
  // [date, code, field...] as accepted by SnapshotExtractor
  std::vector<std::string> indicatorColumns{};
  std::vector<std::string> patternColumns{};
};

struct AssetResult {
  epoch_frame::DataFrame indicators;
  epoch_frame::DataFrame patterns;
  std::optional<snapshot::IndicatorRow> indicatorSnapshot{};
  std::optional<snapshot::PatternRow> patternSnapshot{};
};

struct BatchResult {
  std::unordered_map<std::string, AssetResult> assets;
  // instrument code -> error message
  std::unordered_map<std::string, std::string> failures;
};

/**
 * @brief Runs the indicator and pattern engines for many instruments.
 *
 * Instruments are independent: each worker task owns its windowed frames and
 * recurrence state. A failing instrument is reported in BatchResult::failures
 * and does not affect the others.
 */
class BatchRunner {
public:
  explicit BatchRunner(EngineConfig config);

  BatchRunner(EngineConfig config, indicator::IndicatorPipelinePtr pipeline,
              pattern::PatternEnginePtr patterns);

  [[nodiscard]] BatchResult Run(AssetDataFrameMap const &bars,
                                BatchRequest const &request) const;

  [[nodiscard]] AssetResult RunAsset(std::string const &code,
                                     epoch_frame::DataFrame const &bars,
                                     BatchRequest const &request) const;

  [[nodiscard]] EngineConfig const &GetConfig() const { return m_config; }

private:
  EngineConfig m_config;
  indicator::IndicatorPipelinePtr m_pipeline;
  pattern::PatternEnginePtr m_patterns;
  snapshot::SnapshotExtractor m_extractor;
};

} // namespace epoch_ta::runtime
