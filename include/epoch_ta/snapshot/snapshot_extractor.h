//
// Created by adesola on 3/21/25.
//

#pragma once
#include "snapshot_row.h"
#include <epoch_ta/core/config.h>
#include <epoch_ta/indicators/indicator_pipeline.h>
#include <epoch_ta/patterns/pattern_engine.h>
#include <optional>

namespace epoch_ta::snapshot {

/**
 * @brief Reduces a bar series to its latest derived row for one instrument.
 *
 * Neither reducer propagates failures. With fewer than two bars up to the
 * as-of date, the indicator reducer answers a zero-filled row and the pattern
 * reducer answers nothing. The same holds when derivation throws.
 */
class SnapshotExtractor {
public:
  SnapshotExtractor(indicator::IndicatorPipelinePtr pipeline,
                    pattern::PatternEnginePtr patterns,
                    SnapshotConfig config = {});

  // columns = [date, code, field...]; asOfDate is YYYY-MM-DD and is echoed
  // back unchanged together with code.
  [[nodiscard]] IndicatorRow
  LatestIndicatorRow(epoch_frame::DataFrame const &bars,
                     std::string const &asOfDate, std::string const &code,
                     std::vector<std::string> const &columns) const;

  [[nodiscard]] IndicatorRow
  LatestIndicatorRow(epoch_frame::DataFrame const &bars,
                     std::string const &asOfDate, std::string const &code,
                     std::vector<std::string> const &columns,
                     size_t lookback) const;

  // nullopt when history is insufficient or no requested pattern fired on
  // the as-of bar. A pattern that failed to classify counts as 0.
  [[nodiscard]] std::optional<PatternRow>
  LatestPatternRow(epoch_frame::DataFrame const &bars,
                   std::string const &asOfDate, std::string const &code,
                   std::vector<std::string> const &columns) const;

  [[nodiscard]] size_t EffectiveLookback(size_t lookback) const;

private:
  indicator::IndicatorPipelinePtr m_pipeline;
  pattern::PatternEnginePtr m_patterns;
  SnapshotConfig m_config;
};

} // namespace epoch_ta::snapshot
