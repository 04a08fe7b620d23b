//
// Created by adesola on 3/24/25.
//
#include <algorithm>
#include <epoch_ta/indicators/default_steps.h>
#include <epoch_ta/runtime/batch_runner.h>
#include <mutex>
#include <spdlog/spdlog.h>
#include <tbb/parallel_for_each.h>

namespace epoch_ta::runtime {

BatchRunner::BatchRunner(EngineConfig config)
    : BatchRunner(config, indicator::MakeDefaultPipeline(config.supertrend),
                  pattern::MakeCandlePatternEngine(config.patterns.enabled,
                                                   config.patterns.candle)) {}

BatchRunner::BatchRunner(EngineConfig config,
                         indicator::IndicatorPipelinePtr pipeline,
                         pattern::PatternEnginePtr patterns)
    : m_config(std::move(config)), m_pipeline(std::move(pipeline)),
      m_patterns(std::move(patterns)),
      m_extractor(m_pipeline, m_patterns, m_config.snapshot) {}

AssetResult BatchRunner::RunAsset(std::string const &code,
                                  epoch_frame::DataFrame const &bars,
                                  BatchRequest const &request) const {
  std::optional<epoch_frame::DateTime> endDate;
  if (!request.asOfDate.empty()) {
    endDate = epoch_frame::DateTime::from_date_str(request.asOfDate);
  }

  AssetResult result{
      .indicators =
          m_pipeline->Compute(bars, m_config.IndicatorWindow(endDate)),
      .patterns = m_patterns->Compute(bars, m_config.PatternWindow(endDate))};

  if (endDate && !request.indicatorColumns.empty()) {
    result.indicatorSnapshot = m_extractor.LatestIndicatorRow(
        bars, request.asOfDate, code, request.indicatorColumns);
  }
  if (endDate && !request.patternColumns.empty()) {
    result.patternSnapshot = m_extractor.LatestPatternRow(
        bars, request.asOfDate, code, request.patternColumns);
  }
  return result;
}

BatchResult BatchRunner::Run(AssetDataFrameMap const &bars,
                             BatchRequest const &request) const {
  BatchResult batch;
  std::mutex mutex;

  auto processAsset = [&](auto const &entry) {
    auto const &[code, frame] = entry;
    try {
      auto result = RunAsset(code, frame, request);
      std::lock_guard lock(mutex);
      batch.assets.emplace(code, std::move(result));
    } catch (std::exception const &exp) {
      SPDLOG_ERROR("{}: derivation failed: {}", code, exp.what());
      std::lock_guard lock(mutex);
      batch.failures.emplace(code, exp.what());
    }
  };

  if (m_config.runtime.parallel) {
    tbb::parallel_for_each(bars.begin(), bars.end(), processAsset);
  } else {
    std::ranges::for_each(bars, processAsset);
  }

  SPDLOG_DEBUG("Batch finished: {} instruments, {} failed", batch.assets.size(),
               batch.failures.size());
  return batch;
}

} // namespace epoch_ta::runtime
