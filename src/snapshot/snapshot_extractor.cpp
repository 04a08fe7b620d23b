//
// Created by adesola on 3/21/25.
//
#include <epoch_core/macros.h>
#include <epoch_ta/core/window_controller.h>
#include <epoch_ta/indicators/sanitize.h>
#include <epoch_ta/snapshot/snapshot_extractor.h>
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace epoch_ta::snapshot {

namespace {
constexpr size_t MIN_BARS = 2;

template <typename T>
BasicSnapshotRow<T> MakeZeroRow(std::vector<std::string> const &columns,
                                std::string const &date,
                                std::string const &code) {
  return BasicSnapshotRow<T>{.columns = columns,
                             .date = date,
                             .code = code,
                             .values = std::vector<T>(columns.size() - 2, T{})};
}

void ValidateColumns(std::vector<std::string> const &columns) {
  AssertFromFormat(columns.size() >= 2,
                   "snapshot columns must start with [{}, {}]", DATE_COLUMN,
                   CODE_COLUMN);
}

std::unordered_set<std::string> ColumnSet(epoch_frame::DataFrame const &frame) {
  const auto names = frame.column_names();
  return {names.begin(), names.end()};
}

template <typename T>
std::string WriteJson(BasicSnapshotRow<T> const &row) {
  std::string buffer;
  auto ec = glz::write_json(row, buffer);
  if (ec) {
    throw std::runtime_error("Failed to serialize snapshot row for " +
                             row.code);
  }
  return buffer;
}
} // namespace

std::string ToJson(IndicatorRow const &row) { return WriteJson(row); }

std::string ToJson(PatternRow const &row) { return WriteJson(row); }

SnapshotExtractor::SnapshotExtractor(indicator::IndicatorPipelinePtr pipeline,
                                     pattern::PatternEnginePtr patterns,
                                     SnapshotConfig config)
    : m_pipeline(std::move(pipeline)), m_patterns(std::move(patterns)),
      m_config(config) {
  AssertFromStream(m_pipeline != nullptr, "indicator pipeline is required");
  AssertFromStream(m_patterns != nullptr, "pattern engine is required");
}

size_t SnapshotExtractor::EffectiveLookback(size_t lookback) const {
  const size_t required = m_pipeline->RequiredLookback();
  if (lookback >= required) {
    return lookback;
  }
  if (m_config.extend_to_required_lookback) {
    return required;
  }
  SPDLOG_DEBUG("Snapshot lookback {} is shorter than the {} rows the slowest "
               "field needs; those fields read 0",
               lookback, required);
  return lookback;
}

IndicatorRow SnapshotExtractor::LatestIndicatorRow(
    epoch_frame::DataFrame const &bars, std::string const &asOfDate,
    std::string const &code, std::vector<std::string> const &columns) const {
  return LatestIndicatorRow(bars, asOfDate, code, columns, m_config.lookback);
}

IndicatorRow SnapshotExtractor::LatestIndicatorRow(
    epoch_frame::DataFrame const &bars, std::string const &asOfDate,
    std::string const &code, std::vector<std::string> const &columns,
    size_t lookback) const {
  ValidateColumns(columns);
  auto row = MakeZeroRow<double>(columns, asOfDate, code);

  try {
    const auto endDate = epoch_frame::DateTime::from_date_str(asOfDate);
    if (WindowController::CountUpTo(bars, endDate) < MIN_BARS) {
      return row;
    }

    const auto frame = m_pipeline->Compute(
        bars, WindowSpec{.end_date = endDate,
                         .calc_window = EffectiveLookback(lookback),
                         .output_window = 1});
    if (frame.num_rows() == 0) {
      return row;
    }

    const auto available = ColumnSet(frame);
    for (size_t i = 2; i < columns.size(); ++i) {
      auto const &field = columns[i];
      if (!available.contains(field)) {
        SPDLOG_WARN("{}: indicator '{}' is not produced by the pipeline, "
                    "reporting 0",
                    code, field);
        continue;
      }
      const auto values = frame[field].contiguous_array().to_vector<double>();
      row.values[i - 2] = indicator::FiniteOrZero(values.back());
    }
  } catch (std::exception const &exp) {
    SPDLOG_ERROR("{}: indicator snapshot for {} failed, reporting zeros: {}",
                 code, asOfDate, exp.what());
    return MakeZeroRow<double>(columns, asOfDate, code);
  }
  return row;
}

std::optional<PatternRow> SnapshotExtractor::LatestPatternRow(
    epoch_frame::DataFrame const &bars, std::string const &asOfDate,
    std::string const &code, std::vector<std::string> const &columns) const {
  ValidateColumns(columns);

  try {
    const auto endDate = epoch_frame::DateTime::from_date_str(asOfDate);
    if (WindowController::CountUpTo(bars, endDate) < MIN_BARS) {
      return std::nullopt;
    }

    const auto frame = m_patterns->Compute(
        bars, WindowSpec{.end_date = endDate,
                         .calc_window = m_config.lookback,
                         .output_window = 1});
    if (frame.num_rows() == 0) {
      return std::nullopt;
    }

    auto row = MakeZeroRow<int64_t>(columns, asOfDate, code);
    const auto available = ColumnSet(frame);
    bool hasSignal = false;
    for (size_t i = 2; i < columns.size(); ++i) {
      auto const &field = columns[i];
      if (!available.contains(field)) {
        continue;
      }
      const auto values = frame[field].contiguous_array().to_vector<int64_t>();
      row.values[i - 2] = values.back();
      hasSignal = hasSignal || values.back() != defaults::SIGNAL_NONE;
    }

    if (!hasSignal) {
      return std::nullopt;
    }
    return row;
  } catch (std::exception const &exp) {
    SPDLOG_ERROR("{}: pattern snapshot for {} failed: {}", code, asOfDate,
                 exp.what());
  }
  return std::nullopt;
}

} // namespace epoch_ta::snapshot
