//
// Created by adesola on 3/10/25.
//
#include <algorithm>
#include <epoch_ta/core/window_controller.h>
#include <span>
#include <spdlog/spdlog.h>

namespace epoch_ta {

size_t
WindowController::CountUpTo(epoch_frame::DataFrame const &bars,
                            std::optional<epoch_frame::DateTime> const &endDate) {
  const auto nRows = bars.num_rows();
  if (!endDate || nRows == 0) {
    return nRows;
  }

  // bars are strictly ordered by date, so the cutoff is an upper bound.
  const std::span<const int64_t> timestamps(
      bars.index()->array().to_timestamp_view()->raw_values(), nRows);
  const int64_t cutoff = endDate->timestamp().value;
  return static_cast<size_t>(
      std::distance(timestamps.begin(),
                    std::upper_bound(timestamps.begin(), timestamps.end(),
                                     cutoff)));
}

epoch_frame::DataFrame WindowController::Tail(epoch_frame::DataFrame const &frame,
                                              size_t n) {
  const auto nRows = frame.num_rows();
  if (n >= nRows) {
    return frame;
  }
  return frame.iloc(
      {static_cast<int64_t>(nRows - n), std::nullopt, std::nullopt});
}

epoch_frame::DataFrame
WindowController::Slice(epoch_frame::DataFrame const &bars,
                        std::optional<epoch_frame::DateTime> const &endDate,
                        std::optional<size_t> calcWindow) {
  const size_t end = CountUpTo(bars, endDate);
  size_t start = 0;
  if (calcWindow && *calcWindow < end) {
    start = end - *calcWindow;
  }

  SPDLOG_DEBUG("WindowController::Slice keeping rows [{}, {}) of {}", start,
               end, bars.num_rows());
  if (start == 0 && end == bars.num_rows()) {
    return bars;
  }
  return bars.iloc({static_cast<int64_t>(start), static_cast<int64_t>(end),
                    std::nullopt});
}

epoch_frame::DataFrame
WindowController::Truncate(epoch_frame::DataFrame const &frame,
                           std::optional<size_t> outputWindow) {
  if (!outputWindow) {
    return frame;
  }
  return Tail(frame, *outputWindow);
}

} // namespace epoch_ta
