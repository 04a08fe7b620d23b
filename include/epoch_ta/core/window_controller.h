//
// Created by adesola on 3/10/25.
//

#pragma once
#include "window_spec.h"
#include <epoch_frame/dataframe.h>

namespace epoch_ta {

class WindowController {
public:
  // Keep rows with date <= end_date, then the last calc_window rows.
  [[nodiscard]] static epoch_frame::DataFrame
  Slice(epoch_frame::DataFrame const &bars,
        std::optional<epoch_frame::DateTime> const &endDate,
        std::optional<size_t> calcWindow);

  [[nodiscard]] static epoch_frame::DataFrame
  Slice(epoch_frame::DataFrame const &bars, WindowSpec const &spec) {
    return Slice(bars, spec.end_date, spec.calc_window);
  }

  // Keep the last output_window rows.
  [[nodiscard]] static epoch_frame::DataFrame
  Truncate(epoch_frame::DataFrame const &frame,
           std::optional<size_t> outputWindow);

  // Number of rows dated on or before endDate.
  [[nodiscard]] static size_t
  CountUpTo(epoch_frame::DataFrame const &bars,
            std::optional<epoch_frame::DateTime> const &endDate);

  [[nodiscard]] static epoch_frame::DataFrame
  Tail(epoch_frame::DataFrame const &frame, size_t n);
};

} // namespace epoch_ta
