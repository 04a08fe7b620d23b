//
// Created by adesola on 3/25/25.
//

#pragma once
#include <epoch_frame/dataframe.h>
#include <filesystem>

namespace epoch_ta {

// Reads a daily bar CSV with a `date` column plus open, high, low, close,
// volume, amount and p_change. The date becomes a UTC nanosecond index and
// every bar column is float64.
epoch_frame::DataFrame LoadBarsCsv(std::filesystem::path const &path);

// Writes a derived frame with its index as the first column.
void WriteFrameCsv(epoch_frame::DataFrame const &frame,
                   std::filesystem::path const &path);

// YYYY-MM-DD of the last row, or empty for an empty frame.
std::string LastDate(epoch_frame::DataFrame const &frame);

} // namespace epoch_ta
