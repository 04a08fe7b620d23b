//
// Created by adesola on 3/25/25.
//
#include <arrow/type.h>
#include <chrono>
#include <epoch_core/macros.h>
#include <epoch_frame/factory/index_factory.h>
#include <epoch_frame/serialization.h>
#include <epoch_ta/core/bar_loader.h>
#include <epoch_ta/core/constants.h>
#include <format>
#include <spdlog/spdlog.h>

namespace epoch_ta {

epoch_frame::DataFrame LoadBarsCsv(std::filesystem::path const &path) {
  auto result = epoch_frame::read_csv_file(path, epoch_frame::CSVReadOptions{});
  AssertFromFormat(result.ok(), "Failed to read bars from {}: {}",
                   path.string(), result.status().ToString());
  auto df = result.ValueOrDie();

  df = df.set_index(snapshot::DATE_COLUMN);
  auto timestamps = df.index()->array().cast(
      arrow::timestamp(arrow::TimeUnit::NANO, "UTC"));
  df = df.set_index(epoch_frame::factory::index::make_index(
      timestamps.value(), epoch_frame::MonotonicDirection::Increasing,
      "index"));

  for (auto const &column : bar::ALL_COLUMNS) {
    const std::string name{column};
    df = df.assign(name, df[name].cast(arrow::float64()));
  }

  SPDLOG_DEBUG("Loaded {} bars from {}", df.num_rows(), path.string());
  return df;
}

void WriteFrameCsv(epoch_frame::DataFrame const &frame,
                   std::filesystem::path const &path) {
  auto status = epoch_frame::write_csv_file(frame.reset_index(), path.string());
  if (!status.ok()) {
    throw std::runtime_error("Failed to write " + path.string() + ": " +
                             status.ToString());
  }
}

std::string LastDate(epoch_frame::DataFrame const &frame) {
  if (frame.num_rows() == 0) {
    return {};
  }
  const auto nanos =
      frame.index()->array().to_timestamp_view()->raw_values()[frame.num_rows() - 1];
  const std::chrono::sys_time<std::chrono::nanoseconds> time{
      std::chrono::nanoseconds{nanos}};
  return std::format("{:%Y-%m-%d}", std::chrono::floor<std::chrono::days>(time));
}

} // namespace epoch_ta
