//
// Created by adesola on 3/13/25.
//
#include <algorithm>
#include <epoch_core/macros.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_ta/core/window_controller.h>
#include <epoch_ta/indicators/indicator_pipeline.h>
#include <epoch_ta/indicators/sanitize.h>
#include <ranges>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace epoch_ta::indicator {

IndicatorPipeline::IndicatorPipeline(IndicatorStepList steps)
    : m_steps(std::move(steps)) {
  std::unordered_set<std::string> available;
  for (auto const &column : bar::ALL_COLUMNS) {
    available.emplace(column);
    m_warmup.emplace(std::string{column}, 0);
  }

  for (auto const &[index, step] : std::views::enumerate(m_steps)) {
    AssertFromFormat(step != nullptr, "Indicator step #{} is null", index);

    size_t inputWarmup = 0;
    for (auto const &read : step->GetReads()) {
      AssertFromFormat(available.contains(read),
                       "Step '{}' (#{}) reads '{}' before any earlier step "
                       "writes it",
                       step->GetId(), index, read);
      inputWarmup = std::max(inputWarmup, m_warmup.at(read));
    }

    const auto writes = step->GetWrites();
    AssertFromFormat(!writes.empty(), "Step '{}' writes no fields",
                     step->GetId());
    for (auto const &write : writes) {
      AssertFromFormat(!available.contains(write.name),
                       "Step '{}' writes '{}' which is already assigned",
                       step->GetId(), write.name);
      available.emplace(write.name);
      const size_t warmup = inputWarmup + step->GetLookback();
      m_warmup.emplace(write.name, warmup);
      if (!write.scratch) {
        m_published.push_back(write.name);
        m_requiredLookback = std::max(m_requiredLookback, warmup + 1);
      }
    }
  }
}

size_t IndicatorPipeline::LookbackOf(std::string const &field) const {
  auto it = m_warmup.find(field);
  AssertFromFormat(it != m_warmup.end(), "Unknown indicator field '{}'",
                   field);
  return it->second + 1;
}

epoch_frame::DataFrame
IndicatorPipeline::Run(epoch_frame::DataFrame const &bars) const {
  auto store = FieldStore::FromBars(bars);

  for (auto const &step : m_steps) {
    auto columns = step->Compute(store);
    const auto writes = step->GetWrites();
    AssertFromFormat(columns.size() == writes.size(),
                     "Step '{}' produced {} columns for {} fields",
                     step->GetId(), columns.size(), writes.size());

    for (size_t k = 0; k < writes.size(); ++k) {
      Sanitize(columns[k], writes[k].sanitize);
      store.Set(writes[k].name, std::move(columns[k]));
    }
  }

  std::vector<std::string> names;
  std::vector<std::vector<double>> data;
  for (auto const &column : bar::ALL_COLUMNS) {
    const std::string name{column};
    if (store.Contains(name)) {
      auto values = store.Get(name);
      names.push_back(name);
      data.emplace_back(values.begin(), values.end());
    }
  }
  for (auto const &field : m_published) {
    auto values = store.Get(field);
    names.push_back(field);
    data.emplace_back(values.begin(), values.end());
  }

  return epoch_frame::make_dataframe<double>(bars.index(), data, names);
}

epoch_frame::DataFrame
IndicatorPipeline::Compute(epoch_frame::DataFrame const &bars,
                           WindowSpec const &spec) const {
  auto sliced = WindowController::Slice(bars, spec);
  if (sliced.num_rows() < m_requiredLookback) {
    SPDLOG_DEBUG("Computing indicators over {} rows, slowest field needs {}",
                 sliced.num_rows(), m_requiredLookback);
  }
  return WindowController::Truncate(Run(sliced), spec.output_window);
}

} // namespace epoch_ta::indicator
