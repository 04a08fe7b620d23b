//
// Created by adesola on 3/12/25.
//
#include "tulip_primitives.h"
#include <epoch_core/macros.h>
#include <epoch_ta/indicators/steps.h>
#include <format>

namespace epoch_ta::indicator {

namespace {
std::string JoinReads(std::vector<std::string> const &reads) {
  std::string joined;
  for (auto const &read : reads) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += read;
  }
  return joined;
}

// The option count is checked before start() reads the options.
size_t PrimitiveLookback(std::string const &primitive,
                         std::vector<double> const &options) {
  auto const &info = *tulip::FindIndicator(primitive);
  AssertFromFormat(options.size() == static_cast<size_t>(info.options),
                   "{} expects {} options, got {}", primitive, info.options,
                   options.size());
  return tulip::Start(info, options);
}
} // namespace

// =============================================================================
// TULIP PRIMITIVE
// =============================================================================

TulipStep::TulipStep(std::string primitive, std::vector<std::string> reads,
                     std::vector<double> options,
                     std::vector<FieldSpec> writes, double scale)
    : IndicatorStepBase(std::format("{}({})", primitive, JoinReads(reads)),
                        reads, std::move(writes),
                        PrimitiveLookback(primitive, options)),
      m_primitive(std::move(primitive)), m_options(std::move(options)),
      m_scale(scale) {
  auto const &info = *tulip::FindIndicator(m_primitive);
  AssertFromFormat(m_reads.size() == static_cast<size_t>(info.inputs),
                   "{} expects {} inputs, got {}", m_primitive, info.inputs,
                   m_reads.size());
  AssertFromFormat(m_writes.size() == static_cast<size_t>(info.outputs),
                   "{} produces {} outputs, got {} field names", m_primitive,
                   info.outputs, m_writes.size());
}

std::vector<Column> TulipStep::Compute(FieldStore const &store) const {
  auto outputs = tulip::Run(m_primitive, Inputs(store), m_options);
  if (m_scale != 1.0) {
    for (auto &output : outputs) {
      for (auto &value : output) {
        value *= m_scale;
      }
    }
  }
  return outputs;
}

IndicatorStepPtr MakeSmaStep(std::string const &input, size_t period,
                             FieldSpec output) {
  return std::make_unique<TulipStep>(
      "sma", std::vector{input}, std::vector{static_cast<double>(period)},
      std::vector{std::move(output)});
}

IndicatorStepPtr MakeEmaStep(std::string const &input, size_t period,
                             FieldSpec output) {
  return std::make_unique<TulipStep>(
      "ema", std::vector{input}, std::vector{static_cast<double>(period)},
      std::vector{std::move(output)});
}

IndicatorStepPtr MakeSumStep(std::string const &input, size_t period,
                             FieldSpec output) {
  return std::make_unique<TulipStep>(
      "sum", std::vector{input}, std::vector{static_cast<double>(period)},
      std::vector{std::move(output)});
}

// =============================================================================
// LOCAL COMPOSITIONS
// =============================================================================

ElementwiseStep::ElementwiseStep(std::vector<std::string> reads,
                                 FieldSpec write, Kernel kernel)
    : IndicatorStepBase(write.name, std::move(reads), {write}, 0),
      m_kernel(std::move(kernel)) {
  AssertFromFormat(static_cast<bool>(m_kernel), "{} has no kernel", m_id);
}

std::vector<Column> ElementwiseStep::Compute(FieldStore const &store) const {
  const auto inputs = Inputs(store);
  Column output(store.Rows());
  std::vector<double> row(inputs.size());
  for (size_t i = 0; i < output.size(); ++i) {
    for (size_t k = 0; k < inputs.size(); ++k) {
      row[k] = inputs[k][i];
    }
    output[i] = m_kernel(row);
  }
  return {std::move(output)};
}

ShiftStep::ShiftStep(std::string input, size_t periods, FieldSpec write,
                     double fill)
    : IndicatorStepBase(std::format("shift({},{})", input, periods),
                        {input}, {std::move(write)}, periods),
      m_periods(periods), m_fill(fill) {}

std::vector<Column> ShiftStep::Compute(FieldStore const &store) const {
  const auto input = store.Get(m_reads.front());
  Column output(input.size(), m_fill);
  for (size_t i = m_periods; i < input.size(); ++i) {
    output[i] = input[i - m_periods];
  }
  return {std::move(output)};
}

DiffStep::DiffStep(std::string input, FieldSpec write)
    : IndicatorStepBase(std::format("diff({})", input), {input},
                        {std::move(write)}, 1) {}

std::vector<Column> DiffStep::Compute(FieldStore const &store) const {
  const auto input = store.Get(m_reads.front());
  Column output(input.size(), 0.0);
  for (size_t i = 1; i < input.size(); ++i) {
    output[i] = input[i] - input[i - 1];
  }
  return {std::move(output)};
}

WeightedTapStep::WeightedTapStep(std::string input,
                                 std::vector<double> weights, double divisor,
                                 FieldSpec write)
    : IndicatorStepBase(std::format("taps({})", input), {input},
                        {std::move(write)},
                        weights.empty() ? 0 : weights.size() - 1),
      m_weights(std::move(weights)), m_divisor(divisor) {
  AssertFromFormat(!m_weights.empty(), "{} requires at least one weight",
                   m_id);
  AssertFromFormat(m_divisor != 0.0, "{} divisor must be non-zero", m_id);
}

std::vector<Column> WeightedTapStep::Compute(FieldStore const &store) const {
  const auto input = store.Get(m_reads.front());
  Column output(input.size(), 0.0);
  for (size_t i = 0; i < input.size(); ++i) {
    double acc = 0.0;
    for (size_t k = 0; k < m_weights.size() && k <= i; ++k) {
      acc += m_weights[k] * input[i - k];
    }
    output[i] = acc / m_divisor;
  }
  return {std::move(output)};
}

// =============================================================================
// SUPERTREND
// =============================================================================

SupertrendStep::SupertrendStep(SupertrendOptions options)
    : IndicatorStepBase(
          "supertrend", {bar::HIGH, bar::LOW, bar::CLOSE, "atr"},
          {Published("supertrend", epoch_core::SanitizeMode::None),
           Published("supertrend_ub", epoch_core::SanitizeMode::None),
           Published("supertrend_lb", epoch_core::SanitizeMode::None)},
          0),
      m_recurrence(options) {}

std::vector<Column> SupertrendStep::Compute(FieldStore const &store) const {
  auto state =
      m_recurrence.Run(store.Get(bar::HIGH), store.Get(bar::LOW),
                       store.Get(bar::CLOSE), store.Get("atr"));
  return {std::move(state.trendLine), std::move(state.upperBand),
          std::move(state.lowerBand)};
}

} // namespace epoch_ta::indicator
