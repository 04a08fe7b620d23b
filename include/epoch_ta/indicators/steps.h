//
// Created by adesola on 3/12/25.
//

#pragma once
#include "indicator_step.h"
#include "supertrend.h"
#include <functional>

namespace epoch_ta::indicator {

// =============================================================================
// TULIP PRIMITIVE
// =============================================================================

// Wraps one Tulip Indicators call. Outputs are left-padded with NaN over the
// primitive's warm-up and then multiplied by `scale`.
class TulipStep : public IndicatorStepBase {
public:
  TulipStep(std::string primitive, std::vector<std::string> reads,
            std::vector<double> options, std::vector<FieldSpec> writes,
            double scale = 1.0);

  [[nodiscard]] std::vector<Column>
  Compute(FieldStore const &store) const override;

private:
  std::string m_primitive;
  std::vector<double> m_options;
  double m_scale;
};

IndicatorStepPtr MakeSmaStep(std::string const &input, size_t period,
                             FieldSpec output);
IndicatorStepPtr MakeEmaStep(std::string const &input, size_t period,
                             FieldSpec output);
IndicatorStepPtr MakeSumStep(std::string const &input, size_t period,
                             FieldSpec output);

// =============================================================================
// LOCAL COMPOSITIONS
// =============================================================================

// Row-wise formula over the current row of each read column.
class ElementwiseStep : public IndicatorStepBase {
public:
  using Kernel = std::function<double(std::span<const double>)>;

  ElementwiseStep(std::vector<std::string> reads, FieldSpec write,
                  Kernel kernel);

  [[nodiscard]] std::vector<Column>
  Compute(FieldStore const &store) const override;

private:
  Kernel m_kernel;
};

// x[i - periods], with `fill` for the first `periods` rows.
class ShiftStep : public IndicatorStepBase {
public:
  ShiftStep(std::string input, size_t periods, FieldSpec write,
            double fill = 0.0);

  [[nodiscard]] std::vector<Column>
  Compute(FieldStore const &store) const override;

private:
  size_t m_periods;
  double m_fill;
};

// x[i] - x[i - 1], zero on the first row.
class DiffStep : public IndicatorStepBase {
public:
  DiffStep(std::string input, FieldSpec write);

  [[nodiscard]] std::vector<Column>
  Compute(FieldStore const &store) const override;
};

// sum_k weights[k] * x[i - k] / divisor, missing history counts as zero.
class WeightedTapStep : public IndicatorStepBase {
public:
  WeightedTapStep(std::string input, std::vector<double> weights,
                  double divisor, FieldSpec write);

  [[nodiscard]] std::vector<Column>
  Compute(FieldStore const &store) const override;

private:
  std::vector<double> m_weights;
  double m_divisor;
};

// =============================================================================
// SUPERTREND
// =============================================================================

class SupertrendStep : public IndicatorStepBase {
public:
  explicit SupertrendStep(SupertrendOptions options);

  [[nodiscard]] std::vector<Column>
  Compute(FieldStore const &store) const override;

private:
  TrendBandRecurrence m_recurrence;
};

} // namespace epoch_ta::indicator
