//
// Created by adesola on 3/13/25.
//

#pragma once
#include "indicator_step.h"
#include <epoch_ta/core/window_spec.h>

namespace epoch_ta::indicator {

/**
 * @brief Ordered chain of indicator derivations over one bar series.
 *
 * Each step may only read bar columns or fields written by an earlier step;
 * this is checked once at construction. Every written field is sanitized
 * before the next step runs, so warm-up zeros flow deterministically into
 * dependent fields.
 */
class IndicatorPipeline {
public:
  explicit IndicatorPipeline(IndicatorStepList steps);

  // Derive every field over the whole input. Row count and order match the
  // input; the result holds the bar columns followed by published fields.
  [[nodiscard]] epoch_frame::DataFrame
  Run(epoch_frame::DataFrame const &bars) const;

  // Slice, derive, then truncate.
  [[nodiscard]] epoch_frame::DataFrame
  Compute(epoch_frame::DataFrame const &bars, WindowSpec const &spec) const;

  // Rows needed before the slowest published field leaves warm-up.
  [[nodiscard]] size_t RequiredLookback() const { return m_requiredLookback; }

  [[nodiscard]] size_t LookbackOf(std::string const &field) const;

  [[nodiscard]] std::vector<std::string> const &PublishedFields() const {
    return m_published;
  }

  [[nodiscard]] size_t StepCount() const { return m_steps.size(); }

private:
  IndicatorStepList m_steps;
  std::vector<std::string> m_published;
  std::unordered_map<std::string, size_t> m_warmup;
  size_t m_requiredLookback{1};
};

using IndicatorPipelinePtr = std::shared_ptr<const IndicatorPipeline>;

} // namespace epoch_ta::indicator
