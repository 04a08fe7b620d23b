//
// Created by adesola on 3/11/25.
//

#pragma once
#include <epoch_frame/dataframe.h>
#include <epoch_ta/core/constants.h>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace epoch_ta::indicator {

using Column = std::vector<double>;

struct FieldSpec {
  std::string name;
  epoch_core::SanitizeMode sanitize{epoch_core::SanitizeMode::NaN};
  // scratch fields feed later steps but are not published in the frame
  bool scratch{false};
};

inline FieldSpec Published(std::string name,
                           epoch_core::SanitizeMode mode =
                               epoch_core::SanitizeMode::NaN) {
  return FieldSpec{.name = std::move(name), .sanitize = mode, .scratch = false};
}

inline FieldSpec Scratch(std::string name,
                         epoch_core::SanitizeMode mode =
                             epoch_core::SanitizeMode::NaN) {
  return FieldSpec{.name = std::move(name), .sanitize = mode, .scratch = true};
}

/**
 * @brief Column store shared by the steps of one pipeline run.
 *
 * Holds the raw bar columns plus every field written so far. A field is
 * assigned exactly once.
 */
class FieldStore {
public:
  explicit FieldStore(size_t nRows) : m_rows(nRows) {}

  static FieldStore FromBars(epoch_frame::DataFrame const &bars);

  [[nodiscard]] size_t Rows() const { return m_rows; }

  [[nodiscard]] bool Contains(std::string const &name) const {
    return m_columns.contains(name);
  }

  [[nodiscard]] std::span<const double> Get(std::string const &name) const;

  void Set(std::string const &name, Column column);

private:
  size_t m_rows;
  std::unordered_map<std::string, Column> m_columns;
};

class IIndicatorStep {
public:
  virtual ~IIndicatorStep() = default;

  [[nodiscard]] virtual std::string GetId() const = 0;

  // Bar columns or fields written by earlier steps.
  [[nodiscard]] virtual std::vector<std::string> GetReads() const = 0;

  [[nodiscard]] virtual std::vector<FieldSpec> GetWrites() const = 0;

  // Leading rows of the output that are warm-up relative to the inputs.
  [[nodiscard]] virtual size_t GetLookback() const = 0;

  // Returns one column per GetWrites() entry, in the same order.
  [[nodiscard]] virtual std::vector<Column>
  Compute(FieldStore const &store) const = 0;
};

using IndicatorStepPtr = std::unique_ptr<IIndicatorStep>;
using IndicatorStepList = std::vector<IndicatorStepPtr>;

class IndicatorStepBase : public IIndicatorStep {
public:
  IndicatorStepBase(std::string id, std::vector<std::string> reads,
                    std::vector<FieldSpec> writes, size_t lookback)
      : m_id(std::move(id)), m_reads(std::move(reads)),
        m_writes(std::move(writes)), m_lookback(lookback) {}

  [[nodiscard]] std::string GetId() const override { return m_id; }

  [[nodiscard]] std::vector<std::string> GetReads() const override {
    return m_reads;
  }

  [[nodiscard]] std::vector<FieldSpec> GetWrites() const override {
    return m_writes;
  }

  [[nodiscard]] size_t GetLookback() const override { return m_lookback; }

protected:
  [[nodiscard]] std::vector<std::span<const double>>
  Inputs(FieldStore const &store) const;

  std::string m_id;
  std::vector<std::string> m_reads;
  std::vector<FieldSpec> m_writes;
  size_t m_lookback;
};

} // namespace epoch_ta::indicator
