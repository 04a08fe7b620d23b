//
// Created by adesola on 3/13/25.
//
#include <algorithm>
#include <cmath>
#include <epoch_ta/indicators/default_steps.h>
#include <epoch_ta/indicators/steps.h>
#include <format>
#include <limits>

namespace epoch_ta::indicator {

namespace {
constexpr auto NaNAndInf = epoch_core::SanitizeMode::NaNAndInf;
constexpr auto NoSanitize = epoch_core::SanitizeMode::None;

using Row = std::span<const double>;

class StepListBuilder {
public:
  StepListBuilder &Add(IndicatorStepPtr step) {
    m_steps.push_back(std::move(step));
    return *this;
  }

  StepListBuilder &Tulip(std::string primitive, std::vector<std::string> reads,
                         std::vector<double> options,
                         std::vector<FieldSpec> writes, double scale = 1.0) {
    return Add(std::make_unique<TulipStep>(std::move(primitive),
                                           std::move(reads), std::move(options),
                                           std::move(writes), scale));
  }

  StepListBuilder &Sma(std::string const &input, size_t period,
                       FieldSpec output) {
    return Add(MakeSmaStep(input, period, std::move(output)));
  }

  StepListBuilder &Ema(std::string const &input, size_t period,
                       FieldSpec output) {
    return Add(MakeEmaStep(input, period, std::move(output)));
  }

  StepListBuilder &Sum(std::string const &input, size_t period,
                       FieldSpec output) {
    return Add(MakeSumStep(input, period, std::move(output)));
  }

  StepListBuilder &Formula(std::vector<std::string> reads, FieldSpec output,
                           ElementwiseStep::Kernel kernel) {
    return Add(std::make_unique<ElementwiseStep>(
        std::move(reads), std::move(output), std::move(kernel)));
  }

  StepListBuilder &Shift(std::string const &input, size_t periods,
                         FieldSpec output, double fill = 0.0) {
    return Add(
        std::make_unique<ShiftStep>(input, periods, std::move(output), fill));
  }

  StepListBuilder &Diff(std::string const &input, FieldSpec output) {
    return Add(std::make_unique<DiffStep>(input, std::move(output)));
  }

  // (x + 2 x[-1] + 2 x[-2] + x[-3]) / 6
  StepListBuilder &Symmetric4(std::string const &input, FieldSpec output) {
    return Add(std::make_unique<WeightedTapStep>(
        input, std::vector{1.0, 2.0, 2.0, 1.0}, 6.0, std::move(output)));
  }

  IndicatorStepList Build() { return std::move(m_steps); }

private:
  IndicatorStepList m_steps;
};

double PercentRatio(double numerator, double denominator) {
  return numerator / denominator * 100.0;
}

// =============================================================================
// TREND
// =============================================================================

void AddMacd(StepListBuilder &b) {
  b.Tulip("macd", {bar::CLOSE}, {12, 26, 9},
          {Published("macd"), Published("macds"), Published("macdh")});
}

void AddTrix(StepListBuilder &b) {
  b.Tulip("trix", {bar::CLOSE}, {12}, {Published("trix")})
      .Sma("trix", 20, Published("trix_20_sma"));
}

void AddDmi(StepListBuilder &b) {
  b.Diff(bar::HIGH, Scratch("high_delta"))
      .Diff(bar::LOW, Scratch("low_delta"))
      // up move kept only when it dominates the down move, and vice versa
      .Formula({"high_delta", "low_delta"}, Scratch("pdm_raw"),
               [](Row r) {
                 const double up = std::max(r[0], 0.0);
                 const double down = std::max(-r[1], 0.0);
                 return up > down ? up : 0.0;
               })
      .Formula({"high_delta", "low_delta"}, Scratch("mdm_raw"),
               [](Row r) {
                 const double up = std::max(r[0], 0.0);
                 const double down = std::max(-r[1], 0.0);
                 return down > up ? down : 0.0;
               })
      .Ema("pdm_raw", 14, Published("pdm"))
      .Ema("mdm_raw", 14, Published("mdm"))
      .Formula({"pdm", "atr"}, Published("pdi", NaNAndInf),
               [](Row r) { return PercentRatio(r[0], r[1]); })
      .Formula({"mdm", "atr"}, Published("mdi", NaNAndInf),
               [](Row r) { return PercentRatio(r[0], r[1]); })
      .Formula({"pdi", "mdi"}, Published("dx", NaNAndInf),
               [](Row r) { return PercentRatio(std::abs(r[0] - r[1]), r[0] + r[1]); })
      .Ema("dx", 6, Published("adx"))
      .Ema("adx", 6, Published("adxr"));
}

void AddDma(StepListBuilder &b) {
  b.Sma(bar::CLOSE, 10, Published("ma10"))
      .Sma(bar::CLOSE, 50, Published("ma50"))
      .Formula({"ma10", "ma50"}, Published("dma"),
               [](Row r) { return r[0] - r[1]; })
      .Sma("dma", 10, Published("dma_10_sma"));
}

void AddTema(StepListBuilder &b) {
  b.Tulip("tema", {bar::CLOSE}, {14}, {Published("tema")});
}

void AddSupertrend(StepListBuilder &b, SupertrendOptions const &options) {
  b.Add(std::make_unique<SupertrendStep>(options));
}

void AddSar(StepListBuilder &b) {
  b.Tulip("psar", {bar::HIGH, bar::LOW}, {0.02, 0.2}, {Published("sar")});
}

void AddDpo(StepListBuilder &b) {
  // the shifted average keeps its NaN warm-up so dpo reads 0 there, not close
  b.Sma(bar::CLOSE, 11, Scratch("c_m_11", NoSanitize))
      .Shift("c_m_11", 1, Scratch("c_m_11_sf1", NoSanitize),
             std::numeric_limits<double>::quiet_NaN())
      .Formula({bar::CLOSE, "c_m_11_sf1"}, Published("dpo"),
               [](Row r) { return r[0] - r[1]; })
      .Sma("dpo", 6, Published("madpo"));
}

void AddVhf(StepListBuilder &b) {
  b.Tulip("max", {bar::CLOSE}, {28}, {Scratch("close_max_28")})
      .Tulip("min", {bar::CLOSE}, {28}, {Scratch("close_min_28")})
      .Formula({"close_max_28", "close_min_28"}, Scratch("hcp_lcp"),
               [](Row r) { return r[0] - r[1]; })
      .Formula({bar::CLOSE, "prev_close"}, Scratch("close_abs_change"),
               [](Row r) { return std::abs(r[0] - r[1]); })
      .Sum("close_abs_change", 28, Scratch("close_abs_change_sum"))
      .Formula({"hcp_lcp", "close_abs_change_sum"}, Published("vhf"),
               [](Row r) { return r[0] / r[1]; });
}

void AddEne(StepListBuilder &b) {
  b.Formula({"ma10"}, Published("ene_ue", NoSanitize),
            [](Row r) { return (1.0 + 11.0 / 100.0) * r[0]; })
      .Formula({"ma10"}, Published("ene_le", NoSanitize),
               [](Row r) { return (1.0 - 9.0 / 100.0) * r[0]; })
      .Formula({"ene_ue", "ene_le"}, Published("ene", NoSanitize),
               [](Row r) { return (r[0] + r[1]) / 2.0; });
}

void AddPriceAverages(StepListBuilder &b) {
  b.Sma(bar::CLOSE, 20, Published("ma20"))
      .Sma(bar::CLOSE, 200, Published("ma200"));
}

// =============================================================================
// MOMENTUM
// =============================================================================

void AddKdj(StepListBuilder &b) {
  b.Tulip("stoch", {bar::HIGH, bar::LOW, bar::CLOSE}, {9, 5, 5},
          {Published("kdjk"), Published("kdjd")})
      .Formula({"kdjk", "kdjd"}, Published("kdjj"),
               [](Row r) { return 3.0 * r[0] - 2.0 * r[1]; });
}

void AddRsi(StepListBuilder &b) {
  b.Tulip("rsi", {bar::CLOSE}, {14}, {Published("rsi")})
      .Tulip("rsi", {bar::CLOSE}, {6}, {Published("rsi_6")})
      .Tulip("rsi", {bar::CLOSE}, {12}, {Published("rsi_12")})
      .Tulip("rsi", {bar::CLOSE}, {24}, {Published("rsi_24")});
}

void AddWilliams(StepListBuilder &b) {
  for (const double period : {6.0, 10.0, 14.0}) {
    b.Tulip("willr", {bar::HIGH, bar::LOW, bar::CLOSE}, {period},
            {Published(std::format("wr_{}", static_cast<int>(period)))});
  }
}

void AddCci(StepListBuilder &b) {
  b.Tulip("cci", {bar::HIGH, bar::LOW, bar::CLOSE}, {14}, {Published("cci")})
      .Tulip("cci", {bar::HIGH, bar::LOW, bar::CLOSE}, {84},
             {Published("cci_84")});
}

void AddPpo(StepListBuilder &b) {
  b.Tulip("ppo", {bar::CLOSE}, {12, 26}, {Published("ppo")})
      .Ema("ppo", 9, Published("ppos"))
      .Formula({"ppo", "ppos"}, Published("ppoh"),
               [](Row r) { return r[0] - r[1]; });
}

void AddStochRsi(StepListBuilder &b) {
  b.Tulip("min", {"rsi"}, {14}, {Scratch("rsi_min")})
      .Tulip("max", {"rsi"}, {14}, {Scratch("rsi_max")})
      .Formula({"rsi", "rsi_min", "rsi_max"},
               Published("stochrsi_k", NaNAndInf),
               [](Row r) { return PercentRatio(r[0] - r[1], r[2] - r[1]); })
      .Sma("stochrsi_k", 3, Published("stochrsi_d"));
}

void AddWaveTrend(StepListBuilder &b) {
  b.Ema("m_price", 10, Published("esa"))
      .Formula({"m_price", "esa"}, Scratch("esa_dev"),
               [](Row r) { return std::abs(r[0] - r[1]); })
      .Ema("esa_dev", 10, Published("esa_d"))
      .Formula({"m_price", "esa", "esa_d"}, Published("esa_ci", NaNAndInf),
               [](Row r) { return (r[0] - r[1]) / (0.015 * r[2]); })
      .Ema("esa_ci", 21, Published("wt1"))
      .Sma("wt1", 4, Published("wt2"));
}

void AddRoc(StepListBuilder &b) {
  // tulip reports a fraction; published as percent
  b.Tulip("roc", {bar::CLOSE}, {12}, {Published("roc")}, 100.0)
      .Sma("roc", 6, Published("rocma"))
      .Ema("roc", 9, Published("rocema"));
}

void AddPsy(StepListBuilder &b) {
  b.Formula({bar::CLOSE, "prev_close"}, Scratch("price_up"),
            [](Row r) { return r[0] > r[1] ? 1.0 : 0.0; })
      .Sum("price_up", 12, Scratch("price_up_sum"))
      .Formula({"price_up_sum"}, Published("psy"),
               [](Row r) { return r[0] / 12.0 * 100.0; })
      .Sma("psy", 6, Published("psyma"));
}

void AddBrar(StepListBuilder &b) {
  b.Formula({bar::HIGH, bar::OPEN}, Scratch("h_o"),
            [](Row r) { return r[0] - r[1]; })
      .Formula({bar::OPEN, bar::LOW}, Scratch("o_l"),
               [](Row r) { return r[0] - r[1]; })
      .Formula({bar::HIGH, "prev_close"}, Scratch("h_cy"),
               [](Row r) { return r[0] - r[1]; })
      .Formula({"prev_close", bar::LOW}, Scratch("cy_l"),
               [](Row r) { return r[0] - r[1]; })
      .Sum("h_o", 26, Scratch("h_o_sum"))
      .Sum("o_l", 26, Scratch("o_l_sum"))
      .Sum("h_cy", 26, Scratch("h_cy_sum"))
      .Sum("cy_l", 26, Scratch("cy_l_sum"))
      .Formula({"h_o_sum", "o_l_sum"}, Published("ar", NaNAndInf),
               [](Row r) { return PercentRatio(r[0], r[1]); })
      .Formula({"h_cy_sum", "cy_l_sum"}, Published("br", NaNAndInf),
               [](Row r) { return PercentRatio(r[0], r[1]); });
}

void AddBias(StepListBuilder &b) {
  b.Sma(bar::CLOSE, 6, Published("ma6"))
      .Sma(bar::CLOSE, 12, Published("ma12"))
      .Sma(bar::CLOSE, 24, Published("ma24"));
  for (auto const &[average, field] :
       {std::pair{"ma6", "bias"}, std::pair{"ma12", "bias_12"},
        std::pair{"ma24", "bias_24"}}) {
    b.Formula({bar::CLOSE, average}, Published(field, NaNAndInf),
              [](Row r) { return PercentRatio(r[0] - r[1], r[1]); });
  }
}

void AddRvi(StepListBuilder &b) {
  b.Formula({bar::CLOSE, bar::OPEN}, Scratch("rvi_body"),
            [](Row r) { return r[0] - r[1]; })
      .Symmetric4("rvi_body", Scratch("rvi_x"))
      .Symmetric4("h_l", Scratch("rvi_y"))
      .Sma("rvi_x", 10, Scratch("rvi_x_ma"))
      .Sma("rvi_y", 10, Scratch("rvi_y_ma"))
      .Formula({"rvi_x_ma", "rvi_y_ma"}, Published("rvi", NaNAndInf),
               [](Row r) { return r[0] / r[1]; })
      .Symmetric4("rvi", Published("rvis"));
}

// =============================================================================
// VOLATILITY
// =============================================================================

void AddBollinger(StepListBuilder &b) {
  // tulip bbands emits lower, middle, upper
  b.Tulip("bbands", {bar::CLOSE}, {20, 2},
          {Published("boll_lb"), Published("boll"), Published("boll_ub")});
}

void AddAtr(StepListBuilder &b) {
  b.Shift(bar::CLOSE, 1, Scratch("prev_close"))
      .Formula({bar::HIGH, bar::LOW}, Scratch("h_l"),
               [](Row r) { return r[0] - r[1]; })
      .Formula({bar::HIGH, bar::LOW, "prev_close"}, Published("tr"),
               [](Row r) {
                 return std::max({r[0] - r[1], std::abs(r[0] - r[2]),
                                  std::abs(r[2] - r[1])});
               })
      .Tulip("atr", {bar::HIGH, bar::LOW, bar::CLOSE}, {14},
             {Published("atr")});
}

// =============================================================================
// VOLUME
// =============================================================================

void AddCapacityRatio(StepListBuilder &b) {
  // m_price feeds WaveTrend with zero-volume bars read as 0. CR instead keeps
  // NaN for such a bar so it drops out of both legs on the next row.
  b.Formula({bar::AMOUNT, bar::VOLUME}, Scratch("m_price", NaNAndInf),
            [](Row r) { return r[0] / r[1]; })
      .Formula({bar::AMOUNT, bar::VOLUME}, Scratch("cr_m_price", NoSanitize),
               [](Row r) {
                 return r[1] == 0.0 ? std::numeric_limits<double>::quiet_NaN()
                                    : r[0] / r[1];
               })
      .Shift("cr_m_price", 1, Scratch("m_price_sf1", NoSanitize))
      .Formula({bar::HIGH, "m_price_sf1"}, Scratch("h_m"),
               [](Row r) { return r[0] - std::min(r[1], r[0]); })
      .Formula({"m_price_sf1", bar::LOW}, Scratch("m_l"),
               [](Row r) { return r[0] - std::min(r[0], r[1]); })
      .Sum("h_m", 26, Scratch("h_m_sum"))
      .Sum("m_l", 26, Scratch("m_l_sum"))
      .Formula({"h_m_sum", "m_l_sum"}, Published("cr", NaNAndInf),
               [](Row r) { return PercentRatio(r[0], r[1]); })
      .Sma("cr", 5, Published("cr-ma1"))
      .Sma("cr", 10, Published("cr-ma2"))
      .Sma("cr", 20, Published("cr-ma3"));
}

void AddVolumeRatio(StepListBuilder &b) {
  b.Formula({bar::PERCENT_CHANGE, bar::VOLUME}, Scratch("av"),
            [](Row r) { return r[0] > 0 ? r[1] : 0.0; })
      .Formula({bar::PERCENT_CHANGE, bar::VOLUME}, Scratch("bv"),
               [](Row r) { return r[0] < 0 ? r[1] : 0.0; })
      .Formula({bar::PERCENT_CHANGE, bar::VOLUME}, Scratch("cv"),
               [](Row r) { return r[0] == 0 ? r[1] : 0.0; })
      .Sum("av", 26, Scratch("avs"))
      .Sum("bv", 26, Scratch("bvs"))
      .Sum("cv", 26, Scratch("cvs"))
      .Formula({"avs", "bvs", "cvs"}, Published("vr", NaNAndInf),
               [](Row r) {
                 return PercentRatio(r[0] + r[2] / 2.0, r[1] + r[2] / 2.0);
               })
      .Sma("vr", 6, Published("vr_6_sma"));
}

void AddMfi(StepListBuilder &b) {
  b.Tulip("mfi", {bar::HIGH, bar::LOW, bar::CLOSE, bar::VOLUME}, {14},
          {Published("mfi")})
      .Sma("mfi", 6, Published("mfisma"));
}

void AddVwma(StepListBuilder &b) {
  b.Sum(bar::AMOUNT, 14, Scratch("tpv_14"))
      .Sum(bar::VOLUME, 14, Scratch("vol_14"))
      .Formula({"tpv_14", "vol_14"}, Published("vwma", NaNAndInf),
               [](Row r) { return r[0] / r[1]; })
      .Sma("vwma", 6, Published("mvwma"));
}

void AddObv(StepListBuilder &b) {
  b.Tulip("obv", {bar::CLOSE, bar::VOLUME}, {}, {Published("obv")});
}

void AddEmv(StepListBuilder &b) {
  b.Shift(bar::HIGH, 1, Scratch("prev_high"))
      .Shift(bar::LOW, 1, Scratch("prev_low"))
      .Formula({bar::HIGH, bar::LOW, "prev_high", "prev_low", bar::AMOUNT},
               Scratch("emva_em", NaNAndInf),
               [](Row r) {
                 const double mid = (r[0] + r[1]) / 2.0;
                 const double prevMid = (r[2] + r[3]) / 2.0;
                 return (mid - prevMid) * (r[0] - r[1]) / r[4];
               })
      .Sum("emva_em", 14, Published("emv"))
      .Sma("emv", 9, Published("emva"));
}

void AddForceIndex(StepListBuilder &b) {
  b.Diff(bar::CLOSE, Scratch("close_delta"))
      .Formula({"close_delta", bar::VOLUME}, Published("fi"),
               [](Row r) { return r[0] * r[1]; })
      .Ema("fi", 2, Published("force_2"))
      .Ema("fi", 13, Published("force_13"));
}

void AddVolumeAverages(StepListBuilder &b) {
  b.Sma(bar::VOLUME, 5, Published("vol_5"))
      .Sma(bar::VOLUME, 10, Published("vol_10"));
}
} // namespace

IndicatorStepList MakeDefaultSteps(SupertrendOptions const &supertrend) {
  StepListBuilder b;
  AddMacd(b);
  AddKdj(b);
  AddBollinger(b);
  AddTrix(b);
  AddCapacityRatio(b);
  AddRsi(b);
  AddVolumeRatio(b);
  AddAtr(b);
  AddDmi(b);
  AddWilliams(b);
  AddCci(b);
  AddDma(b);
  AddTema(b);
  AddMfi(b);
  AddVwma(b);
  AddPpo(b);
  AddStochRsi(b);
  AddWaveTrend(b);
  AddSupertrend(b, supertrend);
  AddRoc(b);
  AddObv(b);
  AddSar(b);
  AddPsy(b);
  AddBrar(b);
  AddEmv(b);
  AddBias(b);
  AddDpo(b);
  AddVhf(b);
  AddRvi(b);
  AddForceIndex(b);
  AddEne(b);
  AddVolumeAverages(b);
  AddPriceAverages(b);
  return b.Build();
}

IndicatorPipelinePtr MakeDefaultPipeline(SupertrendOptions const &supertrend) {
  return std::make_shared<const IndicatorPipeline>(
      MakeDefaultSteps(supertrend));
}

} // namespace epoch_ta::indicator
