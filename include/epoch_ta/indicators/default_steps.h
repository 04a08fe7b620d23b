//
// Created by adesola on 3/13/25.
//

#pragma once
#include "indicator_pipeline.h"
#include "supertrend.h"

namespace epoch_ta::indicator {

// Full indicator set: MACD, KDJ, BOLL, TRIX, CR, RSI, VR, ATR, DMI, WR, CCI,
// DMA, TEMA, MFI, VWMA, PPO, StochRSI, WaveTrend, Supertrend, ROC, OBV, SAR,
// PSY, BRAR, EMV, BIAS, DPO, VHF, RVI, Force Index, ENE and the volume/price
// averages.
IndicatorStepList MakeDefaultSteps(SupertrendOptions const &supertrend = {});

IndicatorPipelinePtr MakeDefaultPipeline(SupertrendOptions const &supertrend = {});

} // namespace epoch_ta::indicator
