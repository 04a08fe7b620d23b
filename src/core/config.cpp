//
// Created by adesola on 3/20/25.
//
#include <epoch_core/macros.h>
#include <epoch_ta/core/config.h>
#include <spdlog/spdlog.h>

namespace {
// absent -> fallback, null -> unbounded, otherwise a positive row count
std::optional<size_t> ReadWindow(YAML::Node const &node, std::string const &key,
                                 std::optional<size_t> fallback) {
  if (!node || !node[key]) {
    return fallback;
  }
  auto const value = node[key];
  if (value.IsNull()) {
    return std::nullopt;
  }
  const auto rows = value.as<int64_t>();
  AssertFromFormat(rows > 0, "{} must be a positive row count, got {}", key,
                   rows);
  return static_cast<size_t>(rows);
}

template <typename T>
void ReadOptional(YAML::Node const &node, std::string const &key,
                  std::optional<T> &target) {
  if (node && node[key] && !node[key].IsNull()) {
    target = node[key].as<T>();
  }
}
} // namespace

namespace YAML {
template <> struct convert<epoch_ta::pattern::CandleThresholds> {
  static bool decode(Node const &node,
                     epoch_ta::pattern::CandleThresholds &thresholds) {
    if (!node.IsMap()) {
      return false;
    }
    ReadOptional(node, "period", thresholds.period);
    ReadOptional(node, "body_none", thresholds.body_none);
    ReadOptional(node, "body_short", thresholds.body_short);
    ReadOptional(node, "body_long", thresholds.body_long);
    ReadOptional(node, "wick_none", thresholds.wick_none);
    ReadOptional(node, "wick_long", thresholds.wick_long);
    ReadOptional(node, "near", thresholds.near);
    return true;
  }
};

template <> struct convert<epoch_ta::indicator::SupertrendOptions> {
  static bool decode(Node const &node,
                     epoch_ta::indicator::SupertrendOptions &options) {
    if (!node.IsMap()) {
      return false;
    }
    if (node["multiplier"]) {
      options.multiplier = node["multiplier"].as<double>();
    }
    if (node["fallback"]) {
      const auto fallback = node["fallback"].as<std::string>();
      options.fallback = epoch_core::TrendFallbackWrapper::FromString(fallback);
      AssertFromFormat(options.fallback != epoch_core::TrendFallback::Null,
                       "unknown supertrend fallback: {}", fallback);
    }
    return true;
  }
};
} // namespace YAML

namespace epoch_ta {

EngineConfig LoadEngineConfig(YAML::Node const &root) {
  EngineConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  AssertFromStream(root.IsMap(), "engine config must be a YAML map");

  if (auto const node = root["indicators"]) {
    config.indicators.output_window =
        ReadWindow(node, "output_window", config.indicators.output_window);
    config.indicators.calc_window =
        ReadWindow(node, "calc_window", config.indicators.calc_window);
  }

  if (auto const node = root["patterns"]) {
    config.patterns.output_window =
        ReadWindow(node, "output_window", config.patterns.output_window);
    config.patterns.calc_window =
        ReadWindow(node, "calc_window", config.patterns.calc_window);
    if (node["enabled"]) {
      config.patterns.enabled = node["enabled"].as<std::vector<std::string>>();
    }
    if (node["candle"]) {
      config.patterns.candle =
          node["candle"].as<epoch_ta::pattern::CandleThresholds>();
    }
  }

  if (auto const node = root["snapshot"]) {
    if (node["lookback"]) {
      const auto lookback = node["lookback"].as<int64_t>();
      AssertFromFormat(lookback > 0, "snapshot.lookback must be positive, got {}",
                       lookback);
      config.snapshot.lookback = static_cast<size_t>(lookback);
    }
    if (node["extend_to_required_lookback"]) {
      config.snapshot.extend_to_required_lookback =
          node["extend_to_required_lookback"].as<bool>();
    }
  }

  if (auto const node = root["supertrend"]) {
    config.supertrend = node.as<indicator::SupertrendOptions>();
    AssertFromFormat(config.supertrend.multiplier > 0.0,
                     "supertrend.multiplier must be positive, got {}",
                     config.supertrend.multiplier);
  }

  if (auto const node = root["runtime"]) {
    if (node["parallel"]) {
      config.runtime.parallel = node["parallel"].as<bool>();
    }
  }

  return config;
}

EngineConfig LoadEngineConfigFile(std::filesystem::path const &path) {
  AssertFromFormat(std::filesystem::exists(path),
                   "engine config not found: {}", path.string());
  SPDLOG_DEBUG("Loading engine config from {}", path.string());
  return LoadEngineConfig(YAML::LoadFile(path.string()));
}

} // namespace epoch_ta
