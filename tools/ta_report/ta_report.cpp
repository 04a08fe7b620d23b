//
// TA Report Tool
// Derives indicator and candle pattern frames for one instrument's daily bars,
// writes them as CSV and prints the latest-row snapshots as JSON.
//

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include <arrow/compute/initialize.h>
#include <spdlog/spdlog.h>

#include <epoch_ta/core/bar_loader.h>
#include <epoch_ta/core/config.h>
#include <epoch_ta/runtime/batch_runner.h>

namespace fs = std::filesystem;

struct ReportConfig {
  std::string bars_path;
  std::string code = "000001";
  std::string as_of;
  std::string config_path;
  std::string output_dir = ".";
  std::vector<std::string> fields = {"macd", "kdjk", "kdjd", "kdjj", "boll",
                                     "rsi_6", "cr", "supertrend"};
  std::string log_level = "info";
};

void PrintUsage(const char *prog_name) {
  std::cout
      << "Usage: " << prog_name << " --bars PATH [options]\n"
      << "Options:\n"
      << "  --bars PATH             Daily bar CSV (date,open,high,low,close,volume,amount,p_change)\n"
      << "  --code CODE             Instrument code (default: 000001)\n"
      << "  --as-of YYYY-MM-DD      Snapshot date (default: last bar)\n"
      << "  --config PATH           Engine config YAML\n"
      << "  --output-dir PATH       Output directory (default: current directory)\n"
      << "  --fields a,b,c          Indicator fields in the snapshot\n"
      << "  --log-level LEVEL       trace|debug|info|warn|error (default: info)\n"
      << "  --help                  Show this help\n";
}

std::vector<std::string> SplitFields(std::string const &csv) {
  std::vector<std::string> fields;
  std::stringstream stream(csv);
  std::string field;
  while (std::getline(stream, field, ',')) {
    if (!field.empty()) {
      fields.push_back(field);
    }
  }
  return fields;
}

ReportConfig ParseArgs(int argc, char *argv[]) {
  ReportConfig config;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      exit(0);
    } else if (arg == "--bars" && i + 1 < argc) {
      config.bars_path = argv[++i];
    } else if (arg == "--code" && i + 1 < argc) {
      config.code = argv[++i];
    } else if (arg == "--as-of" && i + 1 < argc) {
      config.as_of = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      config.config_path = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      config.output_dir = argv[++i];
    } else if (arg == "--fields" && i + 1 < argc) {
      config.fields = SplitFields(argv[++i]);
    } else if (arg == "--log-level" && i + 1 < argc) {
      config.log_level = argv[++i];
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      exit(1);
    }
  }

  if (config.bars_path.empty()) {
    std::cerr << "--bars is required\n";
    PrintUsage(argv[0]);
    exit(1);
  }
  return config;
}

int main(int argc, char *argv[]) {
  auto arrowComputeStatus = arrow::compute::Initialize();
  if (!arrowComputeStatus.ok()) {
    std::stringstream errorMsg;
    errorMsg << "arrow compute initialized failed: " << arrowComputeStatus
             << std::endl;
    throw std::runtime_error(errorMsg.str());
  }

  auto report = ParseArgs(argc, argv);
  spdlog::set_level(spdlog::level::from_str(report.log_level));

  try {
    auto engineConfig = report.config_path.empty()
                            ? epoch_ta::EngineConfig{}
                            : epoch_ta::LoadEngineConfigFile(report.config_path);

    auto bars = epoch_ta::LoadBarsCsv(report.bars_path);
    if (report.as_of.empty()) {
      report.as_of = epoch_ta::LastDate(bars);
    }

    SPDLOG_INFO("=== TA Report ===");
    SPDLOG_INFO("Code: {}  Bars: {}  As of: {}", report.code, bars.num_rows(),
                report.as_of);

    const epoch_ta::runtime::BatchRunner runner(engineConfig);

    std::vector<std::string> indicatorColumns{
        epoch_ta::snapshot::DATE_COLUMN, epoch_ta::snapshot::CODE_COLUMN};
    indicatorColumns.insert(indicatorColumns.end(), report.fields.begin(),
                            report.fields.end());

    std::vector<std::string> patternColumns{epoch_ta::snapshot::DATE_COLUMN,
                                            epoch_ta::snapshot::CODE_COLUMN};
    for (auto const &name : epoch_ta::pattern::AvailableCandlePatterns()) {
      if (engineConfig.patterns.enabled.empty() ||
          std::ranges::find(engineConfig.patterns.enabled, name) !=
              engineConfig.patterns.enabled.end()) {
        patternColumns.push_back(name);
      }
    }

    const auto result = runner.RunAsset(
        report.code, bars,
        epoch_ta::runtime::BatchRequest{.asOfDate = report.as_of,
                                        .indicatorColumns = indicatorColumns,
                                        .patternColumns = patternColumns});

    fs::create_directories(report.output_dir);
    const auto indicatorPath =
        fs::path(report.output_dir) / (report.code + "_indicators.csv");
    const auto patternPath =
        fs::path(report.output_dir) / (report.code + "_patterns.csv");
    epoch_ta::WriteFrameCsv(result.indicators, indicatorPath);
    epoch_ta::WriteFrameCsv(result.patterns, patternPath);
    SPDLOG_INFO("Saved {} ({} rows, {} columns)", indicatorPath.string(),
                result.indicators.num_rows(), result.indicators.num_cols());
    SPDLOG_INFO("Saved {} ({} rows, {} columns)", patternPath.string(),
                result.patterns.num_rows(), result.patterns.num_cols());

    if (result.indicatorSnapshot) {
      std::cout << epoch_ta::snapshot::ToJson(*result.indicatorSnapshot)
                << "\n";
    }
    if (result.patternSnapshot) {
      std::cout << epoch_ta::snapshot::ToJson(*result.patternSnapshot) << "\n";
    } else {
      SPDLOG_INFO("No candle pattern fired on {}", report.as_of);
    }
  } catch (std::exception const &exp) {
    SPDLOG_ERROR("ta_report failed: {}", exp.what());
    return 1;
  }

  return 0;
}
