#include "candle_csv.hpp"
#include "report_codec.hpp"
#include "summary.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void usage() {
  std::cerr << "Usage: ta_report --input FILE [--symbol NAME] [--timeframe TF] "
            << "[--format text|proto] [--rsi-window N] [--min-candles N]\n";
}

struct Options {
  std::string input_path;
  std::string symbol{"UNKNOWN"};
  std::string timeframe{"1h"};
  std::string format{"text"};
  ta::SummaryConfig summary;
};

bool parse_args(int argc, char **argv, Options &opts) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--input" && i + 1 < argc) {
      opts.input_path = argv[++i];
    } else if (arg == "--symbol" && i + 1 < argc) {
      opts.symbol = argv[++i];
    } else if (arg == "--timeframe" && i + 1 < argc) {
      opts.timeframe = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      opts.format = argv[++i];
    } else if (arg == "--rsi-window" && i + 1 < argc) {
      opts.summary.rsi_window = std::stoul(argv[++i]);
    } else if (arg == "--min-candles" && i + 1 < argc) {
      opts.summary.min_candles = std::stoul(argv[++i]);
    } else if (arg == "--help") {
      usage();
      return false;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      usage();
      return false;
    }
  }
  if (opts.input_path.empty() ||
      (opts.format != "text" && opts.format != "proto")) {
    usage();
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  Options opts;
  ta::Timeframe timeframe = ta::Timeframe::HOUR_1;
  ta::CandleSeries series;

  try {
    if (!parse_args(argc, argv, opts)) {
      return 1;
    }
    timeframe = ta::timeframe_from_string(opts.timeframe);
    series = ta::load_candles_csv(opts.input_path);
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }

  std::cerr << "loaded " << series.size() << " candles from "
            << opts.input_path << std::endl;

  ta::SummaryResult result = ta::summarize(series, opts.summary);
  if (!result.ok()) {
    std::cerr << "insufficient data: " << result.message << " (have "
              << series.size() << ", need " << opts.summary.min_candles
              << ")" << std::endl;
    return 2;
  }

  try {
    if (opts.format == "proto") {
      std::cout << ta::serialize_report(*result.report, opts.symbol, timeframe);
    } else {
      ta::write_report_text(std::cout, *result.report, opts.symbol, timeframe);
    }
  } catch (const std::exception &ex) {
    std::cerr << "failed to write report: " << ex.what() << "\n";
    return 1;
  }
  std::cout.flush();
  return 0;
}
