#include "candle_csv.hpp"
#include "jetstream_publisher.hpp"

#include <iostream>
#include <stdexcept>
#include <memory>
#include <string>

namespace {

void usage() {
  std::cerr << "Usage: ta_publish --input FILE [--symbol NAME] [--timeframe TF] "
            << "[--nats-url URL] [--stream NAME] [--subject-root ROOT]\n";
}

bool parse_args(int argc, char **argv, std::string &input_path,
                std::string &symbol, std::string &timeframe,
                std::string &nats_url, std::string &stream,
                std::string &subject_root) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--symbol" && i + 1 < argc) {
      symbol = argv[++i];
    } else if (arg == "--timeframe" && i + 1 < argc) {
      timeframe = argv[++i];
    } else if (arg == "--nats-url" && i + 1 < argc) {
      nats_url = argv[++i];
    } else if (arg == "--stream" && i + 1 < argc) {
      stream = argv[++i];
    } else if (arg == "--subject-root" && i + 1 < argc) {
      subject_root = argv[++i];
    } else if (arg == "--help") {
      usage();
      return false;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      usage();
      return false;
    }
  }
  if (input_path.empty()) {
    usage();
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  std::string input_path;
  std::string symbol = "UNKNOWN";
  std::string timeframe_label = "1h";
  std::string nats_url = "nats://127.0.0.1:4222";
  std::string stream = "TA";
  std::string subject_root = "ta";

  if (!parse_args(argc, argv, input_path, symbol, timeframe_label, nats_url,
                  stream, subject_root)) {
    return 1;
  }

  ta::Timeframe timeframe = ta::Timeframe::HOUR_1;
  ta::CandleSeries series;
  try {
    timeframe = ta::timeframe_from_string(timeframe_label);
    series = ta::load_candles_csv(input_path);
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }

  if (series.empty()) {
    std::cerr << "no candles read from input" << std::endl;
    return 1;
  }
  std::cout << "loaded " << series.size() << " candles" << std::endl;

  ta::JetStreamConfig js_cfg;
  js_cfg.url = nats_url;
  js_cfg.stream = stream;
  js_cfg.subject_root = subject_root;

  std::unique_ptr<ta::JetStreamReportPublisher> publisher;
  try {
    publisher = std::make_unique<ta::JetStreamReportPublisher>(js_cfg);
  } catch (const std::exception &ex) {
    std::cerr << "failed to initialize JetStream publisher: " << ex.what()
              << "\n";
    return 1;
  }

  try {
    ta::SummaryStatus status =
        ta::publish_summary(*publisher, series, symbol, timeframe);
    if (status != ta::SummaryStatus::Ok) {
      return 2;
    }
  } catch (const std::exception &ex) {
    std::cerr << "failed to publish report: " << ex.what() << "\n";
    return 1;
  }

  return 0;
}
