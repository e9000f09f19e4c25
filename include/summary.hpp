#pragma once

#include "candle_types.hpp"
#include "oscillators.hpp"
#include "patterns.hpp"
#include "sentiment.hpp"
#include "structure.hpp"
#include "volume.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ta {

/// Window sizes (in candles) the summary slices from the end of the series
struct SummaryConfig {
  std::size_t min_candles{200};
  std::size_t recent_window{100};  // Structure, stochastic, chart patterns, CVD
  std::size_t rsi_window{100};
  std::size_t divergence_window{50};
  std::size_t bollinger_window{20};
  std::size_t ichimoku_window{52};
  std::size_t short_window{14};    // ATR, momentum, volatility
  std::size_t profile_window{50};  // Volume profile and delta series
  std::size_t candle_pattern_window{5};
  std::size_t range_window{24};    // Price snapshot high/low
  int rsi_period{14};
  int profile_levels{10};
};

struct PriceSnapshot {
  double current;
  double change_pct; // Against the previous close
  double volume;
  double high_24;
  double low_24;
};

struct MovingAverages {
  double sma20;
  double sma50;
  double sma200;
  double ema12;
  double ema26;
  double ema55;
};

struct AnalysisReport {
  uint64_t time; // Time of the last candle
  PriceSnapshot price;
  MovingAverages averages;
  MacdResult macd;
  double rsi;
  std::optional<Divergence> rsi_divergence;
  std::optional<Divergence> macd_divergence;
  StochasticResult stochastic;
  BollingerBands bollinger;
  IchimokuCloud ichimoku;
  double atr;
  double momentum;
  double volatility;

  SupportResistance levels;
  std::vector<OrderBlock> order_blocks;
  MarketStructure structure;
  KeyLevels key_levels;
  FibonacciLevels fibonacci;
  PivotPoints pivots;

  VolumeProfile volume_profile;
  VolumeByPrice volume_by_price;
  double cvd;
  std::vector<DeltaVolume> delta_volume;

  std::vector<CandlePattern> candle_patterns;
  std::vector<ChartPattern> chart_patterns;

  Trend trend;
  MarketCondition condition;
  RiskLevel risk;
  SentimentReading sentiment;

  std::vector<std::string> signals;
};

enum class SummaryStatus { Ok, InsufficientData };

struct SummaryResult {
  SummaryStatus status;
  std::string message;
  std::optional<AnalysisReport> report; // Engaged only when status == Ok

  bool ok() const { return status == SummaryStatus::Ok; }
};

/// Full technical picture of a series. Callers must check status(): fewer
/// than config.min_candles candles yields InsufficientData and no report.
SummaryResult summarize(SeriesView series,
                        const SummaryConfig &config = SummaryConfig{});

/// Threshold rules turning indicator values into ordered textual signals
std::vector<std::string> generate_signals(double last_close, double rsi_value,
                                          Trend trend,
                                          const StochasticResult &stoch,
                                          const BollingerBands &bands);

} // namespace ta
