#pragma once

#include "candle_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ta {

enum class CandlePattern {
  Doji,
  Hammer,
  ShootingStar,
  BullishEngulfing,
  BearishEngulfing
};

enum class ChartPattern { HeadAndShoulders, DoubleTop, DoubleBottom };

/// Indicator compared against price in divergence checks
enum class DivergenceSource { Rsi, MacdProxy };

enum class DivergenceType { Regular, Hidden };

enum class Direction { Bullish, Bearish };

struct Divergence {
  DivergenceType type;
  Direction direction;
};

enum class Trend { StrongBullish, Bullish, StrongBearish, Bearish, Neutral };

enum class MarketCondition {
  StronglyOverbought,
  Overbought,
  StronglyOversold,
  Oversold,
  Neutral
};

enum class RiskLevel { Low, Medium, High };

std::string to_string(CandlePattern pattern);
std::string to_string(ChartPattern pattern);
std::string to_string(DivergenceSource source);
std::string to_string(DivergenceType type);
std::string to_string(Direction direction);
std::string to_string(Trend trend);
std::string to_string(MarketCondition condition);
std::string to_string(RiskLevel level);

/// Classifies the last candle (and the one before it for engulfing patterns).
/// Checks run in declaration order of CandlePattern; every match is reported.
/// Fewer than two candles yields no patterns.
std::vector<CandlePattern> candle_patterns(SeriesView series);

/// Head and shoulders, double top and double bottom with a 2% equality
/// tolerance. At most one hit per pattern type.
std::vector<ChartPattern> chart_patterns(SeriesView series);

/// Compares the direction of the last two closes with the direction of the
/// last two values of the chosen indicator. Empty when either direction is
/// flat or the view holds fewer than two candles.
std::optional<Divergence> divergence(SeriesView series, DivergenceSource source);

/// Rule precedence: Strong Bullish, Bullish, Strong Bearish, Bearish, Neutral
Trend classify_trend(double close, double sma50, double sma200);

/// classify_trend() with the last close and the SMA50/SMA200 of the view
Trend classify_trend(SeriesView series);

MarketCondition classify_market_condition(double rsi, double stoch_k,
                                          double stoch_d);

/// Averages four binary risk flags (RSI outside [30, 70], volatility > 5,
/// |momentum| > 10, ATR > 100) scored 2 when raised and 1 otherwise.
RiskLevel risk_level(double rsi, double volatility, double momentum, double atr);

} // namespace ta
