#pragma once

#include "candle_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ta {

struct SupportResistance {
  double support;    // Lowest low of the view
  double resistance; // Highest high of the view
};

enum class OrderBlockKind { Bullish, Bearish };

std::string to_string(OrderBlockKind kind);

/// Price range of the candle that preceded a momentum break
struct OrderBlock {
  OrderBlockKind kind;
  double top;
  double bottom;
  uint64_t time;
};

enum class SwingKind { High, Low };
enum class StructureTrend { Uptrend, Downtrend, Neutral };

std::string to_string(SwingKind kind);
std::string to_string(StructureTrend trend);

struct SwingPoint {
  SwingKind kind;
  double price;
  uint64_t time;
};

struct MarketStructure {
  std::vector<SwingPoint> swings;
  StructureTrend trend;
  double strength; // |last close - first close| / first close * 100
};

struct KeyLevels {
  std::vector<double> support;    // Nearest first, below the last close
  std::vector<double> resistance; // Nearest first, above the last close
};

struct FibonacciLevels {
  double level_0;
  double level_236;
  double level_382;
  double level_500;
  double level_618;
  double level_786;
  double level_1000;
};

struct PivotPoints {
  double pp;
  double r1, r2, r3;
  double s1, s2, s3;
};

/// Range extremes of the view (zeros when empty)
SupportResistance support_resistance(SeriesView series);

/// Scans every consecutive candle pair for a momentum handoff:
///   bullish: bearish candle, then a bullish candle closing above its high
///   bearish: bullish candle, then a bearish candle closing below its low
std::vector<OrderBlock> order_blocks(SeriesView series);

/// 3-candle swing highs/lows and the trend implied by the last two swings
MarketStructure market_structure(SeriesView series);

/// First-match clustering: each price joins the first cluster whose anchor is
/// within `tolerance` (relative) of it, or anchors a new cluster. Returns the
/// anchors of clusters holding at least `min_members` prices, in creation order.
std::vector<double> price_clusters(const std::vector<double> &prices,
                                   double tolerance = 0.005,
                                   std::size_t min_members = 4);

/// Up to three clustered support levels below and resistance levels above the
/// last close, from the last 100 candles. Empty with fewer than 20 candles.
KeyLevels key_levels(SeriesView series);

FibonacciLevels fibonacci_levels(double high, double low);

PivotPoints pivot_points(double high, double low, double close);

} // namespace ta
