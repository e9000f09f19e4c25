#pragma once

#include "candle_types.hpp"

#include <random>
#include <string>

namespace ta {

enum class Sentiment { Bullish, Bearish, Neutral };

std::string to_string(Sentiment sentiment);

struct SentimentReading {
  Sentiment overall;
  Sentiment price;  // From the close change over the window
  Sentiment volume; // From recent volume against the window average
};

struct Forecast {
  double expected_move;   // Fractional next-candle move
  double confidence;      // [0, 1], shrinks as return volatility grows
  double predicted_price; // last close * (1 + expected_move)
};

/// Price/volume heuristic over the last 20 candles.
/// All Neutral with fewer than 10 candles.
SentimentReading analyze_sentiment(SeriesView series);

/// Mean-return forecast over the last 30 candles with a +/-10% jitter drawn
/// from `rng`. A fixed seed gives a reproducible forecast.
/// Returns {0, 0, last close} with fewer than 10 candles.
Forecast forecast_next_move(SeriesView series, std::mt19937_64 &rng);

} // namespace ta
