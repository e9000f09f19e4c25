#pragma once

#include "candle_types.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace ta {
namespace test_util {

/// Candle with open = close, high/low offset by `spread`
inline Candle flat_candle(uint64_t time, double close, double spread = 1.0,
                          double volume = 100.0) {
  return Candle(time, close, close + spread, close - spread, close, volume);
}

/// One candle per close; open is the previous close so direction follows price
inline CandleSeries from_closes(const std::vector<double> &closes,
                                double spread = 1.0, double volume = 100.0) {
  CandleSeries series;
  series.reserve(closes.size());
  for (std::size_t i = 0; i < closes.size(); ++i) {
    const double close = closes[i];
    const double open = i == 0 ? close : closes[i - 1];
    const double high = std::max(open, close) + spread;
    const double low = std::min(open, close) - spread;
    series.emplace_back(1700000000 + i * 60, open, high, low, close, volume);
  }
  return series;
}

/// Linear ramp of closes starting at `start` with `step` per candle
inline CandleSeries ramp(std::size_t count, double start, double step,
                         double spread = 1.0) {
  std::vector<double> closes;
  closes.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    closes.push_back(start + step * static_cast<double>(i));
  }
  return from_closes(closes, spread);
}

/// Deterministic oscillating series around `base`
inline CandleSeries wave(std::size_t count, double base, double amplitude) {
  std::vector<double> closes;
  closes.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    closes.push_back(base + amplitude * std::sin(static_cast<double>(i) * 0.3) +
                     0.05 * static_cast<double>(i));
  }
  return from_closes(closes);
}

} // namespace test_util
} // namespace ta
