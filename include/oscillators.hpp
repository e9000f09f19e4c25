#pragma once

#include "candle_types.hpp"

#include <optional>

namespace ta {

struct StochasticResult {
  double k;
  double d;
};

struct BollingerBands {
  double upper;
  double middle;
  double lower;
  double std_dev;
};

struct MacdResult {
  double line;
  double signal;
  double histogram;
};

struct IchimokuCloud {
  double tenkan_sen;
  double kijun_sen;
  double senkou_span_a;
  double senkou_span_b;
  std::optional<double> chikou_span; // Absent with fewer than 26 candles
};

/// Wilder-smoothed RSI in [0, 100].
/// Needs period + 1 candles, otherwise returns exactly 50.
/// Returns 100 when the average loss is zero.
double rsi(SeriesView series, int period = 14);

/// Slow stochastic: raw %K per full `period` window (50 on a flat range),
/// K line = SMA(k_smoothing) of raw %K, D line = SMA(d_smoothing) of K.
/// Returns {50, 50} when there is not enough data to smooth.
StochasticResult stochastic(SeriesView series, int period = 14,
                            int k_smoothing = 3, int d_smoothing = 3);

/// Middle band = SMA(period). The deviation runs over every close in the view
/// but divides by `period`, so a view longer than the period widens the bands.
BollingerBands bollinger_bands(SeriesView series, int period = 20,
                               double multiplier = 2.0);

/// MACD line = EMA12 - EMA26 over the whole view. The signal line is the EMA
/// of a single MACD sample, i.e. equal to the line, so the histogram is 0.
MacdResult macd(SeriesView series);

/// Builds the MACD record from already computed fast and slow EMAs
MacdResult make_macd(double fast_ema, double slow_ema);

/// Standard deviation of close-to-close returns, in percent
double volatility(SeriesView series);

/// (last close - first close) / first close * 100
double momentum(SeriesView series);

/// Ichimoku lines over the tail of the view (9 / 26 / 52 candles)
IchimokuCloud ichimoku(SeriesView series);

} // namespace ta
