#pragma once

#include "candle_types.hpp"

namespace ta {

/// Simple moving average of the last `period` closes.
/// Shorter series fall back to the last close (0 when empty).
/// @throws std::invalid_argument if period <= 0
double sma(SeriesView series, int period);

/// Exponential moving average seeded with the first close of the view,
/// multiplier 2 / (period + 1). Returns 0 for an empty view.
/// @throws std::invalid_argument if period <= 0
double ema(SeriesView series, int period);

/// EMA with the period equal to the view length
double ema(SeriesView series);

/// Population standard deviation of all closes in the view around `mean`,
/// dividing by `divisor` rather than by the view length.
/// @throws std::invalid_argument if divisor <= 0
double std_dev(SeriesView series, double mean, int divisor);

/// max(high - low, |high - prev_close|, |low - prev_close|)
double true_range(const Candle &candle, double prev_close);

/// Sum of the true ranges of consecutive candles divided by `period`.
/// This is not Wilder's ATR: the divisor is the period, not the sample count.
/// Fewer than two candles give 0.
/// @throws std::invalid_argument if period <= 0
double atr(SeriesView series, int period = 14);

} // namespace ta
