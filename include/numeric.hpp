#pragma once

#include "candle_types.hpp"

#include <vector>

namespace ta {
namespace numeric {

/// a / b, or fallback when b is zero
inline double safe_div(double a, double b, double fallback = 0.0) {
  if (b == 0.0) {
    return fallback;
  }
  return a / b;
}

/// Arithmetic mean; 0 for an empty range
double mean(const std::vector<double> &values);

/// Population standard deviation around the values' own mean; 0 when empty
double population_std_dev(const std::vector<double> &values);

/// Sum of all values
double sum(const std::vector<double> &values);

/// Highest high of the view; 0 when empty
double highest_high(SeriesView series);

/// Lowest low of the view; 0 when empty
double lowest_low(SeriesView series);

/// (highest high + lowest low) / 2 over the view
double midpoint(SeriesView series);

/// Simple close-to-close returns, one fewer than the candles
std::vector<double> simple_returns(SeriesView series);

/// Relative distance |a - b| / |reference|, infinity when reference is zero
double relative_diff(double a, double b, double reference);

} // namespace numeric
} // namespace ta
