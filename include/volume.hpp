#pragma once

#include "candle_types.hpp"

#include <cstdint>
#include <vector>

namespace ta {

struct VolumeProfile {
  std::vector<double> buckets; // Volume per equal-width price bucket, low to high
  double poc;                  // Lower bound of the fullest bucket
  double value_area;           // 70% of the total accumulated volume
};

/// Price level (rounded close) that traded the most volume
struct VolumeByPrice {
  double poc;
  double max_volume;
};

struct DeltaVolume {
  uint64_t time;
  double delta;      // +volume for a bullish candle, -volume otherwise
  double cumulative; // Running sum of delta up to this candle
};

/// Buckets each candle's volume by its (high + low) / 2 midpoint across
/// `levels` equal slices of [lowest low, highest high].
/// @throws std::invalid_argument if levels <= 0
VolumeProfile volume_profile(SeriesView series, int levels = 10);

/// Volume keyed by close rounded to the nearest multiple of `step`
/// @throws std::invalid_argument if step <= 0
VolumeByPrice volume_by_price(SeriesView series, double step = 10.0);

/// Running sum of signed candle volume
double cumulative_volume_delta(SeriesView series);

/// Per-candle signed volume with its running total, in series order
std::vector<DeltaVolume> delta_volume_series(SeriesView series);

} // namespace ta
