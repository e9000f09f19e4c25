#include "volume.hpp"
#include "numeric.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace ta {

namespace {

constexpr double VALUE_AREA_SHARE = 0.7;

double signed_volume(const Candle& candle) {
    return candle.bullish() ? candle.volume : -candle.volume;
}

} // namespace

VolumeProfile volume_profile(SeriesView series, int levels) {
    if (levels <= 0) {
        throw std::invalid_argument("volume profile levels must be > 0");
    }

    VolumeProfile profile;
    profile.buckets.assign(static_cast<std::size_t>(levels), 0.0);
    profile.poc = 0.0;
    profile.value_area = 0.0;
    if (series.empty()) {
        return profile;
    }

    const double high = numeric::highest_high(series);
    const double low = numeric::lowest_low(series);
    const double level_size = (high - low) / levels;

    for (const auto& candle : series) {
        std::size_t index = 0;
        if (level_size > 0.0) {
            const double mid = (candle.high + candle.low) / 2.0;
            const double slot = std::floor((mid - low) / level_size);
            index = static_cast<std::size_t>(std::max(0.0, slot));
            // A midpoint sitting on the range top belongs to the last bucket
            index = std::min(index, profile.buckets.size() - 1);
        }
        profile.buckets[index] += candle.volume;
    }

    const auto fullest = std::max_element(profile.buckets.begin(), profile.buckets.end());
    const auto poc_index = static_cast<double>(fullest - profile.buckets.begin());
    profile.poc = low + poc_index * level_size;
    profile.value_area = numeric::sum(profile.buckets) * VALUE_AREA_SHARE;
    return profile;
}

VolumeByPrice volume_by_price(SeriesView series, double step) {
    if (step <= 0.0) {
        throw std::invalid_argument("volume price step must be > 0");
    }

    std::map<double, double> by_level;
    for (const auto& candle : series) {
        const double level = std::round(candle.close / step) * step;
        by_level[level] += candle.volume;
    }

    VolumeByPrice result{0.0, 0.0};
    bool first = true;
    for (const auto& [level, volume] : by_level) {
        if (first || volume > result.max_volume) {
            result.poc = level;
            result.max_volume = volume;
            first = false;
        }
    }
    return result;
}

double cumulative_volume_delta(SeriesView series) {
    double cvd = 0.0;
    for (const auto& candle : series) {
        cvd += signed_volume(candle);
    }
    return cvd;
}

std::vector<DeltaVolume> delta_volume_series(SeriesView series) {
    std::vector<DeltaVolume> out;
    out.reserve(series.size());

    double cumulative = 0.0;
    for (const auto& candle : series) {
        const double delta = signed_volume(candle);
        cumulative += delta;
        out.push_back({candle.time, delta, cumulative});
    }
    return out;
}

} // namespace ta
