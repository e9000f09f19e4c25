#include "candle_types.hpp"

#include <algorithm>
#include <stdexcept>

namespace ta {

// ============================================================================
// Timeframe
// ============================================================================

std::string to_string(Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::SEC_1:
        return "1s";
    case Timeframe::MIN_1:
        return "1m";
    case Timeframe::MIN_5:
        return "5m";
    case Timeframe::MIN_15:
        return "15m";
    case Timeframe::HOUR_1:
        return "1h";
    case Timeframe::HOUR_4:
        return "4h";
    case Timeframe::DAY_1:
        return "1d";
    default:
        return "custom";
    }
}

Timeframe timeframe_from_string(const std::string& label) {
    static const Timeframe all[] = {Timeframe::SEC_1,  Timeframe::MIN_1,
                                    Timeframe::MIN_5,  Timeframe::MIN_15,
                                    Timeframe::HOUR_1, Timeframe::HOUR_4,
                                    Timeframe::DAY_1};
    for (Timeframe tf : all) {
        if (to_string(tf) == label) {
            return tf;
        }
    }
    throw std::invalid_argument("unknown timeframe: " + label);
}

// ============================================================================
// SeriesView
// ============================================================================

std::vector<double> SeriesView::closes() const {
    std::vector<double> out;
    out.reserve(size_);
    for (const auto& c : *this) {
        out.push_back(c.close);
    }
    return out;
}

std::vector<double> SeriesView::highs() const {
    std::vector<double> out;
    out.reserve(size_);
    for (const auto& c : *this) {
        out.push_back(c.high);
    }
    return out;
}

std::vector<double> SeriesView::lows() const {
    std::vector<double> out;
    out.reserve(size_);
    for (const auto& c : *this) {
        out.push_back(c.low);
    }
    return out;
}

CandleSeries normalize_series(CandleSeries series) {
    std::stable_sort(series.begin(), series.end(),
                     [](const Candle& a, const Candle& b) { return a.time < b.time; });

    // Keep the first candle seen for each timestamp
    auto last = std::unique(series.begin(), series.end(),
                            [](const Candle& a, const Candle& b) { return a.time == b.time; });
    series.erase(last, series.end());
    return series;
}

} // namespace ta
