#include "structure.hpp"
#include "numeric.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

namespace ta {

namespace {

constexpr std::size_t KEY_LEVEL_MIN_CANDLES = 20;
constexpr std::size_t KEY_LEVEL_WINDOW = 100;
constexpr std::size_t KEY_LEVEL_COUNT = 3;

} // namespace

std::string to_string(OrderBlockKind kind) {
    return kind == OrderBlockKind::Bullish ? "bullish" : "bearish";
}

std::string to_string(SwingKind kind) {
    return kind == SwingKind::High ? "high" : "low";
}

std::string to_string(StructureTrend trend) {
    switch (trend) {
    case StructureTrend::Uptrend:
        return "uptrend";
    case StructureTrend::Downtrend:
        return "downtrend";
    case StructureTrend::Neutral:
        return "neutral";
    }
    return "neutral";
}

// ============================================================================
// Range levels
// ============================================================================

SupportResistance support_resistance(SeriesView series) {
    return {numeric::lowest_low(series), numeric::highest_high(series)};
}

std::vector<OrderBlock> order_blocks(SeriesView series) {
    std::vector<OrderBlock> blocks;

    for (std::size_t i = 0; i + 1 < series.size(); ++i) {
        const Candle& current = series[i];
        const Candle& next = series[i + 1];

        if (current.bearish() && next.bullish() && next.close > current.high) {
            blocks.push_back({OrderBlockKind::Bullish, current.high, current.low,
                              current.time});
        }
        if (current.bullish() && next.bearish() && next.close < current.low) {
            blocks.push_back({OrderBlockKind::Bearish, current.high, current.low,
                              current.time});
        }
    }

    return blocks;
}

// ============================================================================
// Swings
// ============================================================================

MarketStructure market_structure(SeriesView series) {
    MarketStructure result{{}, StructureTrend::Neutral, 0.0};

    for (std::size_t i = 1; i + 1 < series.size(); ++i) {
        const Candle& prev = series[i - 1];
        const Candle& candle = series[i];
        const Candle& next = series[i + 1];

        if (candle.high > prev.high && candle.high > next.high) {
            result.swings.push_back({SwingKind::High, candle.high, candle.time});
        } else if (candle.low < prev.low && candle.low < next.low) {
            result.swings.push_back({SwingKind::Low, candle.low, candle.time});
        }
    }

    if (result.swings.size() >= 2) {
        const double latest = result.swings[result.swings.size() - 1].price;
        const double previous = result.swings[result.swings.size() - 2].price;
        result.trend = latest > previous ? StructureTrend::Uptrend
                                         : StructureTrend::Downtrend;
    }

    if (!series.empty()) {
        const double first = series.front().close;
        result.strength =
            numeric::safe_div(std::fabs(series.back().close - first), first) * 100.0;
    }
    return result;
}

// ============================================================================
// Clusters
// ============================================================================

std::vector<double> price_clusters(const std::vector<double>& prices,
                                   double tolerance, std::size_t min_members) {
    struct Cluster {
        double anchor;
        std::size_t members;
    };
    std::vector<Cluster> clusters;

    for (double price : prices) {
        auto it = std::find_if(clusters.begin(), clusters.end(),
                               [&](const Cluster& c) {
                                   return numeric::relative_diff(price, c.anchor,
                                                                 c.anchor) < tolerance;
                               });
        if (it != clusters.end()) {
            it->members++;
        } else {
            clusters.push_back({price, 1});
        }
    }

    std::vector<double> significant;
    for (const auto& c : clusters) {
        if (c.members >= min_members) {
            significant.push_back(c.anchor);
        }
    }
    return significant;
}

KeyLevels key_levels(SeriesView series) {
    KeyLevels levels;
    if (series.size() < KEY_LEVEL_MIN_CANDLES) {
        return levels;
    }

    SeriesView sample = series.last(KEY_LEVEL_WINDOW);
    const double current = series.back().close;

    for (double level : price_clusters(sample.lows())) {
        if (level < current) {
            levels.support.push_back(level);
        }
    }
    for (double level : price_clusters(sample.highs())) {
        if (level > current) {
            levels.resistance.push_back(level);
        }
    }

    std::sort(levels.support.begin(), levels.support.end(), std::greater<double>());
    std::sort(levels.resistance.begin(), levels.resistance.end());
    if (levels.support.size() > KEY_LEVEL_COUNT) {
        levels.support.resize(KEY_LEVEL_COUNT);
    }
    if (levels.resistance.size() > KEY_LEVEL_COUNT) {
        levels.resistance.resize(KEY_LEVEL_COUNT);
    }
    return levels;
}

// ============================================================================
// Derived price levels
// ============================================================================

FibonacciLevels fibonacci_levels(double high, double low) {
    const double diff = high - low;
    return {low,
            low + diff * 0.236,
            low + diff * 0.382,
            low + diff * 0.5,
            low + diff * 0.618,
            low + diff * 0.786,
            high};
}

PivotPoints pivot_points(double high, double low, double close) {
    const double pp = (high + low + close) / 3.0;
    PivotPoints points{};
    points.pp = pp;
    points.r1 = 2.0 * pp - low;
    points.r2 = pp + (high - low);
    points.r3 = high + 2.0 * (pp - low);
    points.s1 = 2.0 * pp - high;
    points.s2 = pp - (high - low);
    points.s3 = low - 2.0 * (high - pp);
    return points;
}

} // namespace ta
