#include "oscillators.hpp"
#include "numeric.hpp"
#include "window_stats.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace ta {

namespace {

constexpr int MACD_FAST = 12;
constexpr int MACD_SLOW = 26;
constexpr int MACD_SIGNAL = 9;

constexpr std::size_t TENKAN_PERIOD = 9;
constexpr std::size_t KIJUN_PERIOD = 26;
constexpr std::size_t SENKOU_B_PERIOD = 52;
constexpr std::size_t CHIKOU_SHIFT = 26;

// Trailing simple averages of every full `width` window
std::vector<double> rolling_mean(const std::vector<double>& values, int width) {
    std::vector<double> out;
    const auto w = static_cast<std::size_t>(width);
    if (values.size() < w) {
        return out;
    }
    out.reserve(values.size() - w + 1);
    for (std::size_t i = 0; i + w <= values.size(); ++i) {
        double total = 0.0;
        for (std::size_t j = i; j < i + w; ++j) {
            total += values[j];
        }
        out.push_back(total / static_cast<double>(w));
    }
    return out;
}

} // namespace

// ============================================================================
// RSI
// ============================================================================

double rsi(SeriesView series, int period) {
    if (period <= 0) {
        throw std::invalid_argument("RSI period must be > 0");
    }
    const auto p = static_cast<std::size_t>(period);
    if (series.size() < p + 1) {
        return 50.0;
    }

    double gains = 0.0;
    double losses = 0.0;
    for (std::size_t i = 1; i <= p; ++i) {
        const double change = series[i].close - series[i - 1].close;
        if (change >= 0) {
            gains += change;
        } else {
            losses -= change;
        }
    }

    double avg_gain = gains / period;
    double avg_loss = losses / period;

    // Wilder smoothing over the remaining deltas
    for (std::size_t i = p + 1; i < series.size(); ++i) {
        const double change = series[i].close - series[i - 1].close;
        const double gain = change >= 0 ? change : 0.0;
        const double loss = change < 0 ? -change : 0.0;
        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
    }

    if (avg_loss == 0.0) {
        return 100.0;
    }

    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

// ============================================================================
// Stochastic
// ============================================================================

StochasticResult stochastic(SeriesView series, int period, int k_smoothing,
                            int d_smoothing) {
    if (period <= 0 || k_smoothing <= 0 || d_smoothing <= 0) {
        throw std::invalid_argument("stochastic periods must be > 0");
    }

    const auto p = static_cast<std::size_t>(period);
    std::vector<double> raw_k;
    for (std::size_t i = p; i <= series.size(); ++i) {
        SeriesView window = series.slice(i - p, p);
        const double highest = numeric::highest_high(window);
        const double lowest = numeric::lowest_low(window);
        if (highest == lowest) {
            raw_k.push_back(50.0);
            continue;
        }
        raw_k.push_back((window.back().close - lowest) / (highest - lowest) * 100.0);
    }

    const std::vector<double> k_line = rolling_mean(raw_k, k_smoothing);
    const std::vector<double> d_line = rolling_mean(k_line, d_smoothing);
    if (k_line.empty() || d_line.empty()) {
        return {50.0, 50.0};
    }
    return {k_line.back(), d_line.back()};
}

// ============================================================================
// Bands and trend helpers
// ============================================================================

BollingerBands bollinger_bands(SeriesView series, int period, double multiplier) {
    const double middle = sma(series, period);
    const double deviation = std_dev(series, middle, period);
    return {middle + multiplier * deviation, middle, middle - multiplier * deviation,
            deviation};
}

MacdResult make_macd(double fast_ema, double slow_ema) {
    const double line = fast_ema - slow_ema;

    // EMA of a one-sample series is the sample itself
    const Candle sample(0, line, line, line, line, 0.0);
    const double signal = ema(SeriesView(&sample, 1), MACD_SIGNAL);
    return {line, signal, line - signal};
}

MacdResult macd(SeriesView series) {
    return make_macd(ema(series, MACD_FAST), ema(series, MACD_SLOW));
}

double volatility(SeriesView series) {
    return numeric::population_std_dev(numeric::simple_returns(series)) * 100.0;
}

double momentum(SeriesView series) {
    if (series.empty()) {
        return 0.0;
    }
    const double first = series.front().close;
    return numeric::safe_div(series.back().close - first, first) * 100.0;
}

IchimokuCloud ichimoku(SeriesView series) {
    IchimokuCloud cloud{};
    if (series.empty()) {
        return cloud;
    }

    cloud.tenkan_sen = numeric::midpoint(series.last(TENKAN_PERIOD));
    cloud.kijun_sen = numeric::midpoint(series.last(KIJUN_PERIOD));
    cloud.senkou_span_a = (cloud.tenkan_sen + cloud.kijun_sen) / 2.0;
    cloud.senkou_span_b = numeric::midpoint(series.last(SENKOU_B_PERIOD));
    if (series.size() >= CHIKOU_SHIFT) {
        cloud.chikou_span = series[series.size() - CHIKOU_SHIFT].close;
    }
    return cloud;
}

} // namespace ta
