#include "window_stats.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ta {

namespace {

void require_positive(int value, const char *what) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(what) + " must be > 0");
    }
}

} // namespace

double sma(SeriesView series, int period) {
    require_positive(period, "SMA period");

    if (series.size() < static_cast<std::size_t>(period)) {
        return series.empty() ? 0.0 : series.back().close;
    }

    double total = 0.0;
    for (const auto& c : series.last(static_cast<std::size_t>(period))) {
        total += c.close;
    }
    return total / static_cast<double>(period);
}

double ema(SeriesView series, int period) {
    require_positive(period, "EMA period");
    if (series.empty()) {
        return 0.0;
    }

    const double multiplier = 2.0 / (static_cast<double>(period) + 1.0);
    double value = series.front().close;
    for (std::size_t i = 1; i < series.size(); ++i) {
        value = (series[i].close - value) * multiplier + value;
    }
    return value;
}

double ema(SeriesView series) {
    if (series.empty()) {
        return 0.0;
    }
    return ema(series, static_cast<int>(series.size()));
}

double std_dev(SeriesView series, double mean, int divisor) {
    require_positive(divisor, "standard deviation divisor");

    double acc = 0.0;
    for (const auto& c : series) {
        const double d = c.close - mean;
        acc += d * d;
    }
    return std::sqrt(acc / static_cast<double>(divisor));
}

double true_range(const Candle& candle, double prev_close) {
    const double tr1 = candle.high - candle.low;
    const double tr2 = std::fabs(candle.high - prev_close);
    const double tr3 = std::fabs(candle.low - prev_close);
    return std::max(tr1, std::max(tr2, tr3));
}

double atr(SeriesView series, int period) {
    require_positive(period, "ATR period");
    if (series.size() < 2) {
        return 0.0;
    }

    double total = 0.0;
    for (std::size_t i = 1; i < series.size(); ++i) {
        total += true_range(series[i], series[i - 1].close);
    }
    return total / static_cast<double>(period);
}

} // namespace ta
