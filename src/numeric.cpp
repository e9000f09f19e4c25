#include "numeric.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ta {
namespace numeric {

double sum(const std::vector<double>& values) {
    double total = 0.0;
    for (double v : values) {
        total += v;
    }
    return total;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return sum(values) / static_cast<double>(values.size());
}

double population_std_dev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    const double m = mean(values);
    double acc = 0.0;
    for (double v : values) {
        acc += (v - m) * (v - m);
    }
    return std::sqrt(acc / static_cast<double>(values.size()));
}

double highest_high(SeriesView series) {
    if (series.empty()) {
        return 0.0;
    }
    double highest = series.front().high;
    for (const auto& c : series) {
        highest = std::max(highest, c.high);
    }
    return highest;
}

double lowest_low(SeriesView series) {
    if (series.empty()) {
        return 0.0;
    }
    double lowest = series.front().low;
    for (const auto& c : series) {
        lowest = std::min(lowest, c.low);
    }
    return lowest;
}

double midpoint(SeriesView series) {
    return (highest_high(series) + lowest_low(series)) / 2.0;
}

std::vector<double> simple_returns(SeriesView series) {
    std::vector<double> returns;
    if (series.size() < 2) {
        return returns;
    }
    returns.reserve(series.size() - 1);
    for (std::size_t i = 1; i < series.size(); ++i) {
        const double prev = series[i - 1].close;
        returns.push_back(safe_div(series[i].close - prev, prev));
    }
    return returns;
}

double relative_diff(double a, double b, double reference) {
    return safe_div(std::fabs(a - b), std::fabs(reference),
                    std::numeric_limits<double>::infinity());
}

} // namespace numeric
} // namespace ta
