#include "patterns.hpp"
#include "numeric.hpp"
#include "oscillators.hpp"
#include "window_stats.hpp"

#include <algorithm>
#include <cmath>

namespace ta {

namespace {

constexpr double DOJI_BODY_RATIO = 0.1;
constexpr double PATTERN_TOLERANCE = 0.02;

constexpr int RSI_PERIOD = 14;
constexpr std::size_t RSI_LOOKBACK = 14;
constexpr std::size_t MACD_LOOKBACK = 26;

// Indicator value computed on the candles ending at index i
double indicator_at(SeriesView series, std::size_t i, DivergenceSource source) {
    switch (source) {
    case DivergenceSource::Rsi: {
        const std::size_t first = i >= RSI_LOOKBACK ? i - RSI_LOOKBACK : 0;
        return rsi(series.slice(first, i - first + 1), RSI_PERIOD);
    }
    case DivergenceSource::MacdProxy: {
        const std::size_t first = i >= MACD_LOOKBACK ? i - MACD_LOOKBACK : 0;
        SeriesView window = series.slice(first, i - first + 1);
        return ema(window.last(12), 12) - ema(window, 26);
    }
    }
    return 0.0;
}

} // namespace

// ============================================================================
// Labels
// ============================================================================

std::string to_string(CandlePattern pattern) {
    switch (pattern) {
    case CandlePattern::Doji:
        return "Doji";
    case CandlePattern::Hammer:
        return "Hammer";
    case CandlePattern::ShootingStar:
        return "Shooting Star";
    case CandlePattern::BullishEngulfing:
        return "Bullish Engulfing";
    case CandlePattern::BearishEngulfing:
        return "Bearish Engulfing";
    }
    return "Unknown";
}

std::string to_string(ChartPattern pattern) {
    switch (pattern) {
    case ChartPattern::HeadAndShoulders:
        return "Head and Shoulders";
    case ChartPattern::DoubleTop:
        return "Double Top";
    case ChartPattern::DoubleBottom:
        return "Double Bottom";
    }
    return "Unknown";
}

std::string to_string(DivergenceSource source) {
    return source == DivergenceSource::Rsi ? "rsi" : "macd";
}

std::string to_string(DivergenceType type) {
    return type == DivergenceType::Regular ? "regular" : "hidden";
}

std::string to_string(Direction direction) {
    return direction == Direction::Bullish ? "bullish" : "bearish";
}

std::string to_string(Trend trend) {
    switch (trend) {
    case Trend::StrongBullish:
        return "Strong Bullish";
    case Trend::Bullish:
        return "Bullish";
    case Trend::StrongBearish:
        return "Strong Bearish";
    case Trend::Bearish:
        return "Bearish";
    case Trend::Neutral:
        return "Neutral";
    }
    return "Neutral";
}

std::string to_string(MarketCondition condition) {
    switch (condition) {
    case MarketCondition::StronglyOverbought:
        return "Strongly Overbought";
    case MarketCondition::Overbought:
        return "Overbought";
    case MarketCondition::StronglyOversold:
        return "Strongly Oversold";
    case MarketCondition::Oversold:
        return "Oversold";
    case MarketCondition::Neutral:
        return "Neutral";
    }
    return "Neutral";
}

std::string to_string(RiskLevel level) {
    switch (level) {
    case RiskLevel::Low:
        return "low";
    case RiskLevel::Medium:
        return "medium";
    case RiskLevel::High:
        return "high";
    }
    return "low";
}

// ============================================================================
// Candle and chart patterns
// ============================================================================

std::vector<CandlePattern> candle_patterns(SeriesView series) {
    std::vector<CandlePattern> patterns;
    if (series.size() < 2) {
        return patterns;
    }

    const Candle& prev = series[series.size() - 2];
    const Candle& last = series.back();

    const double body = std::fabs(last.close - last.open);
    const double range = last.high - last.low;
    const double upper_wick = last.high - std::max(last.open, last.close);
    const double lower_wick = std::min(last.open, last.close) - last.low;

    if (body < range * DOJI_BODY_RATIO) {
        patterns.push_back(CandlePattern::Doji);
    }
    if (last.bullish() && lower_wick > body * 2.0 && upper_wick < body * 0.5) {
        patterns.push_back(CandlePattern::Hammer);
    }
    if (last.bearish() && upper_wick > body * 2.0 && lower_wick < body * 0.5) {
        patterns.push_back(CandlePattern::ShootingStar);
    }
    if (prev.bearish() && last.bullish() && last.open < prev.close &&
        last.close > prev.open) {
        patterns.push_back(CandlePattern::BullishEngulfing);
    }
    if (prev.bullish() && last.bearish() && last.open > prev.close &&
        last.close < prev.open) {
        patterns.push_back(CandlePattern::BearishEngulfing);
    }

    return patterns;
}

std::vector<ChartPattern> chart_patterns(SeriesView series) {
    std::vector<ChartPattern> patterns;
    const std::vector<double> highs = series.highs();
    const std::vector<double> lows = series.lows();
    const std::size_t n = highs.size();

    for (std::size_t i = 0; i + 5 < n; ++i) {
        const double left = highs[i];
        const double head = highs[i + 2];
        const double right = highs[i + 4];
        if (head > left && head > right &&
            numeric::relative_diff(left, right, left) < PATTERN_TOLERANCE) {
            patterns.push_back(ChartPattern::HeadAndShoulders);
            break;
        }
    }

    for (std::size_t i = 0; i + 3 < n; ++i) {
        const double first = highs[i];
        const double second = highs[i + 2];
        if (numeric::relative_diff(first, second, first) < PATTERN_TOLERANCE &&
            highs[i + 1] < std::min(first, second)) {
            patterns.push_back(ChartPattern::DoubleTop);
            break;
        }
    }

    for (std::size_t i = 0; i + 3 < n; ++i) {
        const double first = lows[i];
        const double second = lows[i + 2];
        if (numeric::relative_diff(first, second, first) < PATTERN_TOLERANCE &&
            lows[i + 1] > std::max(first, second)) {
            patterns.push_back(ChartPattern::DoubleBottom);
            break;
        }
    }

    return patterns;
}

// ============================================================================
// Divergence
// ============================================================================

std::optional<Divergence> divergence(SeriesView series, DivergenceSource source) {
    const std::size_t n = series.size();
    if (n < 2) {
        return std::nullopt;
    }

    const double price_now = series[n - 1].close;
    const double price_prev = series[n - 2].close;
    const double ind_now = indicator_at(series, n - 1, source);
    const double ind_prev = indicator_at(series, n - 2, source);

    const bool price_up = price_now > price_prev;
    const bool price_down = price_now < price_prev;
    const bool ind_up = ind_now > ind_prev;
    const bool ind_down = ind_now < ind_prev;

    if (price_down && ind_up) {
        return Divergence{DivergenceType::Regular, Direction::Bullish};
    }
    if (price_up && ind_down) {
        return Divergence{DivergenceType::Regular, Direction::Bearish};
    }
    if (price_up && ind_up) {
        return Divergence{DivergenceType::Hidden, Direction::Bullish};
    }
    if (price_down && ind_down) {
        return Divergence{DivergenceType::Hidden, Direction::Bearish};
    }
    return std::nullopt;
}

// ============================================================================
// Classification
// ============================================================================

Trend classify_trend(double close, double sma50, double sma200) {
    const bool above50 = close > sma50;
    const bool above200 = close > sma200;
    const bool golden = sma50 > sma200;

    if (above50 && above200 && golden) {
        return Trend::StrongBullish;
    }
    if (above50 && golden) {
        return Trend::Bullish;
    }
    if (!above50 && !above200 && !golden) {
        return Trend::StrongBearish;
    }
    if (!above50 && !golden) {
        return Trend::Bearish;
    }
    return Trend::Neutral;
}

Trend classify_trend(SeriesView series) {
    if (series.empty()) {
        return Trend::Neutral;
    }
    return classify_trend(series.back().close, sma(series.last(50), 50),
                          sma(series.last(200), 200));
}

MarketCondition classify_market_condition(double rsi_value, double stoch_k,
                                          double stoch_d) {
    if (rsi_value > 70 && stoch_k > 80 && stoch_d > 80) {
        return MarketCondition::StronglyOverbought;
    }
    if (rsi_value > 60 && stoch_k > 70) {
        return MarketCondition::Overbought;
    }
    if (rsi_value < 30 && stoch_k < 20 && stoch_d < 20) {
        return MarketCondition::StronglyOversold;
    }
    if (rsi_value < 40 && stoch_k < 30) {
        return MarketCondition::Oversold;
    }
    return MarketCondition::Neutral;
}

RiskLevel risk_level(double rsi_value, double volatility_pct, double momentum_pct,
                     double atr_value) {
    const double score = ((rsi_value > 70 || rsi_value < 30 ? 2.0 : 1.0) +
                          (volatility_pct > 5 ? 2.0 : 1.0) +
                          (std::fabs(momentum_pct) > 10 ? 2.0 : 1.0) +
                          (atr_value > 100 ? 2.0 : 1.0)) /
                         4.0;

    if (score > 1.5) {
        return RiskLevel::High;
    }
    if (score > 1.0) {
        return RiskLevel::Medium;
    }
    return RiskLevel::Low;
}

} // namespace ta
