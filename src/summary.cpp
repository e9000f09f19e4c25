#include "summary.hpp"
#include "numeric.hpp"
#include "window_stats.hpp"

#include <utility>

namespace ta {

namespace {

constexpr const char *INSUFFICIENT_DATA = "Not enough data for reliable analysis";

PriceSnapshot price_snapshot(SeriesView series, std::size_t range_window) {
    const Candle& last = series.back();
    const Candle& prev = series[series.size() - 2];
    SeriesView range = series.last(range_window);

    PriceSnapshot snapshot{};
    snapshot.current = last.close;
    snapshot.change_pct = numeric::safe_div(last.close - prev.close, prev.close) * 100.0;
    snapshot.volume = last.volume;
    snapshot.high_24 = numeric::highest_high(range);
    snapshot.low_24 = numeric::lowest_low(range);
    return snapshot;
}

MovingAverages moving_averages(SeriesView series) {
    MovingAverages ma{};
    ma.sma20 = sma(series.last(20), 20);
    ma.sma50 = sma(series.last(50), 50);
    ma.sma200 = sma(series.last(200), 200);
    ma.ema12 = ema(series.last(12), 12);
    ma.ema26 = ema(series.last(26), 26);
    ma.ema55 = ema(series.last(55), 55);
    return ma;
}

} // namespace

std::vector<std::string> generate_signals(double last_close, double rsi_value,
                                          Trend trend,
                                          const StochasticResult& stoch,
                                          const BollingerBands& bands) {
    std::vector<std::string> signals;

    if (rsi_value < 30 && trend != Trend::StrongBearish) {
        signals.emplace_back("RSI Oversold - Potential Buy");
    }
    if (rsi_value > 70 && trend != Trend::StrongBullish) {
        signals.emplace_back("RSI Overbought - Potential Sell");
    }
    if (stoch.k < stoch.d && stoch.k < 20 && stoch.d < 20) {
        signals.emplace_back("Stochastic Oversold - Watch for Bull Cross");
    }
    if (stoch.k > stoch.d && stoch.k > 80 && stoch.d > 80) {
        signals.emplace_back("Stochastic Overbought - Watch for Bear Cross");
    }
    if (last_close < bands.lower) {
        signals.emplace_back("Price below Lower Bollinger Band - Potential Buy");
    }
    if (last_close > bands.upper) {
        signals.emplace_back("Price above Upper Bollinger Band - Potential Sell");
    }

    return signals;
}

SummaryResult summarize(SeriesView series, const SummaryConfig& config) {
    // Two candles are the floor for the price change even if configured lower
    if (series.size() < config.min_candles || series.size() < 2) {
        return {SummaryStatus::InsufficientData, INSUFFICIENT_DATA, std::nullopt};
    }

    SeriesView recent = series.last(config.recent_window);
    SeriesView short_term = series.last(config.short_window);
    SeriesView profile_window = series.last(config.profile_window);
    SeriesView divergence_window = series.last(config.divergence_window);
    const Candle& last = series.back();

    AnalysisReport report{};
    report.time = last.time;
    report.price = price_snapshot(series, config.range_window);
    report.averages = moving_averages(series);
    report.macd = make_macd(report.averages.ema12, report.averages.ema26);

    report.rsi = rsi(series.last(config.rsi_window), config.rsi_period);
    report.rsi_divergence = divergence(divergence_window, DivergenceSource::Rsi);
    report.macd_divergence = divergence(divergence_window, DivergenceSource::MacdProxy);
    report.stochastic = stochastic(recent);
    report.bollinger = bollinger_bands(series.last(config.bollinger_window));
    report.ichimoku = ichimoku(series.last(config.ichimoku_window));
    report.atr = atr(short_term);
    report.momentum = momentum(short_term);
    report.volatility = volatility(short_term);

    report.levels = support_resistance(recent);
    report.order_blocks = order_blocks(recent);
    report.structure = market_structure(recent);
    report.key_levels = key_levels(series);
    report.fibonacci = fibonacci_levels(report.levels.resistance, report.levels.support);
    report.pivots = pivot_points(last.high, last.low, last.close);

    report.volume_profile = volume_profile(profile_window, config.profile_levels);
    report.volume_by_price = volume_by_price(recent);
    report.cvd = cumulative_volume_delta(recent);
    report.delta_volume = delta_volume_series(profile_window);

    report.candle_patterns = candle_patterns(series.last(config.candle_pattern_window));
    report.chart_patterns = chart_patterns(recent);

    report.trend = classify_trend(last.close, report.averages.sma50, report.averages.sma200);
    report.condition = classify_market_condition(report.rsi, report.stochastic.k,
                                                 report.stochastic.d);
    report.risk = risk_level(report.rsi, report.volatility, report.momentum, report.atr);
    report.sentiment = analyze_sentiment(series);

    report.signals = generate_signals(last.close, report.rsi, report.trend,
                                      report.stochastic, report.bollinger);

    return {SummaryStatus::Ok, std::string(), std::move(report)};
}

} // namespace ta
