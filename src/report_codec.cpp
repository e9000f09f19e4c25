#include "report_codec.hpp"
#include "ta/v1/report.pb.h"

#include <iomanip>
#include <stdexcept>

namespace ta {

namespace {

void fill_divergence(const Divergence& div, v1::Divergence* out) {
    out->set_type(to_string(div.type));
    out->set_direction(to_string(div.direction));
}

std::string divergence_label(const std::optional<Divergence>& div) {
    if (!div) {
        return "none";
    }
    return to_string(div->type) + "-" + to_string(div->direction);
}

template <typename Seq, typename Fn>
std::string join(const Seq& items, Fn label) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += label(item);
    }
    return out.empty() ? "none" : out;
}

} // namespace

// ============================================================================
// Protobuf
// ============================================================================

void to_proto(const AnalysisReport& report, const std::string& symbol,
              Timeframe timeframe, v1::AnalysisReport* out) {
    out->Clear();
    out->set_symbol(symbol);
    out->set_timeframe(to_string(timeframe));
    out->set_time(report.time);

    auto* price = out->mutable_price();
    price->set_current(report.price.current);
    price->set_change_pct(report.price.change_pct);
    price->set_volume(report.price.volume);
    price->set_high_24(report.price.high_24);
    price->set_low_24(report.price.low_24);

    auto* ma = out->mutable_averages();
    ma->set_sma20(report.averages.sma20);
    ma->set_sma50(report.averages.sma50);
    ma->set_sma200(report.averages.sma200);
    ma->set_ema12(report.averages.ema12);
    ma->set_ema26(report.averages.ema26);
    ma->set_ema55(report.averages.ema55);

    auto* macd = out->mutable_macd();
    macd->set_line(report.macd.line);
    macd->set_signal(report.macd.signal);
    macd->set_histogram(report.macd.histogram);

    out->set_rsi(report.rsi);
    // Absent divergences leave the submessage unset
    if (report.rsi_divergence) {
        fill_divergence(*report.rsi_divergence, out->mutable_rsi_divergence());
    }
    if (report.macd_divergence) {
        fill_divergence(*report.macd_divergence, out->mutable_macd_divergence());
    }

    out->mutable_stochastic()->set_k(report.stochastic.k);
    out->mutable_stochastic()->set_d(report.stochastic.d);

    auto* bands = out->mutable_bollinger();
    bands->set_upper(report.bollinger.upper);
    bands->set_middle(report.bollinger.middle);
    bands->set_lower(report.bollinger.lower);
    bands->set_std_dev(report.bollinger.std_dev);

    auto* cloud = out->mutable_ichimoku();
    cloud->set_tenkan_sen(report.ichimoku.tenkan_sen);
    cloud->set_kijun_sen(report.ichimoku.kijun_sen);
    cloud->set_senkou_span_a(report.ichimoku.senkou_span_a);
    cloud->set_senkou_span_b(report.ichimoku.senkou_span_b);
    if (report.ichimoku.chikou_span) {
        cloud->set_chikou_span(*report.ichimoku.chikou_span);
    }

    out->set_atr(report.atr);
    out->set_momentum(report.momentum);
    out->set_volatility(report.volatility);

    auto* levels = out->mutable_levels();
    levels->set_support(report.levels.support);
    levels->set_resistance(report.levels.resistance);
    for (double level : report.key_levels.support) {
        levels->add_key_support(level);
    }
    for (double level : report.key_levels.resistance) {
        levels->add_key_resistance(level);
    }
    const FibonacciLevels& fib = report.fibonacci;
    for (double level : {fib.level_0, fib.level_236, fib.level_382, fib.level_500,
                         fib.level_618, fib.level_786, fib.level_1000}) {
        levels->add_fibonacci(level);
    }
    levels->set_pivot(report.pivots.pp);
    for (double level : {report.pivots.r1, report.pivots.r2, report.pivots.r3}) {
        levels->add_pivot_resistance(level);
    }
    for (double level : {report.pivots.s1, report.pivots.s2, report.pivots.s3}) {
        levels->add_pivot_support(level);
    }

    for (const auto& block : report.order_blocks) {
        auto* ob = out->add_order_blocks();
        ob->set_kind(to_string(block.kind));
        ob->set_top(block.top);
        ob->set_bottom(block.bottom);
        ob->set_time(block.time);
    }

    auto* structure = out->mutable_structure();
    for (const auto& swing : report.structure.swings) {
        auto* sp = structure->add_swings();
        sp->set_kind(to_string(swing.kind));
        sp->set_price(swing.price);
        sp->set_time(swing.time);
    }
    structure->set_trend(to_string(report.structure.trend));
    structure->set_strength(report.structure.strength);

    auto* volume = out->mutable_volume();
    for (double bucket : report.volume_profile.buckets) {
        volume->add_profile(bucket);
    }
    volume->set_poc(report.volume_profile.poc);
    volume->set_value_area(report.volume_profile.value_area);
    volume->set_price_poc(report.volume_by_price.poc);
    volume->set_price_poc_volume(report.volume_by_price.max_volume);
    volume->set_cvd(report.cvd);
    for (const auto& dv : report.delta_volume) {
        auto* entry = volume->add_delta();
        entry->set_time(dv.time);
        entry->set_delta(dv.delta);
        entry->set_cumulative(dv.cumulative);
    }

    for (CandlePattern pattern : report.candle_patterns) {
        out->add_candle_patterns(to_string(pattern));
    }
    for (ChartPattern pattern : report.chart_patterns) {
        out->add_chart_patterns(to_string(pattern));
    }

    out->set_trend(to_string(report.trend));
    out->set_condition(to_string(report.condition));
    out->set_risk(to_string(report.risk));

    auto* sentiment = out->mutable_sentiment();
    sentiment->set_overall(to_string(report.sentiment.overall));
    sentiment->set_price(to_string(report.sentiment.price));
    sentiment->set_volume(to_string(report.sentiment.volume));

    for (const auto& signal : report.signals) {
        out->add_signals(signal);
    }
}

std::string serialize_report(const AnalysisReport& report,
                             const std::string& symbol, Timeframe timeframe) {
    v1::AnalysisReport message;
    to_proto(report, symbol, timeframe, &message);

    std::string payload;
    if (!message.SerializeToString(&payload)) {
        throw std::runtime_error("failed to serialize report protobuf");
    }
    return payload;
}

// ============================================================================
// Text
// ============================================================================

void write_report_text(std::ostream& os, const AnalysisReport& report,
                       const std::string& symbol, Timeframe timeframe) {
    const auto flags = os.flags();
    const auto precision = os.precision();
    os << std::fixed << std::setprecision(4);

    os << "[REPORT] symbol=" << symbol << " timeframe=" << to_string(timeframe)
       << " time=" << report.time << "\n";
    os << "price current=" << report.price.current
       << " change_pct=" << report.price.change_pct
       << " volume=" << report.price.volume << " high_24=" << report.price.high_24
       << " low_24=" << report.price.low_24 << "\n";
    os << "trend=" << to_string(report.trend)
       << " condition=" << to_string(report.condition)
       << " risk=" << to_string(report.risk)
       << " sentiment=" << to_string(report.sentiment.overall) << "\n";
    os << "sma sma20=" << report.averages.sma20 << " sma50=" << report.averages.sma50
       << " sma200=" << report.averages.sma200 << "\n";
    os << "ema ema12=" << report.averages.ema12 << " ema26=" << report.averages.ema26
       << " ema55=" << report.averages.ema55 << "\n";
    os << "macd line=" << report.macd.line << " signal=" << report.macd.signal
       << " histogram=" << report.macd.histogram << "\n";
    os << "rsi value=" << report.rsi
       << " divergence=" << divergence_label(report.rsi_divergence)
       << " macd_divergence=" << divergence_label(report.macd_divergence) << "\n";
    os << "stochastic k=" << report.stochastic.k << " d=" << report.stochastic.d
       << "\n";
    os << "bollinger upper=" << report.bollinger.upper
       << " middle=" << report.bollinger.middle
       << " lower=" << report.bollinger.lower
       << " std_dev=" << report.bollinger.std_dev << "\n";
    os << "ichimoku tenkan=" << report.ichimoku.tenkan_sen
       << " kijun=" << report.ichimoku.kijun_sen
       << " span_a=" << report.ichimoku.senkou_span_a
       << " span_b=" << report.ichimoku.senkou_span_b << " chikou=";
    if (report.ichimoku.chikou_span) {
        os << *report.ichimoku.chikou_span;
    } else {
        os << "none";
    }
    os << "\n";
    os << "atr=" << report.atr << " momentum=" << report.momentum
       << " volatility=" << report.volatility << "\n";
    os << "levels support=" << report.levels.support
       << " resistance=" << report.levels.resistance
       << " pivot=" << report.pivots.pp << " order_blocks=" << report.order_blocks.size()
       << " structure=" << to_string(report.structure.trend) << "\n";
    os << "volume poc=" << report.volume_profile.poc
       << " value_area=" << report.volume_profile.value_area
       << " price_poc=" << report.volume_by_price.poc << " cvd=" << report.cvd << "\n";
    os << "patterns candles="
       << join(report.candle_patterns, [](CandlePattern p) { return to_string(p); })
       << " chart="
       << join(report.chart_patterns, [](ChartPattern p) { return to_string(p); })
       << "\n";
    for (const auto& signal : report.signals) {
        os << "signal " << signal << "\n";
    }

    os.flags(flags);
    os.precision(precision);
}

} // namespace ta
