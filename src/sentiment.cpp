#include "sentiment.hpp"
#include "numeric.hpp"

#include <algorithm>
#include <vector>

namespace ta {

namespace {

constexpr std::size_t MIN_CANDLES = 10;
constexpr std::size_t SENTIMENT_WINDOW = 20;
constexpr std::size_t RECENT_VOLUME_WINDOW = 5;
constexpr std::size_t FORECAST_WINDOW = 30;

constexpr double PRICE_THRESHOLD = 0.02;
constexpr double VOLUME_THRESHOLD = 0.1;
constexpr double JITTER = 0.1;

Sentiment from_change(double change, double threshold) {
    if (change > threshold) {
        return Sentiment::Bullish;
    }
    if (change < -threshold) {
        return Sentiment::Bearish;
    }
    return Sentiment::Neutral;
}

} // namespace

std::string to_string(Sentiment sentiment) {
    switch (sentiment) {
    case Sentiment::Bullish:
        return "bullish";
    case Sentiment::Bearish:
        return "bearish";
    case Sentiment::Neutral:
        return "neutral";
    }
    return "neutral";
}

SentimentReading analyze_sentiment(SeriesView series) {
    SentimentReading reading{Sentiment::Neutral, Sentiment::Neutral, Sentiment::Neutral};
    if (series.size() < MIN_CANDLES) {
        return reading;
    }

    SeriesView window = series.last(SENTIMENT_WINDOW);
    const double start = window.front().close;
    const double price_change = numeric::safe_div(window.back().close - start, start);

    std::vector<double> volumes;
    for (const auto& c : window) {
        volumes.push_back(c.volume);
    }
    const double avg_volume = numeric::mean(volumes);
    const std::vector<double> recent(volumes.end() - RECENT_VOLUME_WINDOW, volumes.end());
    const double volume_change =
        numeric::safe_div(numeric::mean(recent) - avg_volume, avg_volume);

    reading.price = from_change(price_change, PRICE_THRESHOLD);
    reading.volume = from_change(volume_change, VOLUME_THRESHOLD);

    if (reading.price == Sentiment::Bullish && reading.volume != Sentiment::Bearish) {
        reading.overall = Sentiment::Bullish;
    } else if (reading.price == Sentiment::Bearish &&
               reading.volume != Sentiment::Bullish) {
        reading.overall = Sentiment::Bearish;
    } else if (reading.price == Sentiment::Neutral) {
        reading.overall = reading.volume;
    }
    return reading;
}

Forecast forecast_next_move(SeriesView series, std::mt19937_64& rng) {
    const double last = series.empty() ? 0.0 : series.back().close;
    if (series.size() < MIN_CANDLES) {
        return {0.0, 0.0, last};
    }

    const std::vector<double> returns =
        numeric::simple_returns(series.last(FORECAST_WINDOW));
    const double avg_return = numeric::mean(returns);
    const double deviation = numeric::population_std_dev(returns);

    std::uniform_real_distribution<double> jitter(-JITTER, JITTER);
    const double expected = avg_return * (1.0 + jitter(rng));
    const double confidence = std::clamp(1.0 - deviation * 10.0, 0.0, 1.0);
    return {expected, confidence, last * (1.0 + expected)};
}

} // namespace ta
