#include "sentiment.hpp"
#include "test_series.hpp"

#include <gtest/gtest.h>

#include <random>

using namespace ta;
using ta::test_util::from_closes;
using ta::test_util::ramp;
using ta::test_util::wave;

// ============================================================================
// Sentiment
// ============================================================================

TEST(SentimentTest, ShortSeriesIsNeutral) {
    SentimentReading reading = analyze_sentiment(ramp(9, 100.0, 5.0));
    EXPECT_EQ(reading.overall, Sentiment::Neutral);
    EXPECT_EQ(reading.price, Sentiment::Neutral);
    EXPECT_EQ(reading.volume, Sentiment::Neutral);
}

TEST(SentimentTest, RisingPriceSteadyVolumeIsBullish) {
    SentimentReading reading = analyze_sentiment(ramp(30, 100.0, 1.0));
    EXPECT_EQ(reading.price, Sentiment::Bullish);
    EXPECT_EQ(reading.volume, Sentiment::Neutral);
    EXPECT_EQ(reading.overall, Sentiment::Bullish);
}

TEST(SentimentTest, FallingPriceIsBearish) {
    SentimentReading reading = analyze_sentiment(ramp(30, 200.0, -1.0));
    EXPECT_EQ(reading.price, Sentiment::Bearish);
    EXPECT_EQ(reading.overall, Sentiment::Bearish);
}

TEST(SentimentTest, VolumeDecidesWhenPriceIsFlat) {
    CandleSeries series = from_closes(std::vector<double>(30, 100.0));
    for (std::size_t i = series.size() - 5; i < series.size(); ++i) {
        series[i].volume = 300.0;
    }

    SentimentReading reading = analyze_sentiment(series);
    EXPECT_EQ(reading.price, Sentiment::Neutral);
    EXPECT_EQ(reading.volume, Sentiment::Bullish);
    EXPECT_EQ(reading.overall, Sentiment::Bullish);
}

TEST(SentimentTest, DryingVolumeCancelsRally) {
    CandleSeries series = ramp(30, 100.0, 1.0);
    for (std::size_t i = series.size() - 5; i < series.size(); ++i) {
        series[i].volume = 10.0;
    }

    SentimentReading reading = analyze_sentiment(series);
    EXPECT_EQ(reading.price, Sentiment::Bullish);
    EXPECT_EQ(reading.volume, Sentiment::Bearish);
    EXPECT_EQ(reading.overall, Sentiment::Neutral);
}

// ============================================================================
// Forecast
// ============================================================================

TEST(ForecastTest, SameSeedSameForecast) {
    CandleSeries series = wave(60, 100.0, 3.0);

    std::mt19937_64 first(42);
    std::mt19937_64 second(42);
    Forecast a = forecast_next_move(series, first);
    Forecast b = forecast_next_move(series, second);

    EXPECT_DOUBLE_EQ(a.expected_move, b.expected_move);
    EXPECT_DOUBLE_EQ(a.confidence, b.confidence);
    EXPECT_DOUBLE_EQ(a.predicted_price, b.predicted_price);
}

TEST(ForecastTest, BoundedByJitterAndConfidenceRange) {
    CandleSeries series = ramp(40, 100.0, 1.0);
    std::mt19937_64 rng(7);
    Forecast f = forecast_next_move(series, rng);

    // Every return in the window is positive
    EXPECT_GT(f.expected_move, 0.0);
    EXPECT_GE(f.confidence, 0.0);
    EXPECT_LE(f.confidence, 1.0);
    EXPECT_NEAR(f.predicted_price, series.back().close * (1.0 + f.expected_move), 1e-9);
}

TEST(ForecastTest, FlatSeriesHasNoMoveAndFullConfidence) {
    CandleSeries series = from_closes(std::vector<double>(20, 50.0));
    std::mt19937_64 rng(1);
    Forecast f = forecast_next_move(series, rng);
    EXPECT_DOUBLE_EQ(f.expected_move, 0.0);
    EXPECT_DOUBLE_EQ(f.confidence, 1.0);
    EXPECT_DOUBLE_EQ(f.predicted_price, 50.0);
}

TEST(ForecastTest, ShortSeriesReturnsLastClose) {
    CandleSeries series = ramp(5, 10.0, 1.0);
    std::mt19937_64 rng(1);
    Forecast f = forecast_next_move(series, rng);
    EXPECT_DOUBLE_EQ(f.expected_move, 0.0);
    EXPECT_DOUBLE_EQ(f.confidence, 0.0);
    EXPECT_DOUBLE_EQ(f.predicted_price, 14.0);
}
