#include "oscillators.hpp"
#include "test_series.hpp"
#include "window_stats.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace ta;
using ta::test_util::from_closes;
using ta::test_util::ramp;
using ta::test_util::wave;

// ============================================================================
// RSI
// ============================================================================

TEST(RsiTest, InsufficientDataReturnsFifty) {
    CandleSeries series = ramp(14, 100.0, 1.0);
    EXPECT_DOUBLE_EQ(rsi(series, 14), 50.0);

    CandleSeries empty;
    EXPECT_DOUBLE_EQ(rsi(empty), 50.0);
}

TEST(RsiTest, StrictlyRisingIsHundred) {
    CandleSeries series = ramp(40, 100.0, 0.5);
    EXPECT_DOUBLE_EQ(rsi(series, 14), 100.0);
}

TEST(RsiTest, StrictlyFallingIsNearZero) {
    CandleSeries series = ramp(40, 200.0, -0.5);
    EXPECT_NEAR(rsi(series, 14), 0.0, 1e-9);
}

TEST(RsiTest, WilderSmoothingAfterSeed) {
    // Seed: +1, -1 -> avg gain 0.5, avg loss 0.5
    // Next delta +2 -> gain (0.5 + 2) / 2 = 1.25, loss 0.5 / 2 = 0.25
    CandleSeries series = from_closes({1.0, 2.0, 1.0, 3.0});
    EXPECT_NEAR(rsi(series, 2), 100.0 - 100.0 / 6.0, 1e-9);
}

TEST(RsiTest, StaysWithinBounds) {
    CandleSeries series = wave(150, 100.0, 10.0);
    for (std::size_t n = 0; n <= series.size(); n += 5) {
        const double value = rsi(SeriesView(series).last(n));
        EXPECT_GE(value, 0.0);
        EXPECT_LE(value, 100.0);
    }
}

// ============================================================================
// Stochastic
// ============================================================================

TEST(StochasticTest, InsufficientDataReturnsFiftyFifty) {
    CandleSeries series = wave(15, 100.0, 5.0);
    StochasticResult result = stochastic(series);
    EXPECT_DOUBLE_EQ(result.k, 50.0);
    EXPECT_DOUBLE_EQ(result.d, 50.0);

    CandleSeries empty;
    result = stochastic(empty);
    EXPECT_DOUBLE_EQ(result.k, 50.0);
    EXPECT_DOUBLE_EQ(result.d, 50.0);
}

TEST(StochasticTest, FlatRangeDefaultsToFifty) {
    CandleSeries series = from_closes(std::vector<double>(30, 100.0), 0.0);
    StochasticResult result = stochastic(series);
    EXPECT_DOUBLE_EQ(result.k, 50.0);
    EXPECT_DOUBLE_EQ(result.d, 50.0);
}

TEST(StochasticTest, CloseAtRangeTopIsHundred) {
    CandleSeries series = ramp(30, 100.0, 1.0, 0.0);
    StochasticResult result = stochastic(series);
    EXPECT_DOUBLE_EQ(result.k, 100.0);
    EXPECT_DOUBLE_EQ(result.d, 100.0);
}

TEST(StochasticTest, StaysWithinBounds) {
    CandleSeries series = wave(200, 50.0, 7.0);
    for (std::size_t n = 0; n <= series.size(); n += 9) {
        StochasticResult result = stochastic(SeriesView(series).last(n));
        EXPECT_GE(result.k, 0.0);
        EXPECT_LE(result.k, 100.0);
        EXPECT_GE(result.d, 0.0);
        EXPECT_LE(result.d, 100.0);
    }
}

TEST(StochasticTest, RejectsNonPositiveWidths) {
    CandleSeries series = wave(30, 50.0, 2.0);
    EXPECT_THROW(stochastic(series, 0), std::invalid_argument);
    EXPECT_THROW(stochastic(series, 14, 0, 3), std::invalid_argument);
    EXPECT_THROW(stochastic(series, 14, 3, -1), std::invalid_argument);
}

// ============================================================================
// Bollinger Bands
// ============================================================================

TEST(BollingerTest, BandsAreSymmetric) {
    CandleSeries series = wave(100, 250.0, 12.0);
    for (std::size_t n : {5u, 20u, 21u, 60u, 100u}) {
        BollingerBands bands = bollinger_bands(SeriesView(series).last(n));
        EXPECT_NEAR(bands.upper - bands.middle, bands.middle - bands.lower, 1e-9);
    }
}

TEST(BollingerTest, ConstantSeriesCollapses) {
    CandleSeries series = from_closes(std::vector<double>(20, 42.0));
    BollingerBands bands = bollinger_bands(series);
    EXPECT_DOUBLE_EQ(bands.std_dev, 0.0);
    EXPECT_DOUBLE_EQ(bands.upper, 42.0);
    EXPECT_DOUBLE_EQ(bands.middle, 42.0);
    EXPECT_DOUBLE_EQ(bands.lower, 42.0);
}

TEST(BollingerTest, DeviationSpansWholeSliceButDividesByPeriod) {
    std::vector<double> closes(20, 10.0);
    closes.insert(closes.end(), 20, 20.0);
    CandleSeries series = from_closes(closes);

    // Middle = SMA20 = 20; squared deviations 20 * 100 over divisor 20
    BollingerBands bands = bollinger_bands(series, 20, 2.0);
    EXPECT_DOUBLE_EQ(bands.middle, 20.0);
    EXPECT_DOUBLE_EQ(bands.std_dev, 10.0);
    EXPECT_DOUBLE_EQ(bands.upper, 40.0);
    EXPECT_DOUBLE_EQ(bands.lower, 0.0);
}

// ============================================================================
// MACD, momentum, volatility
// ============================================================================

TEST(MacdTest, SignalIsSingleSamplePassthrough) {
    CandleSeries series = wave(80, 100.0, 4.0);
    MacdResult result = macd(series);
    EXPECT_DOUBLE_EQ(result.line, ema(series, 12) - ema(series, 26));
    EXPECT_DOUBLE_EQ(result.signal, result.line);
    EXPECT_DOUBLE_EQ(result.histogram, 0.0);
}

TEST(MacdTest, MakeMacdFromEmas) {
    MacdResult result = make_macd(105.0, 103.0);
    EXPECT_DOUBLE_EQ(result.line, 2.0);
    EXPECT_DOUBLE_EQ(result.signal, 2.0);
    EXPECT_DOUBLE_EQ(result.histogram, 0.0);
}

TEST(MomentumTest, PercentChangeFirstToLast) {
    CandleSeries series = from_closes({100.0, 120.0, 150.0});
    EXPECT_DOUBLE_EQ(momentum(series), 50.0);

    CandleSeries empty;
    EXPECT_DOUBLE_EQ(momentum(empty), 0.0);
}

TEST(VolatilityTest, StdDevOfReturnsInPercent) {
    // Returns +10% and -10%
    CandleSeries series = from_closes({100.0, 110.0, 99.0});
    EXPECT_NEAR(volatility(series), 10.0, 1e-9);
}

TEST(VolatilityTest, ConstantOrShortSeriesIsZero) {
    CandleSeries constant = from_closes(std::vector<double>(10, 5.0));
    EXPECT_DOUBLE_EQ(volatility(constant), 0.0);

    CandleSeries single = from_closes({5.0});
    EXPECT_DOUBLE_EQ(volatility(single), 0.0);
}

// ============================================================================
// Ichimoku
// ============================================================================

TEST(IchimokuTest, LinesOverRisingSeries) {
    // close = 100 + i, high = close + 1, low = previous close - 1
    CandleSeries series = ramp(60, 100.0, 1.0);
    IchimokuCloud cloud = ichimoku(series);

    EXPECT_DOUBLE_EQ(cloud.tenkan_sen, (160.0 + 149.0) / 2.0);
    EXPECT_DOUBLE_EQ(cloud.kijun_sen, (160.0 + 132.0) / 2.0);
    EXPECT_DOUBLE_EQ(cloud.senkou_span_a, (cloud.tenkan_sen + cloud.kijun_sen) / 2.0);
    EXPECT_DOUBLE_EQ(cloud.senkou_span_b, (160.0 + 106.0) / 2.0);
    ASSERT_TRUE(cloud.chikou_span.has_value());
    EXPECT_DOUBLE_EQ(*cloud.chikou_span, 134.0);
}

TEST(IchimokuTest, ChikouAbsentOnShortSeries) {
    CandleSeries series = ramp(25, 100.0, 1.0);
    IchimokuCloud cloud = ichimoku(series);
    EXPECT_FALSE(cloud.chikou_span.has_value());
}

TEST(IchimokuTest, EmptySeriesIsZero) {
    CandleSeries empty;
    IchimokuCloud cloud = ichimoku(empty);
    EXPECT_DOUBLE_EQ(cloud.tenkan_sen, 0.0);
    EXPECT_DOUBLE_EQ(cloud.senkou_span_b, 0.0);
    EXPECT_FALSE(cloud.chikou_span.has_value());
}
