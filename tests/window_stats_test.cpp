#include "test_series.hpp"
#include "window_stats.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace ta;
using ta::test_util::from_closes;

// ============================================================================
// SMA
// ============================================================================

TEST(WindowStatsTest, SmaOfThreeCloses) {
    CandleSeries series = from_closes({10.0, 20.0, 30.0});
    EXPECT_DOUBLE_EQ(sma(series, 3), 20.0);
}

TEST(WindowStatsTest, SmaUsesOnlyTheLastPeriod) {
    CandleSeries series = from_closes({1.0, 2.0, 3.0, 4.0, 5.0});
    EXPECT_DOUBLE_EQ(sma(series, 2), 4.5);
}

TEST(WindowStatsTest, SmaShortSeriesFallsBackToLastClose) {
    CandleSeries series = from_closes({10.0, 20.0, 30.0});
    EXPECT_DOUBLE_EQ(sma(series, 50), 30.0);
}

TEST(WindowStatsTest, SmaEmptySeriesIsZero) {
    CandleSeries empty;
    EXPECT_DOUBLE_EQ(sma(empty, 5), 0.0);
}

TEST(WindowStatsTest, SmaRejectsNonPositivePeriod) {
    CandleSeries series = from_closes({10.0});
    EXPECT_THROW(sma(series, 0), std::invalid_argument);
    EXPECT_THROW(sma(series, -3), std::invalid_argument);
}

// ============================================================================
// EMA
// ============================================================================

TEST(WindowStatsTest, EmaSingleCandleIsItsClose) {
    CandleSeries series = from_closes({42.5});
    EXPECT_DOUBLE_EQ(ema(series, 12), 42.5);
    EXPECT_DOUBLE_EQ(ema(series, 200), 42.5);
    EXPECT_DOUBLE_EQ(ema(series), 42.5);
}

TEST(WindowStatsTest, EmaSeededWithFirstClose) {
    // multiplier 2 / (3 + 1) = 0.5
    CandleSeries series = from_closes({10.0, 20.0});
    EXPECT_DOUBLE_EQ(ema(series, 3), 15.0);
}

TEST(WindowStatsTest, EmaDefaultPeriodIsSliceLength) {
    CandleSeries series = from_closes({10.0, 20.0, 30.0});
    EXPECT_DOUBLE_EQ(ema(series), ema(series, 3));
    EXPECT_DOUBLE_EQ(ema(series), 22.5);
}

TEST(WindowStatsTest, EmaEmptySeriesIsZero) {
    CandleSeries empty;
    EXPECT_DOUBLE_EQ(ema(empty, 9), 0.0);
    EXPECT_DOUBLE_EQ(ema(empty), 0.0);
}

// ============================================================================
// Standard deviation and true range
// ============================================================================

TEST(WindowStatsTest, PopulationStdDev) {
    CandleSeries series = from_closes({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
    EXPECT_DOUBLE_EQ(std_dev(series, 5.0, 8), 2.0);
}

TEST(WindowStatsTest, StdDevDividesByGivenDivisor) {
    CandleSeries series = from_closes({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
    // Sum of squared deviations is 32
    EXPECT_DOUBLE_EQ(std_dev(series, 5.0, 2), 4.0);
}

TEST(WindowStatsTest, TrueRangePicksLargestComponent) {
    Candle candle(0, 10.0, 12.0, 9.0, 11.0, 1.0);
    EXPECT_DOUBLE_EQ(true_range(candle, 8.0), 4.0);  // |high - prev close|
    EXPECT_DOUBLE_EQ(true_range(candle, 15.0), 6.0); // |low - prev close|
    EXPECT_DOUBLE_EQ(true_range(candle, 10.5), 3.0); // high - low
}

// ============================================================================
// ATR
// ============================================================================

TEST(WindowStatsTest, AtrDividesByPeriodNotSampleCount) {
    // Each of the two true ranges is 3
    CandleSeries series = from_closes({10.0, 11.0, 12.0});
    EXPECT_DOUBLE_EQ(atr(series, 2), 3.0);
    EXPECT_DOUBLE_EQ(atr(series, 14), 6.0 / 14.0);
    EXPECT_DOUBLE_EQ(atr(series), 6.0 / 14.0);
}

TEST(WindowStatsTest, AtrNeedsTwoCandles) {
    CandleSeries single = from_closes({10.0});
    CandleSeries empty;
    EXPECT_DOUBLE_EQ(atr(single), 0.0);
    EXPECT_DOUBLE_EQ(atr(empty), 0.0);
}

TEST(WindowStatsTest, AtrIsNeverNegative) {
    CandleSeries series = ta::test_util::wave(120, 100.0, 8.0);
    for (std::size_t n = 0; n <= series.size(); n += 7) {
        EXPECT_GE(atr(SeriesView(series).last(n)), 0.0);
    }
}
