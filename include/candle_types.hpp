#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ta {

/// Candle bucket granularity (in seconds)
enum class Timeframe : uint32_t {
  SEC_1 = 1,
  MIN_1 = 60,
  MIN_5 = 300,
  MIN_15 = 900,
  HOUR_1 = 3600,
  HOUR_4 = 14400,
  DAY_1 = 86400
};

/// Short label used on the command line and in publish subjects ("1m", "4h")
std::string to_string(Timeframe timeframe);

/// Parse a label produced by to_string()
/// @throws std::invalid_argument for an unknown label
Timeframe timeframe_from_string(const std::string &label);

/// One OHLCV bar
struct Candle {
  uint64_t time;  // Bucket open time, unit chosen by the caller
  double open;
  double high;
  double low;
  double close;
  double volume;

  Candle() : time(0), open(0), high(0), low(0), close(0), volume(0) {}
  Candle(uint64_t t, double o, double h, double l, double c, double v)
      : time(t), open(o), high(h), low(l), close(c), volume(v) {}

  bool bullish() const { return close > open; }
  bool bearish() const { return close < open; }
};

using CandleSeries = std::vector<Candle>;

/// Read-only view over a contiguous run of candles.
/// Never owns the candles; the caller keeps the series alive for the call.
class SeriesView {
public:
  SeriesView() : data_(nullptr), size_(0) {}
  SeriesView(const Candle *data, std::size_t size) : data_(data), size_(size) {}
  SeriesView(const CandleSeries &series) // NOLINT: implicit by intent
      : data_(series.data()), size_(series.size()) {}

  const Candle *begin() const { return data_; }
  const Candle *end() const { return data_ + size_; }
  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  const Candle &operator[](std::size_t i) const { return data_[i]; }
  const Candle &front() const { return data_[0]; }
  const Candle &back() const { return data_[size_ - 1]; }

  /// Suffix of at most n candles
  SeriesView last(std::size_t n) const {
    if (n >= size_) {
      return *this;
    }
    return SeriesView(data_ + (size_ - n), n);
  }

  /// Candles [first, first + count), clipped to the view
  SeriesView slice(std::size_t first, std::size_t count) const {
    if (first >= size_) {
      return SeriesView();
    }
    if (count > size_ - first) {
      count = size_ - first;
    }
    return SeriesView(data_ + first, count);
  }

  std::vector<double> closes() const;
  std::vector<double> highs() const;
  std::vector<double> lows() const;

private:
  const Candle *data_;
  std::size_t size_;
};

/// Stable-sort by time and drop later candles that repeat a timestamp
CandleSeries normalize_series(CandleSeries series);

} // namespace ta
