#pragma once

#include "candle_types.hpp"
#include "summary.hpp"

#include <cstdint>
#include <list>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace ta {

/// FNV-1a over every candle field plus the summary windows.
/// Two series with the same candles and config share a fingerprint.
uint64_t fingerprint(SeriesView series, const SummaryConfig &config);

/// Caller-owned memo for summarize(). The engine itself keeps no state;
/// wrap it with this cache where repeated requests for the same series occur.
class SummaryCache {
public:
  /// @param capacity Number of results kept, least recently used evicted first
  explicit SummaryCache(std::size_t capacity = 64);

  /// Return the cached result for (series, config) or compute and store it.
  /// The computation runs outside the lock (thread-safe).
  SummaryResult get_or_compute(SeriesView series,
                               const SummaryConfig &config = SummaryConfig{});

  /// Drop every cached result
  void clear();

  std::size_t size() const;
  uint64_t hits() const;
  uint64_t misses() const;

private:
  using Entry = std::pair<uint64_t, SummaryResult>;

  void insert_locked(uint64_t key, SummaryResult result);

  std::size_t capacity_;
  std::list<Entry> entries_; // Most recently used first
  std::unordered_map<uint64_t, std::list<Entry>::iterator> index_;
  uint64_t hits_;
  uint64_t misses_;
  mutable std::mutex mutex_;
};

} // namespace ta
