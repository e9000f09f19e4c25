#include "summary_cache.hpp"

#include <stdexcept>
#include <utility>

namespace ta {

namespace {

constexpr uint64_t FNV_OFFSET = 14695981039346656037ull;
constexpr uint64_t FNV_PRIME = 1099511628211ull;

void hash_bytes(uint64_t& hash, const void* data, std::size_t len) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        hash ^= static_cast<uint64_t>(bytes[i]);
        hash *= FNV_PRIME;
    }
}

template <typename T>
void hash_value(uint64_t& hash, const T& value) {
    hash_bytes(hash, &value, sizeof(value));
}

} // namespace

// ============================================================================
// Fingerprint
// ============================================================================

uint64_t fingerprint(SeriesView series, const SummaryConfig& config) {
    uint64_t hash = FNV_OFFSET;

    hash_value(hash, series.size());
    for (const auto& c : series) {
        hash_value(hash, c.time);
        hash_value(hash, c.open);
        hash_value(hash, c.high);
        hash_value(hash, c.low);
        hash_value(hash, c.close);
        hash_value(hash, c.volume);
    }

    hash_value(hash, config.min_candles);
    hash_value(hash, config.recent_window);
    hash_value(hash, config.rsi_window);
    hash_value(hash, config.divergence_window);
    hash_value(hash, config.bollinger_window);
    hash_value(hash, config.ichimoku_window);
    hash_value(hash, config.short_window);
    hash_value(hash, config.profile_window);
    hash_value(hash, config.candle_pattern_window);
    hash_value(hash, config.range_window);
    hash_value(hash, config.rsi_period);
    hash_value(hash, config.profile_levels);
    return hash;
}

// ============================================================================
// SummaryCache Implementation
// ============================================================================

SummaryCache::SummaryCache(std::size_t capacity)
    : capacity_(capacity), hits_(0), misses_(0) {
    if (capacity_ == 0) {
        throw std::invalid_argument("cache capacity must be > 0");
    }
}

SummaryResult SummaryCache::get_or_compute(SeriesView series,
                                           const SummaryConfig& config) {
    const uint64_t key = fingerprint(series, config);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            // Move to front (most recently used)
            entries_.splice(entries_.begin(), entries_, it->second);
            hits_++;
            return it->second->second;
        }
        misses_++;
    }

    // Compute without holding the lock; summarize() is pure
    SummaryResult result = summarize(series, config);

    std::lock_guard<std::mutex> lock(mutex_);
    insert_locked(key, result);
    return result;
}

void SummaryCache::insert_locked(uint64_t key, SummaryResult result) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        // Another caller computed the same key meanwhile
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    entries_.emplace_front(key, std::move(result));
    index_[key] = entries_.begin();

    while (entries_.size() > capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
}

void SummaryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

std::size_t SummaryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t SummaryCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

uint64_t SummaryCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace ta
