#include "tokenrank/split_cache.hpp"

#include <mutex>

namespace tokenrank {

SplitCache::SplitCache(std::size_t shards, std::size_t max_entries)
    : shard_count_(shards == 0 ? 1 : shards),
      per_shard_cap_(0),
      shards_(std::make_unique<Shard[]>(shards == 0 ? 1 : shards)) {
    if (max_entries > 0) {
        per_shard_cap_ = max_entries / shard_count_;
        if (per_shard_cap_ == 0) {
            per_shard_cap_ = 1;
        }
    }
}

SplitCache::Shard& SplitCache::shard_for(std::string_view piece) const {
    return shards_[BytesHash{}(piece) % shard_count_];
}

bool SplitCache::lookup(std::string_view piece, Tokens& out) const {
    if (!enabled()) {
        return false;
    }
    Shard& shard = shard_for(piece);
    {
        std::shared_lock<std::shared_mutex> lock(shard.mu);
        auto it = shard.entries.find(piece);
        if (it != shard.entries.end()) {
            out.insert(out.end(), it->second.begin(), it->second.end());
            hits_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
    }
    misses_.fetch_add(1, std::memory_order_relaxed);
    return false;
}

void SplitCache::store(std::string_view piece, const Tokens& ranks) const {
    if (!enabled()) {
        return;
    }
    Shard& shard = shard_for(piece);
    std::unique_lock<std::shared_mutex> lock(shard.mu);
    if (shard.entries.size() >= per_shard_cap_) {
        shard.entries.clear();
    }
    shard.entries.emplace(Bytes(piece), ranks);
}

void SplitCache::clear() const {
    for (std::size_t i = 0; i < shard_count_; ++i) {
        std::unique_lock<std::shared_mutex> lock(shards_[i].mu);
        shards_[i].entries.clear();
    }
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
}

CacheStats SplitCache::stats() const {
    CacheStats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < shard_count_; ++i) {
        std::shared_lock<std::shared_mutex> lock(shards_[i].mu);
        s.entries += shards_[i].entries.size();
    }
    return s;
}

} // namespace tokenrank
