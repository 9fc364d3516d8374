#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string_view>
#include <utility>

#include "tokenrank/types.hpp"

namespace tokenrank {

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::size_t entries = 0;
};

// Memoizes merge results per piece. Sharded by piece hash; readers share a
// shard lock, writers take it exclusively for that shard only. Entries are a
// pure function of the piece, so a lost race or an evicted shard only costs
// a recomputation. A shard that grows past its share of max_entries is
// cleared.
class SplitCache {
public:
    explicit SplitCache(std::size_t shards = 64, std::size_t max_entries = std::size_t(1) << 20);

    SplitCache(const SplitCache&) = delete;
    SplitCache& operator=(const SplitCache&) = delete;

    bool enabled() const { return per_shard_cap_ > 0; }
    std::size_t shard_count() const { return shard_count_; }

    // Appends the cached ranks for `piece` to `out` and returns true on a hit.
    bool lookup(std::string_view piece, Tokens& out) const;

    void store(std::string_view piece, const Tokens& ranks) const;

    // Appends the ranks for `piece` to `out`, computing them with `compute`
    // (piece -> Tokens) on a miss.
    template <typename Compute>
    void get_or_compute(std::string_view piece, Tokens& out, Compute&& compute) const {
        if (lookup(piece, out)) {
            return;
        }
        Tokens ranks = std::forward<Compute>(compute)(piece);
        store(piece, ranks);
        out.insert(out.end(), ranks.begin(), ranks.end());
    }

    void clear() const;
    CacheStats stats() const;

private:
    struct Shard {
        mutable std::shared_mutex mu;
        BytesMap<Tokens> entries;
    };

    Shard& shard_for(std::string_view piece) const;

    std::size_t shard_count_;
    std::size_t per_shard_cap_;
    std::unique_ptr<Shard[]> shards_;
    mutable std::atomic<std::uint64_t> hits_{0};
    mutable std::atomic<std::uint64_t> misses_{0};
};

} // namespace tokenrank
