#include "tokenrank/byte_pair.hpp"

#include <functional>
#include <queue>
#include <utility>

#include "tokenrank/errors.hpp"

namespace tokenrank {

namespace {
Rank lookup(std::string_view piece, std::size_t start, std::size_t end, const EncoderMap& ranks) {
    auto it = ranks.find(piece.substr(start, end - start));
    return it == ranks.end() ? kNoRank : it->second;
}
} // namespace

namespace detail {

std::vector<std::size_t> merge_linear(std::string_view piece, const EncoderMap& ranks) {
    struct Part {
        std::size_t start;
        Rank rank;
    };

    // parts[i].rank is the rank of parts[i] merged with parts[i + 1]; the last
    // entry is a sentinel at piece.size().
    std::vector<Part> parts;
    parts.reserve(piece.size() + 1);
    for (std::size_t i = 0; i <= piece.size(); ++i) {
        parts.push_back({i, kNoRank});
    }

    auto pair_rank = [&](std::size_t i) -> Rank {
        if (i + 2 < parts.size()) {
            return lookup(piece, parts[i].start, parts[i + 2].start, ranks);
        }
        return kNoRank;
    };

    for (std::size_t i = 0; i + 2 < parts.size(); ++i) {
        parts[i].rank = pair_rank(i);
    }

    while (parts.size() > 2) {
        Rank best = kNoRank;
        std::size_t best_i = 0;
        for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
            if (parts[i].rank < best) {
                best = parts[i].rank;
                best_i = i;
            }
        }
        if (best == kNoRank) {
            break;
        }
        parts.erase(parts.begin() + static_cast<std::ptrdiff_t>(best_i + 1));
        parts[best_i].rank = pair_rank(best_i);
        if (best_i > 0) {
            parts[best_i - 1].rank = pair_rank(best_i - 1);
        }
    }

    std::vector<std::size_t> bounds;
    bounds.reserve(parts.size());
    for (const auto& p : parts) {
        bounds.push_back(p.start);
    }
    return bounds;
}

std::vector<std::size_t> merge_heap(std::string_view piece, const EncoderMap& ranks) {
    const std::size_t n = piece.size();

    // Spans are identified by their start offset. next[s] is the start of the
    // following span (n for the last one).
    std::vector<std::size_t> next(n);
    std::vector<std::size_t> prev(n);
    std::vector<Rank> pair_rank_at(n, kNoRank);
    std::vector<char> alive(n, 1);
    for (std::size_t i = 0; i < n; ++i) {
        next[i] = i + 1;
        prev[i] = i == 0 ? 0 : i - 1;
    }

    auto pair_rank = [&](std::size_t s) -> Rank {
        std::size_t mid = next[s];
        if (mid >= n) {
            return kNoRank;
        }
        return lookup(piece, s, next[mid], ranks);
    };

    using Entry = std::pair<Rank, std::size_t>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap;
    for (std::size_t s = 0; s + 1 < n; ++s) {
        pair_rank_at[s] = pair_rank(s);
        if (pair_rank_at[s] != kNoRank) {
            heap.emplace(pair_rank_at[s], s);
        }
    }

    while (!heap.empty()) {
        auto [rank, s] = heap.top();
        heap.pop();
        // Stale entry: span was absorbed or its right neighbour changed.
        if (!alive[s] || pair_rank_at[s] != rank) {
            continue;
        }

        std::size_t absorbed = next[s];
        alive[absorbed] = 0;
        next[s] = next[absorbed];
        if (next[s] < n) {
            prev[next[s]] = s;
        }

        pair_rank_at[s] = pair_rank(s);
        if (pair_rank_at[s] != kNoRank) {
            heap.emplace(pair_rank_at[s], s);
        }
        if (s > 0) {
            std::size_t p = prev[s];
            pair_rank_at[p] = pair_rank(p);
            if (pair_rank_at[p] != kNoRank) {
                heap.emplace(pair_rank_at[p], p);
            }
        }
    }

    std::vector<std::size_t> bounds;
    for (std::size_t s = 0; s < n; s = next[s]) {
        bounds.push_back(s);
    }
    bounds.push_back(n);
    return bounds;
}

} // namespace detail

std::vector<std::size_t> byte_pair_merge(std::string_view piece, const EncoderMap& ranks) {
    if (piece.empty()) {
        return {0};
    }
    if (piece.size() >= detail::kHeapMergeThreshold) {
        return detail::merge_heap(piece, ranks);
    }
    return detail::merge_linear(piece, ranks);
}

Tokens byte_pair_encode(std::string_view piece, const EncoderMap& ranks) {
    Tokens out;
    if (piece.empty()) {
        return out;
    }
    if (piece.size() == 1) {
        Rank r = lookup(piece, 0, 1, ranks);
        if (r == kNoRank) {
            throw Error("byte has no rank in the table");
        }
        out.push_back(r);
        return out;
    }
    auto bounds = byte_pair_merge(piece, ranks);
    out.reserve(bounds.size() - 1);
    for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
        Rank r = lookup(piece, bounds[i], bounds[i + 1], ranks);
        if (r == kNoRank) {
            throw Error("merged span has no rank in the table");
        }
        out.push_back(r);
    }
    return out;
}

std::vector<std::string_view> byte_pair_split(std::string_view piece, const EncoderMap& ranks) {
    std::vector<std::string_view> out;
    if (piece.empty()) {
        return out;
    }
    auto bounds = byte_pair_merge(piece, ranks);
    out.reserve(bounds.size() - 1);
    for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
        out.push_back(piece.substr(bounds[i], bounds[i + 1] - bounds[i]));
    }
    return out;
}

} // namespace tokenrank
