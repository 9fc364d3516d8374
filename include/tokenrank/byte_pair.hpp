#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "tokenrank/types.hpp"

namespace tokenrank {

// Greedy minimal-rank merge of one piece. Repeatedly merges the adjacent
// pair whose concatenation has the lowest rank in `ranks` (leftmost on ties)
// until no adjacent pair is in the table. Returns the span boundaries as
// byte offsets: front() == 0, back() == piece.size().
std::vector<std::size_t> byte_pair_merge(std::string_view piece, const EncoderMap& ranks);

// Ranks of the merged spans, left to right. Throws Error if a final span is
// not in `ranks`, which cannot happen when every single byte is present.
Tokens byte_pair_encode(std::string_view piece, const EncoderMap& ranks);

// The merged spans themselves, viewing into `piece`.
std::vector<std::string_view> byte_pair_split(std::string_view piece, const EncoderMap& ranks);

namespace detail {

// Pieces at least this long go through the heap-driven merge.
constexpr std::size_t kHeapMergeThreshold = 128;

std::vector<std::size_t> merge_linear(std::string_view piece, const EncoderMap& ranks);
std::vector<std::size_t> merge_heap(std::string_view piece, const EncoderMap& ranks);

} // namespace detail

} // namespace tokenrank
