#pragma once

#include <string>
#include <vector>

#include "tokenrank/encoding.hpp"

namespace tokenrank::testing {

inline const char* const kGpt2Pattern =
    R"('s|'t|'re|'ve|'m|'ll|'d| ?\p{L}+| ?\p{N}+| ?[^\s\p{L}\p{N}]+|\s+(?!\S)|\s+)";

inline const char* const kCl100kPattern =
    R"((?i:'s|'t|'re|'ve|'m|'ll|'d)|[^\r\n\p{L}\p{N}]?\p{L}+|\p{N}{1,3}| ?[^\s\p{L}\p{N}]+[\r\n]*|\s*[\r\n]+|\s+(?!\S)|\s+)";

// Every single byte at rank == byte value, then `merges` at 256, 257, ...
inline EncoderMap byte_ranks_with(const std::vector<std::string>& merges) {
  EncoderMap ranks;
  for (int b = 0; b < 256; ++b) {
    ranks.emplace(std::string(1, static_cast<char>(b)), static_cast<Rank>(b));
  }
  Rank next = 256;
  for (const auto& m : merges) {
    ranks.emplace(m, next++);
  }
  return ranks;
}

// 256 bytes, nine merges (256..264) and two specials:
//   256 "he", 257 "ll", 258 "hell", 259 "hello", 260 " w",
//   261 "or", 262 " wor", 263 "ld", 264 " world",
//   265 "<|endoftext|>", 266 "<|fim|>".
inline EncodingSpec toy_spec() {
  EncodingSpec spec;
  spec.name = "toy";
  spec.pattern = kGpt2Pattern;
  spec.mergeable_ranks = byte_ranks_with({"he", "ll", "hell", "hello", " w", "or", " wor", "ld", " world"});
  spec.special_tokens.emplace("<|endoftext|>", 265);
  spec.special_tokens.emplace("<|fim|>", 266);
  return spec;
}

} // namespace tokenrank::testing
