#include <iostream>
#include <string>

#include "tokenrank/encoding.hpp"

int main() {
  using namespace tokenrank;

  EncodingSpec spec;
  spec.name = "demo";
  spec.pattern = R"('s|'t| ?\p{L}+| ?\p{N}+| ?[^\s\p{L}\p{N}]+|\s+(?!\S)|\s+)";
  Rank next = 0;
  for (int b = 0; b < 256; ++b) {
    spec.mergeable_ranks.emplace(std::string(1, static_cast<char>(b)), next++);
  }
  for (const char* merged : {"to", "ke", "en", "ken", "token", " token", "ra", "nk", " ra", " rank"}) {
    spec.mergeable_ranks.emplace(merged, next++);
  }
  spec.special_tokens.emplace("<|endoftext|>", next++);

  Encoding enc(std::move(spec));
  auto ids = enc.encode("token rank demo<|endoftext|>", SpecialPolicy::all());
  std::cout << "Encoded IDs:";
  for (auto id : ids) {
    std::cout << ' ' << id;
  }
  std::cout << "\nDecoded: " << enc.decode(ids) << '\n';
  std::cout << "Vocab size: " << enc.n_vocab() << '\n';
  return 0;
}
