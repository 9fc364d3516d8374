#include <cassert>
#include <string>

#include "tokenrank/errors.hpp"
#include "tokenrank/rank_table.hpp"
#include "toy_vocab.hpp"

using namespace tokenrank;

template <typename Fn>
static bool throws_config_error(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

static void test_lookups() {
  auto spec = testing::toy_spec();
  RankTable table(spec.mergeable_ranks, spec.special_tokens);
  assert(table.size() == 265);
  assert(table.special_size() == 2);
  assert(table.rank_of("hello") == 259);
  assert(table.rank_of("h") == static_cast<Rank>('h'));
  assert(table.rank_of("nope") == kNoRank);
  assert(table.special_rank_of("<|endoftext|>") == 265);
  assert(table.special_rank_of("hello") == kNoRank);
  assert(*table.bytes_of(264) == " world");
  assert(table.bytes_of(265) == nullptr);
  assert(*table.token_bytes(265) == "<|endoftext|>");
  assert(table.token_bytes(999999) == nullptr);
  assert(table.is_special(266));
  assert(!table.is_special(259));
  assert(table.max_token_value() == 266);
  assert(table.byte_rank(0xFF) == 255);

  const auto& sorted = table.sorted_token_bytes();
  assert(sorted.size() == 265);
  for (std::size_t i = 1; i < sorted.size(); ++i) {
    assert(sorted[i - 1] < sorted[i]);
  }

  auto literals = table.special_literals();
  assert(literals.size() == 2);
  assert(literals[0] == "<|endoftext|>");
  assert(literals[1] == "<|fim|>");
}

static void test_missing_byte() {
  EncoderMap ranks = testing::byte_ranks_with({});
  ranks.erase(std::string(1, '\x7F'));
  assert(throws_config_error([&] { RankTable table(ranks, {}); }));
}

static void test_duplicate_rank() {
  EncoderMap ranks = testing::byte_ranks_with({"ab"});
  ranks.emplace("cd", 256);
  assert(throws_config_error([&] { RankTable table(ranks, {}); }));
}

static void test_special_collision() {
  EncoderMap ranks = testing::byte_ranks_with({"ab"});
  SpecialMap special;
  special.emplace("<|x|>", 256);
  assert(throws_config_error([&] { RankTable table(ranks, special); }));

  SpecialMap twice;
  twice.emplace("<|x|>", 300);
  twice.emplace("<|y|>", 300);
  assert(throws_config_error([&] { RankTable table(ranks, twice); }));

  SpecialMap empty_literal;
  empty_literal.emplace("", 300);
  assert(throws_config_error([&] { RankTable table(ranks, empty_literal); }));
}

static void test_special_inside_ordinary_interval() {
  // A special rank may sit in a gap of the ordinary ranks.
  EncoderMap ranks = testing::byte_ranks_with({});
  ranks.emplace("ab", 400);
  SpecialMap special;
  special.emplace("<|gap|>", 300);
  RankTable table(ranks, special);
  assert(table.special_rank_of("<|gap|>") == 300);
  assert(table.max_token_value() == 400);
}

int main() {
  test_lookups();
  test_missing_byte();
  test_duplicate_rank();
  test_special_collision();
  test_special_inside_ordinary_interval();
  return 0;
}
