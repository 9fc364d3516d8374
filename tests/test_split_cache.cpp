#include <atomic>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

#include "tokenrank/split_cache.hpp"

using namespace tokenrank;

static void test_store_and_lookup() {
  SplitCache cache(4, 100);
  assert(cache.enabled());
  assert(cache.shard_count() == 4);

  Tokens out = {7};
  assert(!cache.lookup("abc", out));
  cache.store("abc", {1, 2});
  assert(cache.lookup("abc", out));
  assert((out == Tokens{7, 1, 2}));

  CacheStats s = cache.stats();
  assert(s.hits == 1 && s.misses == 1 && s.entries == 1);

  cache.clear();
  s = cache.stats();
  assert(s.hits == 0 && s.misses == 0 && s.entries == 0);
}

static void test_get_or_compute() {
  SplitCache cache;
  int calls = 0;
  auto compute = [&](std::string_view piece) {
    ++calls;
    return Tokens{static_cast<Rank>(piece.size())};
  };
  Tokens out;
  cache.get_or_compute("hello", out, compute);
  cache.get_or_compute("hello", out, compute);
  assert(calls == 1);
  assert((out == Tokens{5, 5}));
}

static void test_shard_cleared_at_capacity() {
  SplitCache cache(1, 2);
  cache.store("a", {1});
  cache.store("b", {2});
  assert(cache.stats().entries == 2);
  cache.store("c", {3});
  assert(cache.stats().entries == 1);
  Tokens out;
  assert(!cache.lookup("a", out));
  assert(cache.lookup("c", out));
}

static void test_disabled() {
  SplitCache cache(8, 0);
  assert(!cache.enabled());
  cache.store("x", {1});
  Tokens out;
  assert(!cache.lookup("x", out));
  assert(cache.stats().entries == 0);
}

static void test_concurrent_readers_and_writers() {
  SplitCache cache(8, 1 << 12);
  std::vector<std::string> pieces;
  for (int i = 0; i < 200; ++i) {
    pieces.push_back("piece-" + std::to_string(i));
  }
  std::atomic<bool> mismatch{false};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&]() {
      for (int round = 0; round < 20; ++round) {
        for (const auto& p : pieces) {
          Tokens out;
          cache.get_or_compute(p, out, [](std::string_view s) { return Tokens{static_cast<Rank>(s.size()), 42}; });
          if (out.size() != 2 || out[0] != p.size() || out[1] != 42) {
            mismatch = true;
          }
        }
      }
    });
  }
  for (auto& w : workers) w.join();
  assert(!mismatch);
  CacheStats s = cache.stats();
  assert(s.entries == pieces.size());
  assert(s.hits + s.misses == 8u * 20u * pieces.size());
}

int main() {
  test_store_and_lookup();
  test_get_or_compute();
  test_shard_cleared_at_capacity();
  test_disabled();
  test_concurrent_readers_and_writers();
  return 0;
}
