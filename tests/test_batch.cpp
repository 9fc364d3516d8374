#include <atomic>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/resource.h>

#include "tokenrank/batch.hpp"

using namespace tokenrank;

static void test_results_in_input_order() {
  for (std::size_t threads : {1u, 3u, 8u}) {
    BatchDriver driver(threads);
    assert(driver.threads() == threads);
    std::vector<std::size_t> out(1000, 0);
    driver.run(out.size(), [&](std::size_t i) { out[i] = i * i; });
    for (std::size_t i = 0; i < out.size(); ++i) {
      assert(out[i] == i * i);
    }
  }
  BatchDriver automatic;
  assert(automatic.threads() >= 1);
  automatic.run(0, [](std::size_t) { assert(false); });
}

static void test_first_error_rethrown() {
  BatchDriver driver(4);
  std::atomic<std::size_t> ran{0};
  bool threw = false;
  try {
    driver.run(10000, [&](std::size_t i) {
      ran.fetch_add(1);
      if (i == 50) {
        throw std::runtime_error("item 50 failed");
      }
    });
  } catch (const std::runtime_error& e) {
    threw = true;
    assert(std::string(e.what()) == "item 50 failed");
  }
  assert(threw);
  assert(ran.load() >= 1);
}

static void test_reused_driver() {
  BatchDriver driver(4);
  for (int round = 0; round < 3; ++round) {
    std::vector<int> out(64, 0);
    driver.run(out.size(), [&](std::size_t i) { out[i] = round + 1; });
    for (int v : out) {
      assert(v == round + 1);
    }
  }
}

// Thread stacks alone overrun a 512 MiB address space long before 4096
// threads exist; every item must still run.
static void test_thread_spawn_failure() {
#if defined(__SANITIZE_ADDRESS__) || defined(__SANITIZE_THREAD__)
  return;
#else
  rlimit saved{};
  if (getrlimit(RLIMIT_AS, &saved) != 0) {
    return;
  }
  rlimit tight = saved;
  tight.rlim_cur = rlim_t(512) << 20;
  if (saved.rlim_max != RLIM_INFINITY && saved.rlim_max < tight.rlim_cur) {
    return;
  }
  if (setrlimit(RLIMIT_AS, &tight) != 0) {
    return;
  }

  std::vector<char> done(4096, 0);
  std::atomic<std::size_t> ran{0};
  BatchDriver driver(4096);
  driver.run(done.size(), [&](std::size_t i) {
    done[i] = 1;
    ran.fetch_add(1);
  });

  int restored = setrlimit(RLIMIT_AS, &saved);
  assert(restored == 0);
  assert(ran.load() == done.size());
  for (char d : done) {
    assert(d == 1);
  }
#endif
}

int main() {
  test_results_in_input_order();
  test_first_error_rethrown();
  test_reused_driver();
  test_thread_spawn_failure();
  return 0;
}
