#include <algorithm>
#include <atomic>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

#include "tokenrank/errors.hpp"
#include "tokenrank/registry.hpp"
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

static void test_builtin_names() {
  auto names = list_encoding_names();
  assert(std::is_sorted(names.begin(), names.end()));
  for (const char* expected : {"cl100k_base", "gpt2", "p50k_base", "p50k_edit", "r50k_base"}) {
    assert(std::find(names.begin(), names.end(), expected) != names.end());
  }
}

static void test_model_mapping() {
  assert(encoding_name_for_model("gpt-4") == "cl100k_base");
  assert(encoding_name_for_model("gpt-4-0314") == "cl100k_base");
  assert(encoding_name_for_model("gpt-3.5-turbo") == "cl100k_base");
  assert(encoding_name_for_model("gpt-3.5-turbo-0301") == "cl100k_base");
  assert(encoding_name_for_model("text-embedding-ada-002") == "cl100k_base");
  assert(encoding_name_for_model("text-davinci-003") == "p50k_base");
  assert(encoding_name_for_model("code-cushman-001") == "p50k_base");
  assert(encoding_name_for_model("text-davinci-edit-001") == "p50k_edit");
  assert(encoding_name_for_model("davinci") == "r50k_base");
  assert(encoding_name_for_model("text-search-ada-doc-001") == "r50k_base");
  assert(encoding_name_for_model("gpt2") == "gpt2");
  assert(throws_config_error([] { encoding_name_for_model("no-such-model"); }));
  assert(throws_config_error([] { get_encoding("no_such_encoding"); }));
}

static void test_registered_encoding_built_once() {
  static std::atomic<int> builds{0};
  bool added = register_encoding("toy_registry", [](const Config&) {
    builds.fetch_add(1);
    return testing::toy_spec();
  });
  assert(added);
  assert(!register_encoding("toy_registry", [](const Config&) { return testing::toy_spec(); }));
  assert(!register_encoding("gpt2", [](const Config&) { return testing::toy_spec(); }));

  std::vector<std::shared_ptr<const Encoding>> seen(8);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([&, i]() { seen[i] = get_encoding("toy_registry"); });
  }
  for (auto& t : threads) t.join();

  assert(builds.load() == 1);
  for (const auto& enc : seen) {
    assert(enc == seen.front());
  }
  assert((seen.front()->encode("hello world") == Tokens{259, 264}));

  auto names = list_encoding_names();
  assert(std::find(names.begin(), names.end(), "toy_registry") != names.end());
}

static void test_failed_build_is_retried() {
  static std::atomic<int> attempts{0};
  register_encoding("flaky", [](const Config&) {
    if (attempts.fetch_add(1) == 0) {
      throw Error("vocabulary unavailable");
    }
    return testing::toy_spec();
  });
  bool threw = false;
  try {
    get_encoding("flaky");
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
  assert(get_encoding("flaky") != nullptr);
  assert(attempts.load() == 2);
}

int main() {
  test_builtin_names();
  test_model_mapping();
  test_registered_encoding_built_once();
  test_failed_build_is_retried();
  return 0;
}
