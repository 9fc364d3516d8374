#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "tokenrank/vocab_loader.hpp"
#include "tokenrank/vocab_source.hpp"

using namespace tokenrank;

namespace fs = std::filesystem;

static fs::path temp_dir() {
  fs::path dir = fs::temp_directory_path() / "tokenrank_vocab_source_test";
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static std::string slurp(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Writers racing on one cache entry must each publish a whole file and leave
// no temp files behind.
static void test_concurrent_cache_writers(const fs::path& dir) {
  fs::path target = dir / "racing" / cache_file_name("https://example.com/racing.tiktoken");
  const std::string a(1 << 20, 'a');
  const std::string b((1 << 20) + 4096, 'b');

  for (int round = 0; round < 20; ++round) {
    std::vector<std::thread> writers;
    std::vector<char> ok(8, 0);
    for (std::size_t t = 0; t < ok.size(); ++t) {
      writers.emplace_back([&, t]() {
        std::string err;
        ok[t] = write_cache_file(target, t % 2 == 0 ? a : b, err) ? 1 : 0;
      });
    }
    for (auto& w : writers) {
      w.join();
    }
    for (char o : ok) {
      assert(o == 1);
    }
    std::string published = slurp(target);
    assert(published == a || published == b);
  }

  std::size_t files = 0;
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    assert(entry.path().extension() != ".tmp");
    ++files;
  }
  assert(files == 1);
}

static void test_cache_write_error_reported(const fs::path& dir) {
  fs::path blocker = dir / "not_a_dir";
  {
    std::ofstream out(blocker, std::ios::binary);
    out << "x";
  }
  std::string err;
  assert(!write_cache_file(blocker / "entry", "data", err));
  assert(!err.empty());
}

int main() {
  assert(cache_file_name("https://openaipublic.blob.core.windows.net/encodings/cl100k_base.tiktoken") ==
         "26B9C229141B3D34DCAC6D3728F94F1E40ABB67EF4A84CA1351ABC0A20E6B701");
  assert(cache_file_name("a").size() == 64);

  assert(is_remote_http_url("https://example.com/x"));
  assert(is_remote_http_url("HTTP://example.com/x"));
  assert(!is_remote_http_url("/tmp/x"));
  assert(is_file_url("file:///tmp/x"));
  assert(!is_file_url("/tmp/x"));

  fs::path dir = temp_dir();
  fs::path vocab = dir / "toy.tiktoken";
  {
    std::ofstream out(vocab, std::ios::binary);
    out << "IQ== 0\naGVsbG8= 1\n";
  }

  std::string contents;
  std::string err;
  assert(read_file_cached(vocab.string(), "", contents, err));
  assert(contents == "IQ== 0\naGVsbG8= 1\n");

  contents.clear();
  assert(read_file_cached("file://" + vocab.string(), (dir / "cache").string(), contents, err));
  assert(contents == "IQ== 0\naGVsbG8= 1\n");
  // Local sources are never copied into the cache.
  assert(!fs::exists(dir / "cache"));

  EncoderMap ranks;
  assert(load_tiktoken_bpe_file(vocab.string(), "", ranks, err));
  assert(ranks.size() == 2);

  err.clear();
  assert(!read_file_cached((dir / "missing").string(), "", contents, err));
  assert(!err.empty());

  test_concurrent_cache_writers(dir);
  test_cache_write_error_reported(dir);

  fs::remove_all(dir);
  return 0;
}
