#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <lzma.h>
#include <zlib.h>

#include "tokenrank/corpus_reader.hpp"

using namespace tokenrank;

namespace fs = std::filesystem;

static void write_file(const fs::path& path, const std::string& data) {
  std::ofstream out(path, std::ios::binary);
  out << data;
}

static void write_gz(const fs::path& path, const std::string& data) {
  gzFile gz = gzopen(path.string().c_str(), "wb");
  assert(gz);
  int written = gzwrite(gz, data.data(), static_cast<unsigned>(data.size()));
  assert(written == static_cast<int>(data.size()));
  gzclose(gz);
}

static void write_xz(const fs::path& path, const std::string& data) {
  std::vector<std::uint8_t> buf(data.size() + 1024);
  std::size_t out_pos = 0;
  lzma_ret ret = lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr, reinterpret_cast<const std::uint8_t*>(data.data()),
                                         data.size(), buf.data(), &out_pos, buf.size());
  assert(ret == LZMA_OK);
  write_file(path, std::string(reinterpret_cast<const char*>(buf.data()), out_pos));
}

static std::vector<std::string> read_records(const CorpusReader& reader, const fs::path& path) {
  std::vector<std::string> out;
  std::string err;
  bool ok = reader.for_each_record(path.string(), [&](const std::string& r) { out.push_back(r); }, err);
  assert(ok);
  return out;
}

int main() {
  fs::path dir = fs::temp_directory_path() / "tokenrank_corpus_test";
  fs::remove_all(dir);
  fs::create_directories(dir);

  CorpusReader reader;
  const std::string jsonl = "{\"text\":\"first\"}\n{\"content\":\"second\"}\nnot json\n{\"other\":1}\n";

  write_file(dir / "a.txt", "one\r\n\ntwo\n");
  assert((read_records(reader, dir / "a.txt") == std::vector<std::string>{"one", "two"}));

  write_file(dir / "b.jsonl", jsonl);
  assert((read_records(reader, dir / "b.jsonl") == std::vector<std::string>{"first", "second"}));

  write_file(dir / "c.json", "[{\"text\":\"x\"},\"y\",{\"content\":\"z\"}]");
  assert((read_records(reader, dir / "c.json") == std::vector<std::string>{"x", "y", "z"}));

  write_gz(dir / "d.jsonl.gz", jsonl);
  assert((read_records(reader, dir / "d.jsonl.gz") == std::vector<std::string>{"first", "second"}));

  write_xz(dir / "e.txt.xz", "alpha\nbeta\n");
  assert((read_records(reader, dir / "e.txt.xz") == std::vector<std::string>{"alpha", "beta"}));

  CorpusReadOptions opts;
  opts.json_text_fields = {"content"};
  CorpusReader content_only(opts);
  assert((read_records(content_only, dir / "b.jsonl") == std::vector<std::string>{"second"}));

  std::string err;
  assert(!reader.for_each_record((dir / "missing.txt").string(), [](const std::string&) {}, err));
  assert(!err.empty());

  fs::remove_all(dir);
  return 0;
}
