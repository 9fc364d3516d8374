#include <cassert>
#include <string>
#include <vector>

#include "tokenrank/errors.hpp"
#include "tokenrank/segmenter.hpp"
#include "toy_vocab.hpp"

using namespace tokenrank;

using Pieces = std::vector<std::string_view>;

static std::string join(const Pieces& pieces) {
  std::string out;
  for (auto p : pieces) out.append(p);
  return out;
}

static void test_gpt2_pattern() {
  SplitPattern pat(testing::kGpt2Pattern);
  assert((pat.split("hello world") == Pieces{"hello", " world"}));
  assert((pat.split("it's 42!") == Pieces{"it", "'s", " 42", "!"}));
  // Whitespace run before a word gives its last space to the word.
  assert((pat.split("a  b") == Pieces{"a", " ", " b"}));
  assert((pat.split("a   b") == Pieces{"a", "  ", " b"}));
  // Trailing whitespace stays whole.
  assert((pat.split("a  ") == Pieces{"a", "  "}));
  assert((pat.split("a\n\nb") == Pieces{"a", "\n", "\n", "b"}));
  assert(pat.split("").empty());
}

static void test_unicode_whitespace() {
  SplitPattern pat(testing::kGpt2Pattern);
  // U+3000 IDEOGRAPHIC SPACE counts as whitespace.
  std::string text = "a\xE3\x80\x80\xE3\x80\x80" "b";
  auto pieces = pat.split(text);
  assert((pieces == Pieces{"a", "\xE3\x80\x80", "\xE3\x80\x80", "b"}));
}

static void test_cl100k_pattern() {
  SplitPattern pat(testing::kCl100kPattern);
  auto pieces = pat.split("Hello world\n\n  foo123456");
  assert((pieces == Pieces{"Hello", " world", "\n\n", " ", " foo", "123", "456"}));
  assert((pat.split("I'LL go") == Pieces{"I", "'LL", " go"}));
}

static void test_coverage_with_invalid_bytes() {
  SplitPattern pat(testing::kGpt2Pattern);
  std::string text = "ab\xFF" "cd \xC3 x\x80";
  auto pieces = pat.split(text);
  assert(join(pieces) == text);
  for (auto p : pieces) assert(!p.empty());
}

static void test_bad_patterns() {
  bool threw = false;
  try {
    SplitPattern pat("(unclosed");
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    SplitPattern pat("a(?=b)");
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);
}

static void test_special_pattern() {
  SpecialPattern empty({});
  assert(empty.empty());
  std::size_t start = 0;
  std::size_t end = 0;
  assert(!empty.find("anything", 0, start, end));

  SpecialPattern pat({"<|a|>", "<|a|>b", "x.y"});
  assert(pat.find("zz<|a|>bq", 0, start, end));
  assert(start == 2 && end == 8);  // longest literal wins
  assert(pat.find("x.y", 0, start, end));
  assert(start == 0 && end == 3);
  assert(!pat.find("xzy", 0, start, end));  // metacharacters are literal
}

static void test_segmenter_partition() {
  Segmenter seg(testing::kGpt2Pattern, {"<|endoftext|>", "<|fim|>"});

  auto parts = seg.partition("hi<|endoftext|>there<|fim|>", SpecialPolicy::all());
  assert(parts.size() == 4);
  assert(parts[0].kind == Segment::Kind::ordinary && parts[0].text == "hi");
  assert(parts[1].kind == Segment::Kind::special && parts[1].text == "<|endoftext|>");
  assert(parts[2].kind == Segment::Kind::ordinary && parts[2].text == "there");
  assert(parts[3].kind == Segment::Kind::special && parts[3].text == "<|fim|>");

  auto segs = seg.segment("a b<|endoftext|>", SpecialPolicy::all());
  assert(segs.size() == 3);
  assert(segs[0].text == "a" && segs[1].text == " b");
  assert(segs[2].kind == Segment::Kind::special);

  auto ordinary = seg.segment_ordinary("x<|fim|>");
  for (const auto& s : ordinary) assert(s.kind == Segment::Kind::ordinary);

  bool threw = false;
  try {
    seg.partition("<|fim|> and <|endoftext|> and <|fim|>", SpecialPolicy::none());
  } catch (const SpecialTokenViolation& e) {
    threw = true;
    assert(e.literal() == "<|fim|>");
    assert(e.literals().size() == 2);
    assert(e.literals()[1] == "<|endoftext|>");
  }
  assert(threw);

  threw = false;
  try {
    seg.partition("<|endoftext|><|fim|>", SpecialPolicy::only({"<|endoftext|>"}));
  } catch (const SpecialTokenViolation& e) {
    threw = true;
    assert(e.literal() == "<|fim|>");
    assert(e.literals().size() == 1);
  }
  assert(threw);

  // No literal present: every policy succeeds.
  assert(seg.partition("plain", SpecialPolicy::none()).size() == 1);
  assert(seg.partition("", SpecialPolicy::none()).empty());
}

int main() {
  test_gpt2_pattern();
  test_unicode_whitespace();
  test_cl100k_pattern();
  test_coverage_with_invalid_bytes();
  test_bad_patterns();
  test_special_pattern();
  test_segmenter_partition();
  return 0;
}
