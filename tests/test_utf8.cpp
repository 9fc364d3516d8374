#include <cassert>
#include <string>

#include "tokenrank/utf8.hpp"

using namespace tokenrank;

int main() {
  const auto npos = std::string_view::npos;
  assert(find_invalid_utf8("plain ascii") == npos);
  assert(find_invalid_utf8("caf\xC3\xA9") == npos);
  assert(find_invalid_utf8("\xF0\x9F\x98\x80") == npos);
  assert(find_invalid_utf8("\xC3") == 0);
  assert(find_invalid_utf8("ab\xFF") == 2);
  assert(find_invalid_utf8("a\xED\xA0\x80") == 1);  // surrogate
  assert(find_invalid_utf8("\xC0\xAF") == 0);       // overlong
  assert(is_valid_utf8(""));

  assert(to_utf8_lossy("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
  // Truncated three-byte sequence is one maximal subpart.
  assert(to_utf8_lossy("\xE2\x82" "x") == "\xEF\xBF\xBD" "x");
  assert(to_utf8_lossy("ok") == "ok");

  std::size_t i = 0;
  std::uint32_t cp = 0;
  assert(next_codepoint("\xC3\xA9z", i, cp));
  assert(cp == 0xE9 && i == 2);
  i = 0;
  assert(!next_codepoint("\x80", i, cp));
  assert(i == 0);

  assert(last_codepoint("a\xC3\xA9", cp) == 2 && cp == 0xE9);
  assert(last_codepoint("a ", cp) == 1 && cp == 0x20);
  assert(last_codepoint("a\xC3", cp) == 0);
  assert(last_codepoint("", cp) == 0);

  std::string out;
  append_utf8(0x3000, out);
  assert(out == "\xE3\x80\x80");

  assert(is_unicode_whitespace(' '));
  assert(is_unicode_whitespace('\n'));
  assert(is_unicode_whitespace(0x0B));
  assert(is_unicode_whitespace(0x85));
  assert(is_unicode_whitespace(0xA0));
  assert(is_unicode_whitespace(0x3000));
  assert(!is_unicode_whitespace('a'));
  assert(!is_unicode_whitespace(0x200B));
  return 0;
}
