#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tokenrank {

// Decodes one well-formed UTF-8 sequence at s[i]. On success advances i past
// it and returns true. On an ill-formed sequence leaves i unchanged and
// returns false.
bool next_codepoint(std::string_view s, std::size_t& i, std::uint32_t& cp);

// Length in bytes of the last well-formed character of s, 0 if s is empty
// or does not end with a complete well-formed character.
std::size_t last_codepoint(std::string_view s, std::uint32_t& cp);

void append_utf8(std::uint32_t cp, std::string& out);

// Offset of the first ill-formed sequence, or npos if s is valid UTF-8.
std::size_t find_invalid_utf8(std::string_view s);

inline bool is_valid_utf8(std::string_view s) { return find_invalid_utf8(s) == std::string_view::npos; }

// Replaces every maximal ill-formed subsequence with U+FFFD.
std::string to_utf8_lossy(std::string_view s);

// Unicode White_Space property.
bool is_unicode_whitespace(std::uint32_t cp);

} // namespace tokenrank
