#include "tokenrank/utf8.hpp"

namespace tokenrank {

namespace {

// Length of the well-formed sequence starting at s[i], or 0.
std::size_t sequence_length(std::string_view s, std::size_t i) {
    const auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c0 = byte(i);
    if (c0 < 0x80) return 1;
    std::size_t n = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c0 >= 0xC2 && c0 <= 0xDF) {
        n = 2;
    } else if (c0 >= 0xE0 && c0 <= 0xEF) {
        n = 3;
        if (c0 == 0xE0) lo = 0xA0;
        if (c0 == 0xED) hi = 0x9F;
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
        n = 4;
        if (c0 == 0xF0) lo = 0x90;
        if (c0 == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (i + n > s.size()) return 0;
    unsigned char c1 = byte(i + 1);
    if (c1 < lo || c1 > hi) return 0;
    for (std::size_t k = 2; k < n; ++k) {
        unsigned char c = byte(i + k);
        if (c < 0x80 || c > 0xBF) return 0;
    }
    return n;
}

// Bytes covered by one replacement character: the lead byte plus every
// continuation byte that still fits a well-formed prefix.
std::size_t maximal_subpart(std::string_view s, std::size_t i) {
    const auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c0 = byte(i);
    std::size_t n = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c0 >= 0xC2 && c0 <= 0xDF) {
        n = 2;
    } else if (c0 >= 0xE0 && c0 <= 0xEF) {
        n = 3;
        if (c0 == 0xE0) lo = 0xA0;
        if (c0 == 0xED) hi = 0x9F;
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
        n = 4;
        if (c0 == 0xF0) lo = 0x90;
        if (c0 == 0xF4) hi = 0x8F;
    } else {
        return 1;
    }
    std::size_t len = 1;
    for (std::size_t k = 1; k < n && i + k < s.size(); ++k) {
        unsigned char c = byte(i + k);
        unsigned char klo = k == 1 ? lo : 0x80;
        unsigned char khi = k == 1 ? hi : 0xBF;
        if (c < klo || c > khi) break;
        ++len;
    }
    return len;
}

std::uint32_t decode_sequence(std::string_view s, std::size_t i, std::size_t n) {
    const auto byte = [&](std::size_t k) { return static_cast<std::uint32_t>(static_cast<unsigned char>(s[k])); };
    switch (n) {
    case 1:
        return byte(i);
    case 2:
        return ((byte(i) & 0x1F) << 6) | (byte(i + 1) & 0x3F);
    case 3:
        return ((byte(i) & 0x0F) << 12) | ((byte(i + 1) & 0x3F) << 6) | (byte(i + 2) & 0x3F);
    default:
        return ((byte(i) & 0x07) << 18) | ((byte(i + 1) & 0x3F) << 12) | ((byte(i + 2) & 0x3F) << 6) |
               (byte(i + 3) & 0x3F);
    }
}

} // namespace

bool next_codepoint(std::string_view s, std::size_t& i, std::uint32_t& cp) {
    if (i >= s.size()) return false;
    std::size_t n = sequence_length(s, i);
    if (n == 0) return false;
    cp = decode_sequence(s, i, n);
    i += n;
    return true;
}

std::size_t last_codepoint(std::string_view s, std::uint32_t& cp) {
    std::size_t max_back = s.size() < 4 ? s.size() : 4;
    for (std::size_t back = 1; back <= max_back; ++back) {
        std::size_t start = s.size() - back;
        unsigned char c = static_cast<unsigned char>(s[start]);
        if (c >= 0x80 && c <= 0xBF) {
            continue;
        }
        if (sequence_length(s, start) != back) {
            return 0;
        }
        cp = decode_sequence(s, start, back);
        return back;
    }
    return 0;
}

void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::size_t find_invalid_utf8(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        std::size_t n = sequence_length(s, i);
        if (n == 0) return i;
        i += n;
    }
    return std::string_view::npos;
}

std::string to_utf8_lossy(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        std::size_t n = sequence_length(s, i);
        if (n > 0) {
            out.append(s.data() + i, n);
            i += n;
        } else {
            out += "\xEF\xBF\xBD";
            i += maximal_subpart(s, i);
        }
    }
    return out;
}

bool is_unicode_whitespace(std::uint32_t cp) {
    if (cp >= 0x09 && cp <= 0x0D) return true;
    switch (cp) {
    case 0x20:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

} // namespace tokenrank
