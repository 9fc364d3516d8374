#include "tokenrank/segmenter.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include <re2/re2.h>

#include "tokenrank/errors.hpp"
#include "tokenrank/utf8.hpp"

namespace tokenrank {

namespace {

const char* const kWhitespaceTailIdiom = R"(\s+(?!\S)|\s+)";
const char* const kWhitespaceTailGroup = "tokenrank_ws_tail";

// Members of Unicode White_Space that RE2's \s leaves out.
const char* const kExtraWhitespace = R"(\x0B\x{85}\p{Z})";

std::string widen_whitespace_classes(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size() + 32);
    bool in_class = false;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size()) {
            char e = pattern[i + 1];
            ++i;
            if (e == 's') {
                if (in_class) {
                    out += "\\s";
                    out += kExtraWhitespace;
                } else {
                    out += "[\\s";
                    out += kExtraWhitespace;
                    out += "]";
                }
                continue;
            }
            if (e == 'S' && !in_class) {
                out += "[^\\s";
                out += kExtraWhitespace;
                out += "]";
                continue;
            }
            out.push_back(c);
            out.push_back(e);
            continue;
        }
        if (!in_class && c == '[') {
            in_class = true;
            out.push_back(c);
            // A leading ']' (after an optional '^') is a literal.
            if (i + 1 < pattern.size() && pattern[i + 1] == '^') {
                out.push_back(pattern[++i]);
            }
            if (i + 1 < pattern.size() && pattern[i + 1] == ']') {
                out.push_back(pattern[++i]);
            }
            continue;
        }
        if (in_class && c == ']') {
            in_class = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string translate_pattern(const std::string& pattern, bool& has_tail) {
    std::string rewritten = pattern;
    std::size_t at = rewritten.find(kWhitespaceTailIdiom);
    has_tail = at != std::string::npos;
    if (has_tail) {
        rewritten.replace(at, std::char_traits<char>::length(kWhitespaceTailIdiom),
                          std::string("(?P<") + kWhitespaceTailGroup + ">\\s+)");
    }
    return widen_whitespace_classes(rewritten);
}

} // namespace

// ---- SplitPattern ----

SplitPattern::SplitPattern(std::string pattern) : source_(std::move(pattern)) {
    bool has_tail = false;
    translated_ = translate_pattern(source_, has_tail);

    re2::RE2::Options opts;
    opts.set_log_errors(false);
    re_ = std::make_unique<re2::RE2>(translated_, opts);
    if (!re_->ok()) {
        throw ConfigError("invalid segmentation pattern '" + source_ + "': " + re_->error());
    }
    if (has_tail) {
        const auto& names = re_->NamedCapturingGroups();
        auto it = names.find(kWhitespaceTailGroup);
        if (it != names.end()) {
            tail_group_ = it->second;
        }
    }
}

SplitPattern::~SplitPattern() = default;

bool SplitPattern::next_piece(std::string_view text, std::size_t& pos, std::string_view& piece) const {
    if (pos >= text.size()) {
        return false;
    }

    const int nsub = tail_group_ > 0 ? tail_group_ + 1 : 1;
    std::vector<re2::StringPiece> groups(static_cast<std::size_t>(nsub));
    re2::StringPiece input(text.data(), text.size());
    if (!re_->Match(input, pos, text.size(), re2::RE2::UNANCHORED, groups.data(), nsub)) {
        piece = text.substr(pos);
        pos = text.size();
        return true;
    }

    std::size_t start = static_cast<std::size_t>(groups[0].data() - text.data());
    std::size_t end = start + groups[0].size();
    if (start > pos) {
        // Unmatched bytes before the match.
        piece = text.substr(pos, start - pos);
        pos = start;
        return true;
    }
    if (end == start) {
        std::size_t i = pos;
        std::uint32_t cp = 0;
        if (!next_codepoint(text, i, cp)) {
            i = pos + 1;
        }
        piece = text.substr(pos, i - pos);
        pos = i;
        return true;
    }

    if (tail_group_ > 0 && groups[static_cast<std::size_t>(tail_group_)].data() != nullptr && end < text.size()) {
        // Maximal whitespace run followed by a non-whitespace character: the
        // last whitespace character belongs to the next piece.
        std::uint32_t cp = 0;
        std::size_t last = last_codepoint(text.substr(start, end - start), cp);
        if (last > 0 && last < end - start) {
            end -= last;
        }
    }

    piece = text.substr(start, end - start);
    pos = end;
    return true;
}

std::vector<std::string_view> SplitPattern::split(std::string_view text) const {
    std::vector<std::string_view> out;
    std::size_t pos = 0;
    std::string_view piece;
    while (next_piece(text, pos, piece)) {
        out.push_back(piece);
    }
    return out;
}

// ---- SpecialPattern ----

SpecialPattern::SpecialPattern(std::vector<std::string> literals) : literals_(std::move(literals)) {
    if (literals_.empty()) {
        return;
    }
    std::sort(literals_.begin(), literals_.end(), [](const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return a.size() > b.size();
        }
        return a < b;
    });

    std::string alternation;
    for (const auto& lit : literals_) {
        if (!alternation.empty()) {
            alternation.push_back('|');
        }
        alternation += re2::RE2::QuoteMeta(lit);
    }

    // Latin-1 so literals and text are compared byte for byte.
    re2::RE2::Options opts;
    opts.set_log_errors(false);
    opts.set_encoding(re2::RE2::Options::EncodingLatin1);
    re_ = std::make_unique<re2::RE2>("(?:" + alternation + ")", opts);
    if (!re_->ok()) {
        throw ConfigError("invalid special token pattern: " + re_->error());
    }
}

SpecialPattern::~SpecialPattern() = default;

bool SpecialPattern::find(std::string_view text, std::size_t pos, std::size_t& start, std::size_t& end) const {
    if (!re_ || pos >= text.size()) {
        return false;
    }
    re2::StringPiece input(text.data(), text.size());
    re2::StringPiece match;
    if (!re_->Match(input, pos, text.size(), re2::RE2::UNANCHORED, &match, 1)) {
        return false;
    }
    start = static_cast<std::size_t>(match.data() - text.data());
    end = start + match.size();
    return true;
}

// ---- Segmenter ----

Segmenter::Segmenter(std::string split_pattern, std::vector<std::string> special_literals)
    : split_(std::move(split_pattern)), special_(std::move(special_literals)) {}

std::vector<Segment> Segmenter::partition(std::string_view text, const SpecialPolicy& policy) const {
    std::vector<Segment> out;
    std::vector<std::string> violations;

    std::size_t pos = 0;
    std::size_t last = 0;
    std::size_t start = 0;
    std::size_t end = 0;
    while (special_.find(text, pos, start, end)) {
        std::string_view literal = text.substr(start, end - start);
        pos = end;
        if (!policy.permits(literal)) {
            if (std::find(violations.begin(), violations.end(), literal) == violations.end()) {
                violations.emplace_back(literal);
            }
            continue;
        }
        if (start > last) {
            out.push_back({Segment::Kind::ordinary, text.substr(last, start - last)});
        }
        out.push_back({Segment::Kind::special, literal});
        last = end;
    }
    if (!violations.empty()) {
        throw SpecialTokenViolation(std::move(violations));
    }
    if (last < text.size()) {
        out.push_back({Segment::Kind::ordinary, text.substr(last)});
    }
    return out;
}

std::vector<Segment> Segmenter::segment(std::string_view text, const SpecialPolicy& policy) const {
    std::vector<Segment> out;
    for (const auto& seg : partition(text, policy)) {
        if (seg.kind == Segment::Kind::special) {
            out.push_back(seg);
            continue;
        }
        std::size_t pos = 0;
        std::string_view piece;
        while (split_.next_piece(seg.text, pos, piece)) {
            out.push_back({Segment::Kind::ordinary, piece});
        }
    }
    return out;
}

std::vector<Segment> Segmenter::segment_ordinary(std::string_view text) const {
    std::vector<Segment> out;
    std::size_t pos = 0;
    std::string_view piece;
    while (split_.next_piece(text, pos, piece)) {
        out.push_back({Segment::Kind::ordinary, piece});
    }
    return out;
}

} // namespace tokenrank
