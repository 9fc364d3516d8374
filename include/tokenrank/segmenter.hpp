#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tokenrank/special_policy.hpp"

namespace re2 {
class RE2;
}

namespace tokenrank {

// Compiled Segmentation Pattern. Accepts the Perl-style patterns vocabularies
// ship with and rewrites the parts RE2 cannot express:
//   - \s and \S follow Unicode White_Space instead of ASCII.
//   - "\s+(?!\S)|\s+" becomes a single named group; a run of two or more
//     whitespace characters followed by non-whitespace gives back its last
//     character, which is what the lookahead did.
// Any other construct RE2 rejects throws ConfigError.
class SplitPattern {
public:
    explicit SplitPattern(std::string pattern);
    ~SplitPattern();

    SplitPattern(const SplitPattern&) = delete;
    SplitPattern& operator=(const SplitPattern&) = delete;

    const std::string& source() const { return source_; }
    const std::string& translated() const { return translated_; }

    // Produces the next piece starting at `pos` and advances `pos` past it.
    // Bytes no alternative matches (e.g. ill-formed UTF-8) come out as one
    // piece, so successive calls cover the whole text.
    bool next_piece(std::string_view text, std::size_t& pos, std::string_view& piece) const;

    std::vector<std::string_view> split(std::string_view text) const;

private:
    std::string source_;
    std::string translated_;
    std::unique_ptr<re2::RE2> re_;
    int tail_group_ = -1;
};

// Compiled Special-Token Pattern: alternation of every special literal,
// longest literal first so the longest wins at a given position.
class SpecialPattern {
public:
    explicit SpecialPattern(std::vector<std::string> literals);
    ~SpecialPattern();

    SpecialPattern(const SpecialPattern&) = delete;
    SpecialPattern& operator=(const SpecialPattern&) = delete;

    bool empty() const { return re_ == nullptr; }

    // Next literal occurrence at or after `pos`, as [start, end).
    bool find(std::string_view text, std::size_t pos, std::size_t& start, std::size_t& end) const;

private:
    std::vector<std::string> literals_;
    std::unique_ptr<re2::RE2> re_;
};

struct Segment {
    enum class Kind { ordinary, special };

    Kind kind = Kind::ordinary;
    std::string_view text;
};

// Splits text into special literals and ordinary pieces, in order, without
// dropping or duplicating a byte.
class Segmenter {
public:
    Segmenter(std::string split_pattern, std::vector<std::string> special_literals);

    const SplitPattern& split_pattern() const { return split_; }
    const SpecialPattern& special_pattern() const { return special_; }

    // Alternating ordinary spans and permitted special literals. Ordinary
    // spans are not split further. Throws SpecialTokenViolation listing every
    // forbidden literal found.
    std::vector<Segment> partition(std::string_view text, const SpecialPolicy& policy) const;

    // partition() with each ordinary span split into pieces.
    std::vector<Segment> segment(std::string_view text, const SpecialPolicy& policy) const;

    // Pieces only; special literals get no recognition.
    std::vector<Segment> segment_ordinary(std::string_view text) const;

private:
    SplitPattern split_;
    SpecialPattern special_;
};

} // namespace tokenrank
