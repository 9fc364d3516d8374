#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "tokenrank/batch.hpp"
#include "tokenrank/config.hpp"
#include "tokenrank/rank_table.hpp"
#include "tokenrank/segmenter.hpp"
#include "tokenrank/special_policy.hpp"
#include "tokenrank/split_cache.hpp"
#include "tokenrank/types.hpp"

namespace tokenrank {

enum class DecodeMode {
    strict,  // ill-formed UTF-8 throws DecodeError
    replace, // ill-formed subsequences become U+FFFD
};

// Everything needed to build an Encoding; produced by the vocabulary loaders.
struct EncodingSpec {
    std::string name;
    std::string pattern;
    EncoderMap mergeable_ranks;
    SpecialMap special_tokens;
    std::optional<std::size_t> explicit_n_vocab;
};

struct UnstableEncoding {
    Tokens tokens;
    std::set<Tokens> completions;
};

// A tokenizer instance: rank tables, compiled patterns and the split cache.
// Immutable after construction apart from the cache, and safe to share across
// threads.
class Encoding {
public:
    explicit Encoding(EncodingSpec spec, const Config& cfg = {});

    Encoding(const Encoding&) = delete;
    Encoding& operator=(const Encoding&) = delete;

    const std::string& name() const { return name_; }
    const std::string& pattern() const { return pattern_; }
    const RankTable& table() const { return table_; }

    Rank max_token_value() const { return max_token_value_; }
    std::size_t n_vocab() const { return static_cast<std::size_t>(max_token_value_) + 1; }
    std::optional<Rank> eot_token() const;
    std::unordered_set<std::string> special_tokens_set() const;

    // ---- encode ----

    // No special-token recognition: literals are merged as ordinary text.
    Tokens encode_ordinary(std::string_view text) const;

    // Throws SpecialTokenViolation when `policy` forbids a literal in `text`.
    Tokens encode(std::string_view text, const SpecialPolicy& policy = SpecialPolicy::none()) const;

    std::vector<Tokens> encode_ordinary_batch(const std::vector<std::string>& texts) const;
    std::vector<Tokens> encode_batch(const std::vector<std::string>& texts,
                                     const SpecialPolicy& policy = SpecialPolicy::none()) const;

    // Stable prefix tokens plus every token sequence the withheld tail could
    // turn into once more text is appended.
    UnstableEncoding encode_with_unstable(std::string_view text,
                                          const SpecialPolicy& policy = SpecialPolicy::none()) const;

    // Exact table hit, ordinary first then special. Throws Error otherwise.
    Rank encode_single_token(std::string_view bytes) const;

    // Byte-pair merge of `bytes` as one piece, no segmentation.
    Tokens encode_single_piece(std::string_view bytes) const;

    // ---- decode ----

    Bytes decode_bytes(const Tokens& tokens) const;
    std::string decode(const Tokens& tokens, DecodeMode mode = DecodeMode::strict) const;
    std::vector<std::string> decode_batch(const std::vector<Tokens>& batch,
                                          DecodeMode mode = DecodeMode::strict) const;
    Bytes decode_single_token_bytes(Rank token) const;
    std::vector<Bytes> decode_tokens_bytes(const Tokens& tokens) const;

    const std::vector<Bytes>& token_byte_values() const { return table_.sorted_token_bytes(); }

    // ---- split cache ----

    CacheStats cache_stats() const { return cache_.stats(); }
    void clear_cache() const { cache_.clear(); }

    const BatchDriver& batch_driver() const { return driver_; }

private:
    // Tokens of `text`, and how many of them the last ordinary piece produced.
    std::pair<Tokens, std::size_t> encode_native(std::string_view text, const SpecialPolicy& policy) const;
    void encode_piece(std::string_view piece, Tokens& out) const;
    std::size_t increase_last_piece_token_len(const Tokens& tokens, std::size_t last_piece_token_len) const;

    std::string name_;
    std::string pattern_;
    RankTable table_;
    Segmenter segmenter_;
    SplitCache cache_;
    BatchDriver driver_;
    Rank max_token_value_ = 0;
};

} // namespace tokenrank
