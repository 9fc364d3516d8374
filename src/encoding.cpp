#include "tokenrank/encoding.hpp"

#include <algorithm>
#include <cstdio>

#include "tokenrank/byte_pair.hpp"
#include "tokenrank/errors.hpp"
#include "tokenrank/utf8.hpp"

namespace tokenrank {

namespace {

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string printable(std::string_view bytes) {
    if (is_valid_utf8(bytes)) {
        return "'" + std::string(bytes) + "'";
    }
    std::string out = "0x";
    char buf[3];
    for (unsigned char c : bytes) {
        std::snprintf(buf, sizeof(buf), "%02X", c);
        out += buf;
    }
    return out;
}

std::vector<Bytes>::const_iterator first_with_prefix(const std::vector<Bytes>& sorted, std::string_view prefix) {
    return std::lower_bound(sorted.begin(), sorted.end(), prefix,
                            [](const Bytes& a, std::string_view b) { return std::string_view(a) < b; });
}

} // namespace

Encoding::Encoding(EncodingSpec spec, const Config& cfg)
    : name_(std::move(spec.name)),
      pattern_(spec.pattern),
      table_(std::move(spec.mergeable_ranks), std::move(spec.special_tokens)),
      segmenter_(std::move(spec.pattern), table_.special_literals()),
      cache_(cfg.cache_shards, cfg.cache_max_entries),
      driver_(cfg.threads),
      max_token_value_(table_.max_token_value()) {
    if (spec.explicit_n_vocab) {
        std::size_t n = *spec.explicit_n_vocab;
        if (table_.size() + table_.special_size() != n) {
            throw ConfigError("encoding '" + name_ + "': expected " + std::to_string(n) + " tokens, table has " +
                              std::to_string(table_.size() + table_.special_size()));
        }
        if (static_cast<std::size_t>(max_token_value_) + 1 != n) {
            throw ConfigError("encoding '" + name_ + "': max token value " + std::to_string(max_token_value_) +
                              " does not match n_vocab " + std::to_string(n));
        }
    }
}

std::optional<Rank> Encoding::eot_token() const {
    Rank r = table_.special_rank_of("<|endoftext|>");
    if (r == kNoRank) {
        return std::nullopt;
    }
    return r;
}

std::unordered_set<std::string> Encoding::special_tokens_set() const {
    std::unordered_set<std::string> out;
    for (const auto& kv : table_.special_tokens()) {
        out.insert(kv.first);
    }
    return out;
}

void Encoding::encode_piece(std::string_view piece, Tokens& out) const {
    Rank whole = table_.rank_of(piece);
    if (whole != kNoRank) {
        out.push_back(whole);
        return;
    }
    if (!cache_.enabled()) {
        Tokens ranks = byte_pair_encode(piece, table_.encoder());
        out.insert(out.end(), ranks.begin(), ranks.end());
        return;
    }
    cache_.get_or_compute(piece, out, [this](std::string_view p) { return byte_pair_encode(p, table_.encoder()); });
}

std::pair<Tokens, std::size_t> Encoding::encode_native(std::string_view text, const SpecialPolicy& policy) const {
    Tokens out;
    out.reserve(text.size() / 3 + 1);
    std::size_t last_piece_token_len = 0;
    for (const auto& seg : segmenter_.partition(text, policy)) {
        if (seg.kind == Segment::Kind::special) {
            out.push_back(table_.special_rank_of(seg.text));
            last_piece_token_len = 0;
            continue;
        }
        std::size_t pos = 0;
        std::string_view piece;
        while (segmenter_.split_pattern().next_piece(seg.text, pos, piece)) {
            std::size_t before = out.size();
            encode_piece(piece, out);
            last_piece_token_len = out.size() - before;
        }
    }
    return {std::move(out), last_piece_token_len};
}

Tokens Encoding::encode_ordinary(std::string_view text) const {
    Tokens out;
    out.reserve(text.size() / 3 + 1);
    std::size_t pos = 0;
    std::string_view piece;
    while (segmenter_.split_pattern().next_piece(text, pos, piece)) {
        encode_piece(piece, out);
    }
    return out;
}

Tokens Encoding::encode(std::string_view text, const SpecialPolicy& policy) const {
    return encode_native(text, policy).first;
}

std::vector<Tokens> Encoding::encode_ordinary_batch(const std::vector<std::string>& texts) const {
    std::vector<Tokens> out(texts.size());
    driver_.run(texts.size(), [&](std::size_t i) { out[i] = encode_ordinary(texts[i]); });
    return out;
}

std::vector<Tokens> Encoding::encode_batch(const std::vector<std::string>& texts, const SpecialPolicy& policy) const {
    std::vector<Tokens> out(texts.size());
    driver_.run(texts.size(), [&](std::size_t i) { out[i] = encode(texts[i], policy); });
    return out;
}

std::size_t Encoding::increase_last_piece_token_len(const Tokens& tokens, std::size_t last_piece_token_len) const {
    auto is_whitespace_token = [this](Rank t) {
        const Bytes* b = table_.bytes_of(t);
        if (b == nullptr) {
            return false;
        }
        return std::all_of(b->begin(), b->end(), [](char c) { return c == ' ' || c == '\n' || c == '\t'; });
    };
    if (last_piece_token_len > 0 && is_whitespace_token(tokens[tokens.size() - last_piece_token_len])) {
        while (last_piece_token_len < tokens.size() &&
               is_whitespace_token(tokens[tokens.size() - last_piece_token_len - 1])) {
            ++last_piece_token_len;
        }
    }
    return last_piece_token_len;
}

UnstableEncoding Encoding::encode_with_unstable(std::string_view text, const SpecialPolicy& policy) const {
    auto [tokens, last_piece_token_len] = encode_native(text, policy);
    UnstableEncoding result;
    if (last_piece_token_len == 0) {
        result.tokens = std::move(tokens);
        return result;
    }
    last_piece_token_len = increase_last_piece_token_len(tokens, last_piece_token_len);

    Tokens tail(tokens.end() - static_cast<std::ptrdiff_t>(last_piece_token_len), tokens.end());
    Bytes unstable = decode_bytes(tail);
    tokens.resize(tokens.size() - last_piece_token_len);
    result.tokens = std::move(tokens);
    if (unstable.empty()) {
        return result;
    }

    const auto& sorted = table_.sorted_token_bytes();
    const EncoderMap& ranks = table_.encoder();

    // Single tokens that extend the whole unstable tail.
    for (auto it = first_with_prefix(sorted, unstable); it != sorted.end() && starts_with(*it, unstable); ++it) {
        result.completions.insert(Tokens{ranks.find(*it)->second});
    }

    // Tokens that extend a suffix of the tail, re-merged with the prefix.
    for (std::size_t i = 1; i < unstable.size(); ++i) {
        std::string_view prefix = std::string_view(unstable).substr(0, i);
        std::string_view suffix = std::string_view(unstable).substr(i);
        for (auto it = first_with_prefix(sorted, suffix); it != sorted.end() && starts_with(*it, suffix); ++it) {
            Bytes possibility = Bytes(prefix) + *it;
            Tokens encoded = is_valid_utf8(possibility) ? encode_ordinary(possibility)
                                                        : byte_pair_encode(possibility, ranks);
            Tokens seq;
            std::size_t seq_len = 0;
            for (Rank t : encoded) {
                seq.push_back(t);
                seq_len += table_.bytes_of(t)->size();
                if (seq_len >= unstable.size()) {
                    break;
                }
            }
            result.completions.insert(std::move(seq));
        }
    }

    // A trailing whitespace character may split off into its own piece.
    if (unstable.size() > 1) {
        std::uint32_t cp = 0;
        std::size_t n = last_codepoint(unstable, cp);
        if (n > 0 && n < unstable.size() && is_unicode_whitespace(cp)) {
            std::string_view head = std::string_view(unstable).substr(0, unstable.size() - n);
            std::string_view last = std::string_view(unstable).substr(unstable.size() - n);
            Tokens reencoded = byte_pair_encode(head, ranks);
            Tokens last_tokens = byte_pair_encode(last, ranks);
            reencoded.insert(reencoded.end(), last_tokens.begin(), last_tokens.end());
            result.completions.insert(std::move(reencoded));
        }
    }
    return result;
}

Rank Encoding::encode_single_token(std::string_view bytes) const {
    Rank r = table_.rank_of(bytes);
    if (r != kNoRank) {
        return r;
    }
    r = table_.special_rank_of(bytes);
    if (r != kNoRank) {
        return r;
    }
    throw Error("could not encode " + printable(bytes) + " as a single token");
}

Tokens Encoding::encode_single_piece(std::string_view bytes) const {
    Rank r = table_.rank_of(bytes);
    if (r != kNoRank) {
        return Tokens{r};
    }
    return byte_pair_encode(bytes, table_.encoder());
}

Bytes Encoding::decode_bytes(const Tokens& tokens) const {
    Bytes out;
    out.reserve(tokens.size() * 2);
    for (Rank t : tokens) {
        const Bytes* b = table_.token_bytes(t);
        if (b == nullptr) {
            throw DecodeError::unknown_rank(t);
        }
        out += *b;
    }
    return out;
}

std::string Encoding::decode(const Tokens& tokens, DecodeMode mode) const {
    Bytes bytes = decode_bytes(tokens);
    if (mode == DecodeMode::replace) {
        return to_utf8_lossy(bytes);
    }
    std::size_t bad = find_invalid_utf8(bytes);
    if (bad != std::string::npos) {
        throw DecodeError::invalid_utf8(bad);
    }
    return bytes;
}

std::vector<std::string> Encoding::decode_batch(const std::vector<Tokens>& batch, DecodeMode mode) const {
    std::vector<std::string> out(batch.size());
    driver_.run(batch.size(), [&](std::size_t i) { out[i] = decode(batch[i], mode); });
    return out;
}

Bytes Encoding::decode_single_token_bytes(Rank token) const {
    const Bytes* b = table_.token_bytes(token);
    if (b == nullptr) {
        throw DecodeError::unknown_rank(token);
    }
    return *b;
}

std::vector<Bytes> Encoding::decode_tokens_bytes(const Tokens& tokens) const {
    std::vector<Bytes> out;
    out.reserve(tokens.size());
    for (Rank t : tokens) {
        out.push_back(decode_single_token_bytes(t));
    }
    return out;
}

} // namespace tokenrank
