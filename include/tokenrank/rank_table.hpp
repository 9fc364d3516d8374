#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tokenrank/types.hpp"

namespace tokenrank {

// Immutable bidirectional mapping between byte sequences and ranks, plus the
// reserved special-token literals. Construction validates that every single
// byte has a rank, that ordinary ranks are unique, and that no special rank
// collides with an ordinary one; any violation throws ConfigError.
class RankTable {
public:
    RankTable(EncoderMap encoder, SpecialMap special_tokens);

    const EncoderMap& encoder() const { return encoder_; }
    const SpecialMap& special_tokens() const { return special_; }

    std::size_t size() const { return encoder_.size(); }
    std::size_t special_size() const { return special_.size(); }

    Rank byte_rank(unsigned char b) const { return byte_ranks_[b]; }

    // kNoRank when absent.
    Rank rank_of(std::string_view bytes) const;
    Rank special_rank_of(std::string_view literal) const;

    // nullptr when absent.
    const Bytes* bytes_of(Rank rank) const;
    const std::string* special_literal_of(Rank rank) const;

    // Ordinary range first, then special range.
    const Bytes* token_bytes(Rank rank) const;

    bool is_special(Rank rank) const { return special_decoder_.count(rank) != 0; }

    Rank max_token_value() const { return max_token_value_; }

    // All ordinary token byte strings in lexicographic byte order.
    const std::vector<Bytes>& sorted_token_bytes() const { return sorted_token_bytes_; }

    std::vector<std::string> special_literals() const;

private:
    EncoderMap encoder_;
    std::unordered_map<Rank, Bytes> decoder_;
    SpecialMap special_;
    std::unordered_map<Rank, std::string> special_decoder_;
    std::array<Rank, 256> byte_ranks_{};
    std::vector<Bytes> sorted_token_bytes_;
    Rank max_token_value_ = 0;
};

} // namespace tokenrank
