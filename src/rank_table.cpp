#include "tokenrank/rank_table.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

#include "tokenrank/errors.hpp"

namespace tokenrank {

namespace {
std::string describe_byte(unsigned b) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", b);
    return buf;
}
} // namespace

RankTable::RankTable(EncoderMap encoder, SpecialMap special_tokens)
    : encoder_(std::move(encoder)), special_(std::move(special_tokens)) {
    byte_ranks_.fill(kNoRank);
    decoder_.reserve(encoder_.size());
    sorted_token_bytes_.reserve(encoder_.size());

    for (const auto& [bytes, rank] : encoder_) {
        if (bytes.empty()) {
            throw ConfigError("rank table contains an empty byte sequence");
        }
        if (rank == kNoRank) {
            throw ConfigError("rank " + std::to_string(rank) + " is reserved");
        }
        if (!decoder_.emplace(rank, bytes).second) {
            throw ConfigError("rank " + std::to_string(rank) +
                              " is assigned to more than one byte sequence; encoder and decoder must be inverses");
        }
        if (bytes.size() == 1) {
            byte_ranks_[static_cast<unsigned char>(bytes[0])] = rank;
        }
        sorted_token_bytes_.push_back(bytes);
        max_token_value_ = std::max(max_token_value_, rank);
    }

    for (unsigned b = 0; b < 256; ++b) {
        if (byte_ranks_[b] == kNoRank) {
            throw ConfigError("rank table has no entry for single byte " + describe_byte(b));
        }
    }

    special_decoder_.reserve(special_.size());
    for (const auto& [literal, rank] : special_) {
        if (literal.empty()) {
            throw ConfigError("special token literal must not be empty");
        }
        if (rank == kNoRank) {
            throw ConfigError("rank " + std::to_string(rank) + " is reserved");
        }
        if (decoder_.count(rank) != 0) {
            throw ConfigError("special token '" + literal + "' rank " + std::to_string(rank) +
                              " collides with an ordinary rank");
        }
        if (!special_decoder_.emplace(rank, literal).second) {
            throw ConfigError("special rank " + std::to_string(rank) + " is assigned to more than one literal");
        }
        max_token_value_ = std::max(max_token_value_, rank);
    }

    std::sort(sorted_token_bytes_.begin(), sorted_token_bytes_.end());
}

Rank RankTable::rank_of(std::string_view bytes) const {
    if (bytes.size() == 1) {
        return byte_ranks_[static_cast<unsigned char>(bytes[0])];
    }
    auto it = encoder_.find(bytes);
    return it == encoder_.end() ? kNoRank : it->second;
}

Rank RankTable::special_rank_of(std::string_view literal) const {
    auto it = special_.find(literal);
    return it == special_.end() ? kNoRank : it->second;
}

const Bytes* RankTable::bytes_of(Rank rank) const {
    auto it = decoder_.find(rank);
    return it == decoder_.end() ? nullptr : &it->second;
}

const std::string* RankTable::special_literal_of(Rank rank) const {
    auto it = special_decoder_.find(rank);
    return it == special_decoder_.end() ? nullptr : &it->second;
}

const Bytes* RankTable::token_bytes(Rank rank) const {
    if (const Bytes* b = bytes_of(rank)) {
        return b;
    }
    return special_literal_of(rank);
}

std::vector<std::string> RankTable::special_literals() const {
    std::vector<std::string> out;
    out.reserve(special_.size());
    for (const auto& [literal, rank] : special_) {
        (void)rank;
        out.push_back(literal);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace tokenrank
