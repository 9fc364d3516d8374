#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tokenrank {

using Rank = std::uint32_t;

// Sentinel for "this pair is not in the table".
constexpr Rank kNoRank = std::numeric_limits<Rank>::max();

// Byte strings are carried in std::string; no UTF-8 guarantee.
using Bytes = std::string;

// Transparent hash so maps keyed by Bytes can be probed with string_view.
struct BytesHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view s) const noexcept { return std::hash<std::string_view>{}(s); }
};

template <typename V>
using BytesMap = std::unordered_map<Bytes, V, BytesHash, std::equal_to<>>;

using EncoderMap = BytesMap<Rank>;
using SpecialMap = BytesMap<Rank>;

using Tokens = std::vector<Rank>;

} // namespace tokenrank
