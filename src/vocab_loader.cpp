#include "tokenrank/vocab_loader.hpp"

#include <array>
#include <cstdint>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "tokenrank/utf8.hpp"
#include "tokenrank/vocab_source.hpp"

namespace tokenrank {

namespace {

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

bool parse_rank(std::string_view s, Rank& out) {
    if (s.empty()) {
        return false;
    }
    std::uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        v = v * 10 + static_cast<std::uint64_t>(c - '0');
        if (v >= kNoRank) {
            return false;
        }
    }
    out = static_cast<Rank>(v);
    return true;
}

// GPT-2 maps each byte to a printable character: printable Latin-1 bytes map
// to themselves, the rest to U+0100 upwards in byte order.
struct DataGymByteMap {
    std::array<unsigned char, 256> rank_to_byte{};
    std::unordered_map<std::uint32_t, unsigned char> char_to_byte;

    DataGymByteMap() {
        std::size_t n = 0;
        std::array<bool, 256> printable{};
        for (unsigned b = 0; b < 256; ++b) {
            printable[b] = (b >= 0x21 && b <= 0x7E) || (b >= 0xA1 && b <= 0xAC) || (b >= 0xAE);
            if (printable[b]) {
                rank_to_byte[n++] = static_cast<unsigned char>(b);
                char_to_byte[b] = static_cast<unsigned char>(b);
            }
        }
        std::uint32_t shifted = 0;
        for (unsigned b = 0; b < 256; ++b) {
            if (!printable[b]) {
                rank_to_byte[n++] = static_cast<unsigned char>(b);
                char_to_byte[256 + shifted] = static_cast<unsigned char>(b);
                ++shifted;
            }
        }
    }

    bool decode(std::string_view s, Bytes& out) const {
        out.clear();
        std::size_t i = 0;
        while (i < s.size()) {
            std::uint32_t cp = 0;
            if (!next_codepoint(s, i, cp)) {
                return false;
            }
            auto it = char_to_byte.find(cp);
            if (it == char_to_byte.end()) {
                return false;
            }
            out.push_back(static_cast<char>(it->second));
        }
        return true;
    }
};

const DataGymByteMap& data_gym_byte_map() {
    static const DataGymByteMap map;
    return map;
}

} // namespace

bool decode_base64(std::string_view in, std::string& out) {
    out.clear();
    out.reserve(in.size() * 3 / 4);
    std::uint32_t buf = 0;
    int bits = 0;
    std::size_t padding = 0;
    for (char c : in) {
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return false;
        }
        int v = base64_value(c);
        if (v < 0) {
            return false;
        }
        buf = (buf << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buf >> bits) & 0xFF));
        }
    }
    return padding <= 2 && (in.size() % 4 == 0 || padding == 0);
}

bool load_tiktoken_bpe(std::string_view contents, EncoderMap& out, std::string& err) {
    out.clear();
    std::size_t line_no = 0;
    std::size_t pos = 0;
    while (pos < contents.size()) {
        std::size_t nl = contents.find('\n', pos);
        std::string_view line = contents.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        pos = nl == std::string_view::npos ? contents.size() : nl + 1;
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }
        std::size_t sp = line.find(' ');
        if (sp == std::string_view::npos) {
            err = "line " + std::to_string(line_no) + ": expected '<base64> <rank>'";
            return false;
        }
        Bytes token;
        if (!decode_base64(line.substr(0, sp), token)) {
            err = "line " + std::to_string(line_no) + ": invalid base64";
            return false;
        }
        Rank rank = 0;
        if (!parse_rank(line.substr(sp + 1), rank)) {
            err = "line " + std::to_string(line_no) + ": invalid rank";
            return false;
        }
        if (!out.emplace(std::move(token), rank).second) {
            err = "line " + std::to_string(line_no) + ": duplicate token";
            return false;
        }
    }
    return true;
}

bool data_gym_to_mergeable_bpe_ranks(std::string_view vocab_bpe, std::string_view encoder_json, EncoderMap& out,
                                     std::string& err) {
    const auto& map = data_gym_byte_map();
    out.clear();
    Rank n = 0;
    for (unsigned char b : map.rank_to_byte) {
        out.emplace(Bytes(1, static_cast<char>(b)), n++);
    }

    // First line is a version header.
    std::size_t pos = vocab_bpe.find('\n');
    pos = pos == std::string_view::npos ? vocab_bpe.size() : pos + 1;
    std::size_t line_no = 1;
    Bytes first;
    Bytes second;
    while (pos < vocab_bpe.size()) {
        std::size_t nl = vocab_bpe.find('\n', pos);
        std::string_view line = vocab_bpe.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        pos = nl == std::string_view::npos ? vocab_bpe.size() : nl + 1;
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }
        std::size_t sp = line.find(' ');
        if (sp == std::string_view::npos || line.find(' ', sp + 1) != std::string_view::npos) {
            err = "vocab.bpe line " + std::to_string(line_no) + ": expected two symbols";
            return false;
        }
        if (!map.decode(line.substr(0, sp), first) || !map.decode(line.substr(sp + 1), second)) {
            err = "vocab.bpe line " + std::to_string(line_no) + ": symbol outside the byte alphabet";
            return false;
        }
        out.emplace(first + second, n++);
    }

    auto j = nlohmann::json::parse(encoder_json.begin(), encoder_json.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        err = "encoder.json is not a JSON object";
        return false;
    }
    j.erase("<|endoftext|>");
    j.erase("<|startoftext|>");
    if (j.size() != out.size()) {
        err = "encoder.json has " + std::to_string(j.size()) + " entries, vocab.bpe implies " +
              std::to_string(out.size());
        return false;
    }
    Bytes token;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number_unsigned() || !map.decode(it.key(), token)) {
            err = "encoder.json entry '" + it.key() + "' is malformed";
            return false;
        }
        auto found = out.find(token);
        if (found == out.end() || found->second != it.value().get<Rank>()) {
            err = "encoder.json disagrees with vocab.bpe at '" + it.key() + "'";
            return false;
        }
    }
    return true;
}

bool load_tiktoken_bpe_file(const std::string& blob_path, const std::string& cache_dir, EncoderMap& out,
                            std::string& err, int timeout_sec) {
    std::string contents;
    if (!read_file_cached(blob_path, cache_dir, contents, err, timeout_sec)) {
        return false;
    }
    if (!load_tiktoken_bpe(contents, out, err)) {
        err = blob_path + ": " + err;
        return false;
    }
    return true;
}

bool load_data_gym_files(const std::string& vocab_bpe_path, const std::string& encoder_json_path,
                         const std::string& cache_dir, EncoderMap& out, std::string& err,
                         int timeout_sec) {
    std::string vocab_bpe;
    std::string encoder_json;
    if (!read_file_cached(vocab_bpe_path, cache_dir, vocab_bpe, err, timeout_sec) ||
        !read_file_cached(encoder_json_path, cache_dir, encoder_json, err, timeout_sec)) {
        return false;
    }
    return data_gym_to_mergeable_bpe_ranks(vocab_bpe, encoder_json, out, err);
}

} // namespace tokenrank
