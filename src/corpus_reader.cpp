#include "tokenrank/corpus_reader.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include <lzma.h>
#include <nlohmann/json.hpp>
#include <zlib.h>

namespace tokenrank {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool read_gz(const std::string& path, std::string& payload, std::string& err) {
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) {
        err = "failed to open " + path;
        return false;
    }
    char buf[1 << 15];
    int read_n = 0;
    while ((read_n = gzread(gz, buf, sizeof(buf))) > 0) {
        payload.append(buf, static_cast<std::size_t>(read_n));
    }
    bool ok = read_n == 0;
    gzclose(gz);
    if (!ok) {
        err = "gzip stream is corrupt: " + path;
    }
    return ok;
}

bool read_xz(const std::string& path, std::string& payload, std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        err = "failed to open " + path;
        return false;
    }
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
        err = "failed to initialise xz decoder";
        return false;
    }

    std::vector<std::uint8_t> in_buf(1 << 16);
    std::vector<std::uint8_t> out_buf(1 << 16);
    lzma_action action = LZMA_RUN;
    bool eof = false;
    bool ok = true;
    while (true) {
        if (strm.avail_in == 0 && !eof) {
            in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
            std::streamsize got = in.gcount();
            strm.next_in = in_buf.data();
            strm.avail_in = static_cast<std::size_t>(got);
            if (got == 0) {
                eof = true;
                action = LZMA_FINISH;
            }
        }
        strm.next_out = out_buf.data();
        strm.avail_out = out_buf.size();

        lzma_ret ret = lzma_code(&strm, action);
        std::size_t produced = out_buf.size() - strm.avail_out;
        payload.append(reinterpret_cast<const char*>(out_buf.data()), produced);
        if (ret == LZMA_STREAM_END) {
            break;
        }
        if (ret != LZMA_OK || (eof && strm.avail_in == 0 && produced == 0)) {
            ok = false;
            break;
        }
    }
    lzma_end(&strm);
    if (!ok) {
        err = "xz stream is corrupt: " + path;
    }
    return ok;
}

template <typename Fn>
void for_each_line(const std::string& payload, Fn&& fn) {
    std::istringstream iss(payload);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        fn(line);
    }
}

} // namespace

CorpusReader::CorpusReader(CorpusReadOptions options) : options_(std::move(options)) {}

bool CorpusReader::read_all(const std::string& path, std::string& payload, std::string& err) const {
    payload.clear();
    if (ends_with(path, ".gz")) {
        return read_gz(path, payload, err);
    }
    if (ends_with(path, ".xz")) {
        return read_xz(path, payload, err);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        err = "failed to open " + path;
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    payload = oss.str();
    return true;
}

void CorpusReader::emit_json_record(const std::string& line,
                                    const std::function<void(const std::string&)>& fn) const {
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return;
    }
    for (const auto& field : options_.json_text_fields) {
        auto it = j.find(field);
        if (it != j.end() && it->is_string()) {
            fn(it->get<std::string>());
            return;
        }
    }
}

bool CorpusReader::for_each_record(const std::string& path, const std::function<void(const std::string&)>& fn,
                                   std::string& err) const {
    std::string payload;
    if (!read_all(path, payload, err)) {
        return false;
    }

    std::string inner = path;
    if (ends_with(inner, ".gz") || ends_with(inner, ".xz")) {
        inner.resize(inner.size() - 3);
    }
    std::string ext = std::filesystem::path(inner).extension().string();

    if (ext == ".jsonl" || ext == ".ndjson") {
        for_each_line(payload, [&](const std::string& line) {
            if (!line.empty()) emit_json_record(line, fn);
        });
        return true;
    }

    if (ext == ".json") {
        auto j = nlohmann::json::parse(payload, nullptr, false);
        if (j.is_discarded()) {
            // Newline-delimited records saved as .json.
            for_each_line(payload, [&](const std::string& line) {
                if (!line.empty()) emit_json_record(line, fn);
            });
            return true;
        }
        auto emit = [&](const nlohmann::json& item) {
            if (item.is_string()) {
                fn(item.get<std::string>());
                return;
            }
            if (!item.is_object()) {
                return;
            }
            for (const auto& field : options_.json_text_fields) {
                auto it = item.find(field);
                if (it != item.end() && it->is_string()) {
                    fn(it->get<std::string>());
                    return;
                }
            }
        };
        if (j.is_array()) {
            for (const auto& item : j) {
                emit(item);
            }
        } else {
            emit(j);
        }
        return true;
    }

    for_each_line(payload, [&](const std::string& line) {
        if (!line.empty()) fn(line);
    });
    return true;
}

} // namespace tokenrank
