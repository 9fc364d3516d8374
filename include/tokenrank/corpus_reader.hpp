#pragma once

#include <functional>
#include <string>
#include <vector>

namespace tokenrank {

struct CorpusReadOptions {
    std::vector<std::string> json_text_fields = {"text", "content"};
};

// Streams text records out of .txt / .jsonl / .json files, optionally
// gzip (.gz) or xz (.xz) compressed. Plain text yields one record per line.
class CorpusReader {
public:
    explicit CorpusReader(CorpusReadOptions options = {});

    bool for_each_record(const std::string& path, const std::function<void(const std::string&)>& fn,
                         std::string& err) const;

private:
    bool read_all(const std::string& path, std::string& payload, std::string& err) const;
    void emit_json_record(const std::string& line, const std::function<void(const std::string&)>& fn) const;

    CorpusReadOptions options_;
};

} // namespace tokenrank
