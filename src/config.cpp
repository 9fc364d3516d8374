#include "tokenrank/config.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace tokenrank {

namespace {

const char* const kEnvKeys[] = {
    "TOKENRANK_THREADS",     "TOKENRANK_CACHE_SHARDS", "TOKENRANK_CACHE_MAX_ENTRIES",
    "TOKENRANK_HTTP_TIMEOUT", "TOKENRANK_ENV_FILE",     "TIKTOKEN_CACHE_DIR",
    "DATA_GYM_CACHE_DIR",
};

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

std::size_t parse_size(const std::string& s, std::size_t def_val) {
    if (s.empty()) {
        return def_val;
    }
    // strtoull would wrap "-1" to the largest value.
    if (s.find('-') != std::string::npos) {
        return def_val;
    }
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0') {
        return def_val;
    }
    return static_cast<std::size_t>(v);
}

} // namespace

std::unordered_map<std::string, std::string> read_env_file(const std::string& path) {
    std::unordered_map<std::string, std::string> env;
    if (path.empty()) {
        return env;
    }
    std::ifstream in(path);
    if (!in) {
        return env;
    }
    bool first_line = true;
    std::string line;
    while (std::getline(in, line)) {
        if (first_line) {
            first_line = false;
            if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
                static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
                line.erase(0, 3);
            }
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        if (trimmed.rfind("export ", 0) == 0) {
            trimmed = trim(trimmed.substr(7));
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = trim(trimmed.substr(0, eq));
        std::string val = trim(trimmed.substr(eq + 1));
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
            val = val.substr(1, val.size() - 2);
        }
        env[key] = val;
    }
    return env;
}

void apply_env_overrides(Config& cfg, const std::unordered_map<std::string, std::string>& env) {
    auto get = [&](const std::string& key) -> const std::string* {
        auto it = env.find(key);
        if (it == env.end()) {
            return nullptr;
        }
        return &it->second;
    };
    if (auto v = get("TOKENRANK_THREADS"))
        cfg.threads = parse_size(*v, cfg.threads);
    if (auto v = get("TOKENRANK_CACHE_SHARDS"))
        cfg.cache_shards = parse_size(*v, cfg.cache_shards);
    if (auto v = get("TOKENRANK_CACHE_MAX_ENTRIES"))
        cfg.cache_max_entries = parse_size(*v, cfg.cache_max_entries);
    if (auto v = get("TOKENRANK_HTTP_TIMEOUT"))
        cfg.http_timeout_sec = static_cast<int>(parse_size(*v, static_cast<std::size_t>(cfg.http_timeout_sec)));
    if (env.count("TIKTOKEN_CACHE_DIR") || env.count("DATA_GYM_CACHE_DIR"))
        cfg.vocab_cache_dir = default_vocab_cache_dir(env);
}

std::unordered_map<std::string, std::string> read_process_env() {
    std::unordered_map<std::string, std::string> env;
    for (const char* key : kEnvKeys) {
        if (const char* v = std::getenv(key)) {
            env[key] = v;
        }
    }
    return env;
}

std::string default_vocab_cache_dir(const std::unordered_map<std::string, std::string>& env) {
    auto it = env.find("TIKTOKEN_CACHE_DIR");
    if (it != env.end()) {
        return it->second;
    }
    it = env.find("DATA_GYM_CACHE_DIR");
    if (it != env.end()) {
        return it->second;
    }
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return (tmp / "data-gym-cache").string();
}

Config Config::from_environment(const std::string& env_path) {
    Config cfg;
    auto process_env = read_process_env();
    cfg.vocab_cache_dir = default_vocab_cache_dir(process_env);

    std::string path = env_path;
    if (path.empty()) {
        auto it = process_env.find("TOKENRANK_ENV_FILE");
        if (it != process_env.end()) {
            path = it->second;
        }
    }
    apply_env_overrides(cfg, read_env_file(path));
    apply_env_overrides(cfg, process_env);
    return cfg;
}

} // namespace tokenrank
