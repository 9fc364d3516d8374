#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace tokenrank {

struct Config {
    std::size_t threads = 0; // 0 -> hardware concurrency
    std::size_t cache_shards = 64;
    std::size_t cache_max_entries = std::size_t(1) << 20; // 0 -> no split cache
    std::string vocab_cache_dir;                         // empty -> no vocab file caching
    int http_timeout_sec = 60;

    // Defaults, then TOKENRANK_ENV_FILE (or `env_path` when given), then the
    // process environment.
    static Config from_environment(const std::string& env_path = {});
};

std::unordered_map<std::string, std::string> read_env_file(const std::string& path);
void apply_env_overrides(Config& cfg, const std::unordered_map<std::string, std::string>& env);

// Snapshot of the process environment restricted to keys this library reads.
std::unordered_map<std::string, std::string> read_process_env();

// TIKTOKEN_CACHE_DIR, else DATA_GYM_CACHE_DIR, else <temp>/data-gym-cache.
// An explicitly empty variable yields an empty string (caching off).
std::string default_vocab_cache_dir(const std::unordered_map<std::string, std::string>& env);

} // namespace tokenrank
