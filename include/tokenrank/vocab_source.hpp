#pragma once

#include <filesystem>
#include <string>

namespace tokenrank {

bool is_remote_http_url(const std::string& value);
bool is_file_url(const std::string& value);

// Uppercase hex SHA-256 of the blob path.
std::string cache_file_name(const std::string& blob_path);

// Writes `data` to a temp file unique to this writer beside `path`, then
// renames it over `path`. Concurrent writers each publish a complete file.
bool write_cache_file(const std::filesystem::path& path, const std::string& data, std::string& err);

// Reads a local path, file:// URL or http(s) URL. Remote content is kept
// under cache_dir/cache_file_name(blob_path) and reused on later calls; an
// empty cache_dir disables that. A download whose cache copy could not be
// written still returns true, with the reason left in `err`.
bool read_file_cached(const std::string& blob_path, const std::string& cache_dir, std::string& out, std::string& err,
                      int timeout_sec = 60);

} // namespace tokenrank
