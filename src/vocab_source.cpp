#include "tokenrank/vocab_source.hpp"

#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>

#include <unistd.h>

#include <httplib.h>
#include <openssl/evp.h>

namespace tokenrank {

namespace {

struct ParsedHttpUrl {
    bool https = false;
    std::string host;
    int port = 80;
    std::string target = "/";
};

bool starts_with_case_insensitive(const std::string& value, const std::string& prefix) {
    if (value.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(value[i])));
        char b = static_cast<char>(std::tolower(static_cast<unsigned char>(prefix[i])));
        if (a != b) {
            return false;
        }
    }
    return true;
}

std::string percent_decode(const std::string& value) {
    auto from_hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + c - 'a';
        if (c >= 'A' && c <= 'F') return 10 + c - 'A';
        return -1;
    };
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = from_hex(value[i + 1]);
            int lo = from_hex(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

std::string decode_file_url(const std::string& value) {
    std::string rest = value.substr(7);
    if (starts_with_case_insensitive(rest, "localhost/")) {
        rest = rest.substr(9);
    }
    return percent_decode(rest);
}

bool parse_http_url(const std::string& url, ParsedHttpUrl& parsed) {
    parsed = {};
    std::size_t scheme_len = 0;
    if (starts_with_case_insensitive(url, "https://")) {
        parsed.https = true;
        parsed.port = 443;
        scheme_len = 8;
    } else if (starts_with_case_insensitive(url, "http://")) {
        scheme_len = 7;
    } else {
        return false;
    }

    std::size_t path_start = url.find_first_of("/?#", scheme_len);
    std::string authority = path_start == std::string::npos ? url.substr(scheme_len)
                                                            : url.substr(scheme_len, path_start - scheme_len);
    if (authority.empty()) {
        return false;
    }
    std::size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(':') == colon) {
        parsed.host = authority.substr(0, colon);
        try {
            parsed.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            return false;
        }
    } else {
        parsed.host = authority;
    }
    if (parsed.host.empty()) {
        return false;
    }
    parsed.target = path_start == std::string::npos ? "/" : url.substr(path_start);
    return true;
}

bool download_http(const std::string& url, std::string& body, std::string& err, int timeout_sec) {
    ParsedHttpUrl parsed;
    if (!parse_http_url(url, parsed)) {
        err = "failed to parse URL: " + url;
        return false;
    }

    auto fetch_with_client = [&](auto& client) -> bool {
        client.set_follow_location(true);
        client.set_keep_alive(false);
        client.set_connection_timeout(timeout_sec);
        client.set_read_timeout(timeout_sec);
        client.set_write_timeout(timeout_sec);

        httplib::Headers headers = {{"User-Agent", "tokenrank/0.1"}};
        auto res = client.Get(parsed.target.c_str(), headers);
        if (!res) {
            err = "HTTP request failed: " + url + " (error=" + std::to_string(static_cast<int>(res.error())) + ")";
            return false;
        }
        if (res->status < 200 || res->status >= 300) {
            err = "HTTP GET failed with status " + std::to_string(res->status) + ": " + url;
            return false;
        }
        body = std::move(res->body);
        return true;
    };

    if (parsed.https) {
        httplib::SSLClient client(parsed.host, parsed.port);
        return fetch_with_client(client);
    }
    httplib::Client client(parsed.host, parsed.port);
    return fetch_with_client(client);
}

bool read_local_file(const std::string& path, std::string& out, std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        err = "failed to open " + path;
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        err = "failed to read " + path;
        return false;
    }
    out = oss.str();
    return true;
}

std::string unique_tmp_suffix() {
    static std::atomic<std::uint64_t> counter{0};
    std::ostringstream oss;
    oss << '.' << ::getpid() << '.' << std::hash<std::thread::id>{}(std::this_thread::get_id()) << '.'
        << counter.fetch_add(1, std::memory_order_relaxed) << ".tmp";
    return oss.str();
}

} // namespace

bool write_cache_file(const std::filesystem::path& path, const std::string& data, std::string& err) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        err = "failed to create cache dir: " + path.parent_path().string();
        return false;
    }
    std::filesystem::path tmp = path;
    tmp += unique_tmp_suffix();
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            err = "failed to create cache file: " + tmp.string();
            return false;
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out) {
            std::filesystem::remove(tmp, ec);
            err = "failed to write cache file: " + tmp.string();
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        err = "failed to move cache file into place: " + path.string();
        return false;
    }
    return true;
}

bool is_remote_http_url(const std::string& value) {
    return starts_with_case_insensitive(value, "http://") || starts_with_case_insensitive(value, "https://");
}

bool is_file_url(const std::string& value) { return starts_with_case_insensitive(value, "file://"); }

std::string cache_file_name(const std::string& blob_path) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_Digest(blob_path.data(), blob_path.size(), digest, &digest_len, EVP_sha256(), nullptr);
    std::string out;
    out.reserve(digest_len * 2);
    char buf[3];
    for (unsigned int i = 0; i < digest_len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02X", digest[i]);
        out += buf;
    }
    return out;
}

bool read_file_cached(const std::string& blob_path, const std::string& cache_dir, std::string& out, std::string& err,
                      int timeout_sec) {
    if (!is_remote_http_url(blob_path)) {
        std::string path = is_file_url(blob_path) ? decode_file_url(blob_path) : blob_path;
        return read_local_file(path, out, err);
    }

    if (cache_dir.empty()) {
        return download_http(blob_path, out, err, timeout_sec);
    }

    std::filesystem::path cache_path = std::filesystem::path(cache_dir) / cache_file_name(blob_path);
    std::error_code ec;
    if (std::filesystem::exists(cache_path, ec)) {
        std::string ignored;
        if (read_local_file(cache_path.string(), out, ignored)) {
            return true;
        }
    }

    if (!download_http(blob_path, out, err, timeout_sec)) {
        return false;
    }
    std::string write_err;
    if (!write_cache_file(cache_path, out, write_err)) {
        err = "vocab cache not written: " + write_err;
    }
    return true;
}

} // namespace tokenrank
