#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace tokenrank {

// Throttled progress lines on stderr.
class ProgressTracker {
public:
    ProgressTracker(std::uint64_t total_docs, const std::string& label, std::uint64_t interval_ms);

    void add(std::uint64_t docs, std::uint64_t tokens);
    void finish();

private:
    void maybe_print(bool force);

    std::string label_;
    std::uint64_t total_ = 0;
    std::uint64_t interval_ms_ = 1000;
    std::atomic<std::uint64_t> done_docs_{0};
    std::atomic<std::uint64_t> done_tokens_{0};
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_print_;
    std::mutex print_mu_;
};

} // namespace tokenrank
