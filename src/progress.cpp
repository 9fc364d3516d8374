#include "tokenrank/progress.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace tokenrank {

namespace {
std::string format_duration(double seconds) {
    int sec = static_cast<int>(seconds + 0.5);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << sec / 3600 << ":" << std::setw(2) << (sec % 3600) / 60 << ":"
        << std::setw(2) << sec % 60;
    return oss.str();
}
} // namespace

ProgressTracker::ProgressTracker(std::uint64_t total_docs, const std::string& label, std::uint64_t interval_ms)
    : label_(label), total_(total_docs), interval_ms_(interval_ms) {
    start_ = std::chrono::steady_clock::now();
    last_print_ = start_;
}

void ProgressTracker::add(std::uint64_t docs, std::uint64_t tokens) {
    done_docs_.fetch_add(docs, std::memory_order_relaxed);
    done_tokens_.fetch_add(tokens, std::memory_order_relaxed);
    maybe_print(false);
}

void ProgressTracker::finish() { maybe_print(true); }

void ProgressTracker::maybe_print(bool force) {
    std::lock_guard<std::mutex> lock(print_mu_);
    auto now = std::chrono::steady_clock::now();
    if (!force) {
        auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_).count();
        if (delta < static_cast<long long>(interval_ms_)) {
            return;
        }
    }
    last_print_ = now;
    std::uint64_t docs = done_docs_.load(std::memory_order_relaxed);
    std::uint64_t tokens = done_tokens_.load(std::memory_order_relaxed);
    double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_).count();
    double doc_rate = elapsed > 0.0 ? static_cast<double>(docs) / elapsed : 0.0;
    double token_rate = elapsed > 0.0 ? static_cast<double>(tokens) / elapsed : 0.0;

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << "[" << label_ << "] docs " << docs;
    if (total_ > 0) {
        double pct = 100.0 * static_cast<double>(docs) / static_cast<double>(total_);
        oss << "/" << total_ << " (" << std::setprecision(1) << pct << "%)";
    }
    oss << " tokens " << tokens;
    if (token_rate > 0.0) {
        oss << " rate " << std::setprecision(2) << (token_rate / 1000.0) << " ktok/s";
    }
    if (total_ > docs && doc_rate > 0.0) {
        oss << " ETA " << format_duration(static_cast<double>(total_ - docs) / doc_rate);
    }
    oss << "\n";
    std::cerr << oss.str();
}

} // namespace tokenrank
