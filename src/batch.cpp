#include "tokenrank/batch.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace tokenrank {

BatchDriver::BatchDriver(std::size_t threads) : threads_(threads) {
    if (threads_ == 0) {
        threads_ = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
}

void BatchDriver::run(std::size_t count, const std::function<void(std::size_t)>& fn) const {
    if (count == 0) {
        return;
    }
    std::size_t workers = std::min(threads_, count);
    if (workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<std::size_t> next_idx{0};
    std::atomic<bool> had_error{false};
    std::exception_ptr first_err;
    std::mutex err_mu;

    auto worker = [&]() {
        while (!had_error.load(std::memory_order_relaxed)) {
            std::size_t i = next_idx.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
                return;
            }
            try {
                fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(err_mu);
                if (!first_err) {
                    first_err = std::current_exception();
                }
                had_error.store(true, std::memory_order_relaxed);
                return;
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    bool spawn_failed = false;
    try {
        for (std::size_t t = 0; t < workers; ++t) {
            pool.emplace_back(worker);
        }
    } catch (const std::system_error&) {
        // Out of threads: the caller works alongside the workers already started.
        spawn_failed = true;
    }
    if (spawn_failed) {
        worker();
    }
    for (auto& th : pool) {
        th.join();
    }
    if (first_err) {
        std::rethrow_exception(first_err);
    }
}

} // namespace tokenrank
