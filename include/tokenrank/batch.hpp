#pragma once

#include <cstddef>
#include <functional>

namespace tokenrank {

// Runs independent items on a fixed number of worker threads. The threads
// are started by each run() call and joined before it returns; nothing is
// kept alive between calls. Workers pull the next index from a shared
// counter; callers write results into slot i, so output order follows input
// order whatever order items finish in.
class BatchDriver {
public:
    // 0 selects std::thread::hardware_concurrency().
    explicit BatchDriver(std::size_t threads = 0);

    std::size_t threads() const { return threads_; }

    // Calls fn(i) for every i in [0, count). The first exception thrown by any
    // item stops further items from starting and is rethrown here once all
    // workers have joined. If the OS refuses to start every thread, the
    // workers that did start and the calling thread finish the items.
    void run(std::size_t count, const std::function<void(std::size_t)>& fn) const;

private:
    std::size_t threads_;
};

} // namespace tokenrank
