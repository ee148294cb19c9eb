#pragma once

#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace depgraph {

/// Log an exception that is dropped in favor of an earlier failure
void log_secondary_failure(std::exception_ptr) noexcept;

/**
 * @brief Invoke `fn` on every element of `rng` using up to `n_jobs` threads.
 *
 * Once any invocation throws, no further items are started. After all threads have been joined,
 * the first exception is rethrown on the calling thread and any further exceptions are logged.
 * If `n_jobs` is less than one, a default based on the hardware concurrency is used.
 */
template <typename Range, typename Func>
void parallel_run(Range&& rng, int n_jobs, Func&& fn) {
    using iterator = decltype(rng.begin());

    std::mutex                      mut;
    iterator                        next = rng.begin();
    const auto                      stop = rng.end();
    std::vector<std::exception_ptr> failures;

    // Claim the next item under the lock. Returns `stop` once there is nothing left to do.
    auto claim = [&]() -> iterator {
        std::scoped_lock lk{mut};
        if (!failures.empty() || next == stop) {
            return stop;
        }
        return next++;
    };

    auto worker = [&] {
        for (auto it = claim(); it != stop; it = claim()) {
            try {
                fn(*it);
            } catch (...) {
                std::scoped_lock lk{mut};
                failures.push_back(std::current_exception());
                return;
            }
        }
    };

    if (n_jobs < 1) {
        n_jobs = static_cast<int>(std::thread::hardware_concurrency()) + 2;
    }
    {
        std::vector<std::jthread> threads;
        threads.reserve(static_cast<std::size_t>(n_jobs));
        for (int i = 0; i < n_jobs; ++i) {
            threads.emplace_back(worker);
        }
    }

    if (failures.empty()) {
        return;
    }
    for (auto it = failures.begin() + 1; it != failures.end(); ++it) {
        log_secondary_failure(*it);
    }
    std::rethrow_exception(failures.front());
}

}  // namespace depgraph
