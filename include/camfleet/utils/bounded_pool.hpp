/**
 * @file bounded_pool.hpp
 * @brief Parallel-for with a hard cap on in-flight work items.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace camfleet {
namespace utils {

/**
 * @class ThreadGroup
 * @brief Owns a set of threads and joins them on destruction, including
 * during stack unwinding.
 */
class ThreadGroup {
public:
    ThreadGroup() = default;
    ~ThreadGroup() { joinAll(); }

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    /// @throws std::system_error if the thread cannot be started.
    template <typename F>
    void spawn(F&& f) {
        threads_.emplace_back(std::forward<F>(f));
    }

    void joinAll() {
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        threads_.clear();
    }

    size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

/**
 * @brief Invoke fn(i) for every i in [0, count) on at most @p maxInFlight threads.
 *
 * Workers pull indices from a shared counter. An exception from one item is
 * logged under @p component and does not affect the others. When @p running
 * is given, workers stop taking new items once it reads false. If the system
 * refuses to start more threads, the ones already running drain the queue,
 * and the caller's thread does the work when none could be started.
 *
 * @code
 * parallelFor(hosts.size(), 50, [&](size_t i) { probe(hosts[i]); });
 * @endcode
 */
template <typename Fn>
void parallelFor(size_t count, size_t maxInFlight, Fn&& fn,
                 const std::string& component = "Pool",
                 const std::atomic<bool>* running = nullptr) {
    if (count == 0) {
        return;
    }

    const size_t workers = std::max<size_t>(1, std::min(count, maxInFlight));
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            if (running != nullptr && !running->load()) {
                return;
            }
            size_t index = next.fetch_add(1);
            if (index >= count) {
                return;
            }
            try {
                fn(index);
            } catch (const std::exception& e) {
                LOG_WARN(component, "Work item {} failed: {}", index, e.what());
            }
        }
    };

    ThreadGroup group;
    for (size_t i = 0; i < workers; ++i) {
        try {
            group.spawn(worker);
        } catch (const std::system_error& e) {
            LOG_WARN(component, "Started {} of {} workers: {}", i, workers, e.what());
            break;
        }
    }
    if (group.size() == 0) {
        worker();
    }
    group.joinAll();
}

}  // namespace utils
}  // namespace camfleet
