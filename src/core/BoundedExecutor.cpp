#include "pagesrestore/core/BoundedExecutor.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace pagesrestore {

std::size_t run_bounded(std::size_t count,
                        std::size_t parallelism,
                        const std::function<void(std::size_t)>& job) {
    if (parallelism < 2 || count < 2) {
        for (std::size_t index = 0; index < count; ++index) {
            job(index);
        }
        return count;
    }

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> started{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (!failed.load(std::memory_order_acquire)) {
            const auto index = next.fetch_add(1, std::memory_order_relaxed);
            if (index >= count) {
                return;
            }
            started.fetch_add(1, std::memory_order_relaxed);
            try {
                job(index);
            } catch (...) {
                std::scoped_lock lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true, std::memory_order_release);
            }
        }
    };

    const auto worker_count = std::min(parallelism, count);
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return started.load();
}

}  // namespace pagesrestore
