#pragma once

#include <cstddef>
#include <functional>

namespace pagesrestore {

// Runs job(0) .. job(count - 1) with at most `parallelism` jobs in flight
// (values below 2 run them in order on the calling thread). Once a job
// throws, no further job is started; jobs already running are allowed to
// finish and the first exception is rethrown to the caller.
// Returns the number of jobs that were started.
std::size_t run_bounded(std::size_t count,
                        std::size_t parallelism,
                        const std::function<void(std::size_t)>& job);

}  // namespace pagesrestore
