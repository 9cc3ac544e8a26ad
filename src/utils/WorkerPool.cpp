#include "utils/WorkerPool.hpp"
#include "exceptions/Exceptions.hpp"
#include <omp.h>
#include <algorithm>
#include <exception>
#include <string>
#include <vector>

namespace transdist {

WorkerPool::WorkerPool(const ParallelConfig& config)
    : use_parallel_(config.use_parallel), num_workers_(1)
{
    if (config.num_workers < 0) {
        THROW_INVALID_PARAM("WorkerPool::WorkerPool", "num_workers cannot be negative, got " + std::to_string(config.num_workers) + ".");
    }
    if (use_parallel_) {
        num_workers_ = config.num_workers > 0 ? config.num_workers : defaultWorkerCount();
    }
}

int WorkerPool::defaultWorkerCount() {
    return std::max(1, omp_get_num_procs() / 2);
}

WorkerPool WorkerPool::nested() const {
    if (isParallel()) {
        return sequential();
    }
    return *this;
}

void WorkerPool::forEach(int n, const std::function<void(int)>& task) const {
    if (n <= 0) return;
    std::vector<std::exception_ptr> errors(static_cast<size_t>(n));
    const bool parallel = isParallel();

    #pragma omp parallel for schedule(dynamic) num_threads(num_workers_) if(parallel)
    for (int i = 0; i < n; ++i) {
        try {
            task(i);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

} // namespace transdist
