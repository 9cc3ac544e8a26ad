#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <functional>

namespace transdist {

/**
 * @brief Degree of parallelism for the data-parallel stages.
 *
 * Sequential unless `use_parallel` is set. `num_workers == 0` selects half of
 * the available processors (at least one).
 */
struct ParallelConfig {
    bool use_parallel = false;
    int num_workers = 0;
};

/**
 * @class WorkerPool
 * @brief Runs independent indexed tasks, sequentially or on OpenMP threads.
 *
 * Tasks must only write to their own output slot. If any task throws, the
 * remaining tasks still run and the exception of the lowest failing index is
 * rethrown on the calling thread once all tasks have finished.
 */
class WorkerPool {
public:
    /** @throws InvalidParameterException if `config.num_workers` is negative. */
    explicit WorkerPool(const ParallelConfig& config = ParallelConfig{});

    static WorkerPool sequential() { return WorkerPool(); }

    bool isParallel() const { return use_parallel_ && num_workers_ > 1; }
    int getNumWorkers() const { return num_workers_; }

    /**
     * @brief The pool nested stages should use: sequential when this pool is
     * parallel, so that outer and inner stages do not oversubscribe.
     */
    WorkerPool nested() const;

    void forEach(int n, const std::function<void(int)>& task) const;

    /** @return Half of the processors reported by OpenMP, at least 1. */
    static int defaultWorkerCount();

private:
    bool use_parallel_;
    int num_workers_;
};

} // namespace transdist

#endif // WORKER_POOL_HPP
