#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <cstddef>
#include <exception>
#include <vector>

namespace Kilonova {

/// Bounded pool of OpenMP threads that runs one task per block.
///
/// Every parallelFor call is a wave: it returns only after all tasks have
/// finished. A task that throws does not stop the others; after the
/// barrier the exception of the lowest-numbered failing task is rethrown,
/// so the reported error does not depend on thread scheduling.
class WorkerPool {
public:
    /// numThreads = 0 selects the OpenMP default (OMP_NUM_THREADS).
    explicit WorkerPool(int numThreads = 0);

    int numThreads() const { return numThreads_; }

    template <typename Task>
    void parallelFor(std::size_t count, Task&& task) const {
        std::vector<std::exception_ptr> failures(count);
        const long n = static_cast<long>(count);

        #pragma omp parallel for schedule(dynamic, 1) num_threads(numThreads_)
        for (long k = 0; k < n; ++k) {
            try {
                task(static_cast<std::size_t>(k));
            } catch (...) {
                failures[k] = std::current_exception();
            }
        }

        for (const auto& failure : failures)
            if (failure) std::rethrow_exception(failure);
    }

private:
    int numThreads_;
};

} // namespace Kilonova

#endif // WORKER_POOL_HPP
