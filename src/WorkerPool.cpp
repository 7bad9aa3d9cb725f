#include "WorkerPool.hpp"
#include "Errors.hpp"

#include <omp.h>

#include <string>

namespace Kilonova {

WorkerPool::WorkerPool(int numThreads)
    : numThreads_(numThreads)
{
    if (numThreads_ < 0)
        throw ConfigurationError("WorkerPool: numThreads must be >= 0 (got "
            + std::to_string(numThreads_) + ")");
    if (numThreads_ == 0)
        numThreads_ = omp_get_max_threads();
}

} // namespace Kilonova
