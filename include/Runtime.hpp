#ifndef RUNTIME_HPP
#define RUNTIME_HPP

#include "PolarMesh.hpp"
#include "SimulationConfig.hpp"
#include "WorkerPool.hpp"
#include <iostream>
#include <sstream>
#include <utility>

namespace Kilonova {

/// Execution context of a run: owns the worker pool and the console.
class Runtime {
public:
    /// numThreads = 0 selects the OpenMP default.
    explicit Runtime(int numThreads = 0, bool quiet = false);

    // Non-copyable, non-movable (the pool is shared by reference)
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    const WorkerPool& pool() const { return pool_; }
    int numThreads() const { return pool_.numThreads(); }

    // --- Mesh creation ---
    PolarMesh createMesh(const SimulationConfig& config);

    // --- Console output ---
    template <typename... Args>
    void print(Args&&... args) {
        if (quiet_) return;
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        std::cout << oss.str();
    }

private:
    WorkerPool pool_;
    bool quiet_;
};

} // namespace Kilonova

#endif // RUNTIME_HPP
