#ifndef SCHEME_HPP
#define SCHEME_HPP

#include "BlockIndex.hpp"
#include "PolarMesh.hpp"
#include "SimulationConfig.hpp"
#include "SolutionState.hpp"
#include "State.hpp"
#include <vector>

namespace Kilonova {

class Hydrodynamics;
class InitialModel;
class WorkerPool;

/// Explicit finite-volume time advance on the block-decomposed polar mesh.
///
/// An elementary step runs each Runge-Kutta stage as a sequence of waves
/// over the worker pool (primitive recovery; ghost fill, reconstruction and
/// fluxes; update), separated by barriers. The step size is fixed in the
/// first stage from the run-wide maximum wave speed.
class Scheme {
public:
    explicit Scheme(const SimulationConfig& config);

    /// Perform `fold` elementary steps. The input state is left untouched;
    /// on failure nothing is returned and the exception propagates.
    SolutionState advance(const SolutionState& state,
                          const Hydrodynamics& hydro,
                          const InitialModel& model,
                          const PolarMesh& mesh,
                          const WorkerPool& pool,
                          int fold) const;

    /// One elementary step.
    SolutionState step(const SolutionState& state,
                       const Hydrodynamics& hydro,
                       const InitialModel& model,
                       const PolarMesh& mesh,
                       const WorkerPool& pool) const;

    double cfl() const { return cfl_; }
    int RKOrder() const { return RKOrder_; }

private:
    using BlockData = SolutionState::BlockData;

    struct BlockRate {
        BlockData dudt;               // rate of the volume-integrated state
        double maxWaveSpeed = 0.0;
    };

    double cfl_;
    int RKOrder_;
    BoundaryCondition innerBoundary_;
    BoundaryCondition outerBoundary_;

    /// Time derivative of every block. Runs two waves (primitive
    /// recovery, then ghost fill + fluxes) over the pool.
    std::vector<BlockRate> computeRates(const std::vector<BlockIndex>& blocks,
                                        const std::vector<BlockGeometry>& geometry,
                                        const std::vector<BlockData>& U,
                                        const Hydrodynamics& hydro,
                                        const InitialModel& model,
                                        const PolarMesh& mesh,
                                        const WorkerPool& pool,
                                        double time) const;

    /// Drop blocks that left the domain and sample new ones from the model.
    SolutionState::BlockMap refreshBlocks(SolutionState::BlockMap solution,
                                          const Hydrodynamics& hydro,
                                          const InitialModel& model,
                                          const PolarMesh& mesh,
                                          double time) const;
};

} // namespace Kilonova

#endif // SCHEME_HPP
