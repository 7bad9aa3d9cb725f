#ifndef SOLUTION_STATE_HPP
#define SOLUTION_STATE_HPP

#include "BlockIndex.hpp"
#include "State.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace Kilonova {

class BlockGeometry;
class Hydrodynamics;
class InitialModel;
class PolarMesh;

/// Complete simulation state: the clock plus one array of volume-integrated
/// conserved quantities per active block.
///
/// Block arrays are indexed as BlockGeometry::index(i, j). A state is never
/// modified after construction; Scheme::advance builds its successor.
class SolutionState {
public:
    using BlockData = std::vector<ConservedState>;
    using BlockMap = std::map<BlockIndex, BlockData>;

    SolutionState() = default;
    SolutionState(std::uint64_t iteration, double time, BlockMap solution);

    /// Sample the model at every cell center of every block active at
    /// startTime and convert to conserved totals.
    static SolutionState fromModel(const InitialModel& model,
                                   const Hydrodynamics& hydro,
                                   const PolarMesh& mesh,
                                   double startTime = 0.0);

    /// Conserved totals of one block sampled from the model.
    static BlockData sampleBlock(const InitialModel& model,
                                 const Hydrodynamics& hydro,
                                 const BlockGeometry& geometry,
                                 double time);

    std::uint64_t iteration() const { return iteration_; }
    double time() const { return time_; }

    const BlockMap& solution() const { return solution_; }

    /// Throws std::out_of_range for a block that is not present.
    const BlockData& block(BlockIndex index) const;
    bool contains(BlockIndex index) const { return solution_.count(index) != 0; }

    std::size_t numBlocks() const { return solution_.size(); }
    std::size_t totalZones() const;

    /// Sum of every conserved component over all cells, in block order.
    ConservedState totals() const;

private:
    std::uint64_t iteration_ = 0;
    double time_ = 0.0;
    BlockMap solution_;
};

} // namespace Kilonova

#endif // SOLUTION_STATE_HPP
