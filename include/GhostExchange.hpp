#ifndef GHOST_EXCHANGE_HPP
#define GHOST_EXCHANGE_HPP

#include "BlockIndex.hpp"
#include "SimulationConfig.hpp"
#include "State.hpp"
#include <cstddef>
#include <vector>

namespace Kilonova {

class InitialModel;
class PolarMesh;

/// Primitive data of one block padded with ng ghost zones on every side.
/// Valid indices are i in [-ng, nr + ng), j in [-ng, nq + ng).
class PaddedBlock {
public:
    PaddedBlock(int nr, int nq, int ng);

    int nr() const { return nr_; }
    int nq() const { return nq_; }
    int ng() const { return ng_; }

    PrimitiveState& at(int i, int j) { return data_[offset(i, j)]; }
    const PrimitiveState& at(int i, int j) const { return data_[offset(i, j)]; }

private:
    int nr_, nq_, ng_;
    std::vector<PrimitiveState> data_;

    std::size_t offset(int i, int j) const {
        return static_cast<std::size_t>(i + ng_) * (nq_ + 2 * ng_) + (j + ng_);
    }
};

/// In-process ghost zone exchange between the blocks of a polar mesh.
///
/// Radial ghost rows are copied from the neighboring blocks' primitives,
/// which are read-only for the duration of a wave, so every block gets its
/// own snapshot. At the inner and outer domain edges the configured
/// boundary rule applies; the polar axis edges are always reflecting.
class GhostExchange {
public:
    GhostExchange(const PolarMesh& mesh, const InitialModel& model,
                  BoundaryCondition inner, BoundaryCondition outer);

    /// Padded primitives of blocks[n] at the given time.
    /// primitives[m] holds the interior primitives of blocks[m].
    PaddedBlock fill(std::size_t n,
                     const std::vector<BlockIndex>& blocks,
                     const std::vector<std::vector<PrimitiveState>>& primitives,
                     double time) const;

private:
    const PolarMesh& mesh_;
    const InitialModel& model_;
    BoundaryCondition inner_;
    BoundaryCondition outer_;

    void applyRadialBoundary(PaddedBlock& block, BlockIndex index,
                             bool innerEdge, double time) const;
    void applyPolarAxis(PaddedBlock& block) const;
};

} // namespace Kilonova

#endif // GHOST_EXCHANGE_HPP
