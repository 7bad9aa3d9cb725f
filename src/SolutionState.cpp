#include "SolutionState.hpp"
#include "Hydrodynamics.hpp"
#include "InitialModel.hpp"
#include "PolarMesh.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace Kilonova {

SolutionState::SolutionState(std::uint64_t iteration, double time, BlockMap solution)
    : iteration_(iteration)
    , time_(time)
    , solution_(std::move(solution))
{
}

SolutionState SolutionState::fromModel(const InitialModel& model,
                                       const Hydrodynamics& hydro,
                                       const PolarMesh& mesh,
                                       double startTime) {
    BlockMap solution;

    for (BlockIndex b : mesh.activeBlocks(startTime))
        solution.emplace(b, sampleBlock(model, hydro, mesh.geometryFor(b, startTime), startTime));

    return SolutionState(0, startTime, std::move(solution));
}

SolutionState::BlockData SolutionState::sampleBlock(const InitialModel& model,
                                                    const Hydrodynamics& hydro,
                                                    const BlockGeometry& g,
                                                    double time) {
    BlockData data(g.numCells());

    for (int i = 0; i < g.nr(); ++i) {
        for (int j = 0; j < g.nq(); ++j) {
            PrimitiveState W = model.sample(g.cellR(i), g.cellQ(j), time);
            data[g.index(i, j)] = hydro.toConserved(W) * g.cellVolume(i, j);
        }
    }
    return data;
}

const SolutionState::BlockData& SolutionState::block(BlockIndex index) const {
    auto it = solution_.find(index);
    if (it == solution_.end()) {
        std::ostringstream oss;
        oss << "SolutionState::block: no block " << index;
        throw std::out_of_range(oss.str());
    }
    return it->second;
}

std::size_t SolutionState::totalZones() const {
    std::size_t n = 0;
    for (const auto& entry : solution_)
        n += entry.second.size();
    return n;
}

ConservedState SolutionState::totals() const {
    ConservedState sum;
    for (const auto& entry : solution_)
        for (const auto& U : entry.second)
            sum += U;
    return sum;
}

} // namespace Kilonova
