#include "GhostExchange.hpp"
#include "InitialModel.hpp"
#include "PolarMesh.hpp"
#include <sstream>

namespace Kilonova {

PaddedBlock::PaddedBlock(int nr, int nq, int ng)
    : nr_(nr), nq_(nq), ng_(ng)
    , data_(static_cast<std::size_t>(nr + 2 * ng) * (nq + 2 * ng))
{
}

GhostExchange::GhostExchange(const PolarMesh& mesh, const InitialModel& model,
                             BoundaryCondition inner, BoundaryCondition outer)
    : mesh_(mesh), model_(model), inner_(inner), outer_(outer)
{
}

PaddedBlock GhostExchange::fill(std::size_t n,
                                const std::vector<BlockIndex>& blocks,
                                const std::vector<std::vector<PrimitiveState>>& primitives,
                                double time) const {
    const int nr = mesh_.blockSize();
    const int nq = mesh_.numPolarZones();
    const int ng = SimulationConfig::nGhost;
    const BlockIndex index = blocks[n];

    PaddedBlock padded(nr, nq, ng);

    const auto& own = primitives[n];
    for (int i = 0; i < nr; ++i)
        for (int j = 0; j < nq; ++j)
            padded.at(i, j) = own[static_cast<std::size_t>(i) * nq + j];

    // Inner radial ghosts: last rows of the previous block, or the edge rule
    if (n > 0) {
        if (blocks[n - 1] != index.prev()) {
            std::ostringstream oss;
            oss << "GhostExchange: block " << index << " has no inner neighbor (found "
                << blocks[n - 1] << ")";
            throw ConfigurationError(oss.str());
        }
        const auto& nb = primitives[n - 1];
        for (int g = 1; g <= ng; ++g)
            for (int j = 0; j < nq; ++j)
                padded.at(-g, j) = nb[static_cast<std::size_t>(nr - g) * nq + j];
    } else {
        applyRadialBoundary(padded, index, true, time);
    }

    // Outer radial ghosts: first rows of the next block, or the edge rule
    if (n + 1 < blocks.size()) {
        if (blocks[n + 1] != index.next()) {
            std::ostringstream oss;
            oss << "GhostExchange: block " << index << " has no outer neighbor (found "
                << blocks[n + 1] << ")";
            throw ConfigurationError(oss.str());
        }
        const auto& nb = primitives[n + 1];
        for (int g = 0; g < ng; ++g)
            for (int j = 0; j < nq; ++j)
                padded.at(nr + g, j) = nb[static_cast<std::size_t>(g) * nq + j];
    } else {
        applyRadialBoundary(padded, index, false, time);
    }

    applyPolarAxis(padded);
    return padded;
}

void GhostExchange::applyRadialBoundary(PaddedBlock& block, BlockIndex index,
                                        bool innerEdge, double time) const {
    const int nr = block.nr();
    const int nq = block.nq();
    const int ng = block.ng();
    const BoundaryCondition bc = innerEdge ? inner_ : outer_;

    for (int g = 0; g < ng; ++g) {
        // Ghost row and the interior row it mirrors
        int ghost = innerEdge ? -1 - g : nr + g;
        int mirror = innerEdge ? g : nr - 1 - g;
        int edge = innerEdge ? 0 : nr - 1;

        for (int j = 0; j < nq; ++j) {
            switch (bc) {
                case BoundaryCondition::Model: {
                    long k = index.radial * nr + ghost;
                    block.at(ghost, j) = model_.sample(mesh_.radialCenter(k),
                                                       mesh_.polarCenter(j), time);
                    break;
                }
                case BoundaryCondition::Reflecting: {
                    PrimitiveState W = block.at(mirror, j);
                    W.ur = -W.ur;
                    block.at(ghost, j) = W;
                    break;
                }
                case BoundaryCondition::Outflow:
                    block.at(ghost, j) = block.at(edge, j);
                    break;
            }
        }
    }
}

void GhostExchange::applyPolarAxis(PaddedBlock& block) const {
    const int nr = block.nr();
    const int nq = block.nq();
    const int ng = block.ng();

    // Radial ghost rows included so the corners are filled too
    for (int i = -ng; i < nr + ng; ++i) {
        for (int g = 0; g < ng; ++g) {
            PrimitiveState north = block.at(i, g);
            north.uq = -north.uq;
            block.at(i, -1 - g) = north;

            PrimitiveState south = block.at(i, nq - 1 - g);
            south.uq = -south.uq;
            block.at(i, nq + g) = south;
        }
    }
}

} // namespace Kilonova
