#include "Scheme.hpp"
#include "GhostExchange.hpp"
#include "Hydrodynamics.hpp"
#include "InitialModel.hpp"
#include "Reconstruction.hpp"
#include "WorkerPool.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace Kilonova {

Scheme::Scheme(const SimulationConfig& config)
    : cfl_(config.hydro.cfl)
    , RKOrder_(config.hydro.RKOrder)
    , innerBoundary_(config.mesh.innerBoundary)
    , outerBoundary_(config.mesh.outerBoundary)
{
    if (!(cfl_ > 0.0))
        throw ConfigurationError("Scheme: cfl must be > 0");
    if (RKOrder_ < 1 || RKOrder_ > 2)
        throw ConfigurationError("Scheme: RKOrder must be 1 or 2");
}

SolutionState Scheme::advance(const SolutionState& state,
                              const Hydrodynamics& hydro,
                              const InitialModel& model,
                              const PolarMesh& mesh,
                              const WorkerPool& pool,
                              int fold) const {
    if (fold < 1)
        throw ConfigurationError("Scheme::advance: fold must be >= 1 (got "
            + std::to_string(fold) + ")");

    SolutionState next = step(state, hydro, model, mesh, pool);
    for (int n = 1; n < fold; ++n)
        next = step(next, hydro, model, mesh, pool);
    return next;
}

SolutionState Scheme::step(const SolutionState& state,
                           const Hydrodynamics& hydro,
                           const InitialModel& model,
                           const PolarMesh& mesh,
                           const WorkerPool& pool) const {
    const double t0 = state.time();

    std::vector<BlockIndex> blocks;
    std::vector<BlockData> U0;
    blocks.reserve(state.numBlocks());
    U0.reserve(state.numBlocks());
    for (const auto& entry : state.solution()) {
        blocks.push_back(entry.first);
        U0.push_back(entry.second);
    }
    const std::size_t n = blocks.size();

    std::vector<BlockGeometry> geometry(n);
    pool.parallelFor(n, [&](std::size_t k) {
        geometry[k] = mesh.geometryFor(blocks[k], t0);
        if (geometry[k].numCells() != U0[k].size()) {
            std::ostringstream oss;
            oss << "Scheme: block " << blocks[k] << " holds " << U0[k].size()
                << " cells, geometry has " << geometry[k].numCells();
            throw ConfigurationError(oss.str());
        }
    });

    double minLength = std::numeric_limits<double>::max();
    for (const auto& g : geometry)
        minLength = std::min(minLength, g.minCellLength());

    // TVD RK coefficients: U = (c1*U_current + c2*U_saved + c3*dt*RHS) / c4
    std::array<std::array<double, 4>, 2> rk_coef;
    rk_coef[0] = {1.0, 0.0, 1.0, 1.0};
    rk_coef[1] = {1.0, 1.0, 1.0, 2.0};

    std::vector<BlockData> U = U0;
    double dt = 0.0;

    for (int s = 0; s < RKOrder_; ++s) {
        double stageTime = (s == 0) ? t0 : t0 + dt;
        std::vector<BlockRate> rates = computeRates(blocks, geometry, U, hydro, model,
                                                    mesh, pool, stageTime);

        if (s == 0) {
            // Reduce in block order so the step size is independent of scheduling
            double maxSpeed = 0.0;
            for (const auto& rate : rates)
                maxSpeed = std::max(maxSpeed, rate.maxWaveSpeed);

            dt = cfl_ * minLength / maxSpeed;
            if (!(dt > 0.0) || !std::isfinite(dt)) {
                std::ostringstream oss;
                oss << "degenerate time step at t = " << t0
                    << " (max wave speed " << maxSpeed << ")";
                throw PhysicsError("time step", dt, oss.str());
            }
        }

        const double c1 = rk_coef[s][0];
        const double c2 = rk_coef[s][1];
        const double c3 = rk_coef[s][2];
        const double c4 = rk_coef[s][3];

        pool.parallelFor(n, [&](std::size_t k) {
            const BlockData& current = U[k];
            const BlockData& saved = U0[k];
            const BlockData& rhs = rates[k].dudt;

            BlockData next(current.size());
            for (std::size_t c = 0; c < next.size(); ++c)
                next[c] = (current[c] * c1 + saved[c] * c2 + rhs[c] * (c3 * dt)) * (1.0 / c4);
            U[k] = std::move(next);
        });
    }

    const double t1 = t0 + dt;

    SolutionState::BlockMap solution;
    for (std::size_t k = 0; k < n; ++k)
        solution.emplace(blocks[k], std::move(U[k]));

    return SolutionState(state.iteration() + 1, t1,
                         refreshBlocks(std::move(solution), hydro, model, mesh, t1));
}

std::vector<Scheme::BlockRate> Scheme::computeRates(const std::vector<BlockIndex>& blocks,
                                                    const std::vector<BlockGeometry>& geometry,
                                                    const std::vector<BlockData>& U,
                                                    const Hydrodynamics& hydro,
                                                    const InitialModel& model,
                                                    const PolarMesh& mesh,
                                                    const WorkerPool& pool,
                                                    double time) const {
    const std::size_t n = blocks.size();

    // ---- Wave 1: primitive recovery ----
    std::vector<std::vector<PrimitiveState>> primitives(n);
    pool.parallelFor(n, [&](std::size_t k) {
        const BlockGeometry& g = geometry[k];
        std::vector<PrimitiveState>& W = primitives[k];
        W.resize(g.numCells());

        for (int i = 0; i < g.nr(); ++i) {
            for (int j = 0; j < g.nq(); ++j) {
                std::size_t idx = g.index(i, j);
                try {
                    W[idx] = hydro.toPrimitive(U[k][idx] * (1.0 / g.cellVolume(i, j)));
                } catch (const PhysicsError& e) {
                    throw e.locatedAt(blocks[k].radial, static_cast<long>(idx), time);
                }
            }
        }
    });

    // ---- Wave 2: ghost fill, reconstruction, fluxes and sources ----
    GhostExchange exchange(mesh, model, innerBoundary_, outerBoundary_);
    std::vector<BlockRate> rates(n);

    pool.parallelFor(n, [&](std::size_t k) {
        const BlockGeometry& g = geometry[k];
        const int nr = g.nr();
        const int nq = g.nq();

        PaddedBlock padded = exchange.fill(k, blocks, primitives, time);

        Reconstructor recon(hydro.plmTheta());
        recon.reconstruct(padded);

        BlockRate& rate = rates[k];
        rate.dudt.assign(g.numCells(), ConservedState());
        double maxSpeed = 0.0;

        auto checkSpeed = [&](double speed, int i, int j) {
            if (!std::isfinite(speed)) {
                PhysicsError e("wave speed", speed);
                throw e.locatedAt(blocks[k].radial, static_cast<long>(g.index(i, j)), time);
            }
            maxSpeed = std::max(maxSpeed, speed);
        };

        // Radial faces
        for (int i = 0; i <= nr; ++i) {
            for (int j = 0; j < nq; ++j) {
                RiemannFlux f = hydro.intercellFlux(recon.rFaceLeft(i, j), recon.rFaceRight(i, j),
                                                    Axis::Radial);
                checkSpeed(f.maxWaveSpeed, std::min(i, nr - 1), j);

                ConservedState fa = f.flux * g.faceAreaR(i, j);
                if (i > 0)  rate.dudt[g.index(i - 1, j)] -= fa;
                if (i < nr) rate.dudt[g.index(i, j)] += fa;
            }
        }

        // Polar faces
        for (int i = 0; i < nr; ++i) {
            for (int j = 0; j <= nq; ++j) {
                RiemannFlux f = hydro.intercellFlux(recon.qFaceLeft(i, j), recon.qFaceRight(i, j),
                                                    Axis::Polar);
                checkSpeed(f.maxWaveSpeed, i, std::min(j, nq - 1));

                ConservedState fa = f.flux * g.faceAreaQ(i, j);
                if (j > 0)  rate.dudt[g.index(i, j - 1)] -= fa;
                if (j < nq) rate.dudt[g.index(i, j)] += fa;
            }
        }

        // Geometric sources
        for (int i = 0; i < nr; ++i) {
            for (int j = 0; j < nq; ++j) {
                CellExtent cell{g.faceR(i), g.faceR(i + 1), g.faceQ(j), g.faceQ(j + 1)};
                rate.dudt[g.index(i, j)] += hydro.sourceTerms(padded.at(i, j), cell);
            }
        }

        rate.maxWaveSpeed = maxSpeed;
    });

    return rates;
}

SolutionState::BlockMap Scheme::refreshBlocks(SolutionState::BlockMap solution,
                                              const Hydrodynamics& hydro,
                                              const InitialModel& model,
                                              const PolarMesh& mesh,
                                              double time) const {
    SolutionState::BlockMap next;

    for (BlockIndex b : mesh.activeBlocks(time)) {
        auto it = solution.find(b);
        if (it != solution.end()) {
            next.emplace(b, std::move(it->second));
        } else {
            next.emplace(b, SolutionState::sampleBlock(model, hydro, mesh.geometryFor(b, time), time));
        }
    }
    return next;
}

} // namespace Kilonova
