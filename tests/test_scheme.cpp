#include "Errors.hpp"
#include "EulerHydro.hpp"
#include "Hydrodynamics.hpp"
#include "InitialModel.hpp"
#include "PolarMesh.hpp"
#include "Scheme.hpp"
#include "SolutionState.hpp"
#include "TestHelpers.hpp"
#include "WorkerPool.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>

using namespace Kilonova;
using Kilonova::test::expectConservedEqual;
using Kilonova::test::relativeDifference;
using Kilonova::test::smallConfig;

namespace {

struct SchemeRig {
    SimulationConfig config;
    std::shared_ptr<Hydrodynamics> hydro;
    std::shared_ptr<InitialModel> model;
    PolarMesh mesh;
    Scheme scheme;

    explicit SchemeRig(const SimulationConfig& c)
        : config(c)
        , hydro(makeHydrodynamics(c.hydro))
        , model(makeInitialModel(c.model))
        , mesh(c.mesh)
        , scheme(c) {}

    SolutionState initial() const {
        return SolutionState::fromModel(*model, *hydro, mesh, config.control.startTime);
    }

    SolutionState advance(const SolutionState& state, const WorkerPool& pool, int fold) const {
        return scheme.advance(state, *hydro, *model, mesh, pool, fold);
    }
};

SimulationConfig reflectingExplosion(HydroSystem system) {
    SimulationConfig config = smallConfig(system);
    config.model.type = ModelType::Explosion;
    config.mesh.innerBoundary = BoundaryCondition::Reflecting;
    config.mesh.outerBoundary = BoundaryCondition::Reflecting;
    return config;
}

void expectStatesEqual(const SolutionState& a, const SolutionState& b) {
    EXPECT_EQ(a.iteration(), b.iteration());
    EXPECT_EQ(a.time(), b.time());
    ASSERT_EQ(a.numBlocks(), b.numBlocks());
    for (const auto& entry : a.solution()) {
        const auto& other = b.block(entry.first);
        ASSERT_EQ(entry.second.size(), other.size());
        for (std::size_t c = 0; c < other.size(); ++c)
            expectConservedEqual(entry.second[c], other[c]);
    }
}

/// Euler system whose Riemann solver reports no signal speed.
class StalledHydro : public EulerHydro {
public:
    using EulerHydro::EulerHydro;

    RiemannFlux intercellFlux(const PrimitiveState& left,
                              const PrimitiveState& right,
                              Axis axis) const override {
        RiemannFlux f = EulerHydro::intercellFlux(left, right, axis);
        f.maxWaveSpeed = 0.0;
        return f;
    }
};

} // namespace

// ---- Equilibrium and conservation ----

TEST(Scheme, UniformGasStaysAtRest) {
    for (auto system : {HydroSystem::Euler, HydroSystem::Relativistic}) {
        SchemeRig rig(smallConfig(system));
        WorkerPool pool(2);

        SolutionState state = rig.advance(rig.initial(), pool, 5);
        EXPECT_EQ(state.iteration(), 5u);

        for (const auto& entry : state.solution()) {
            BlockGeometry g = rig.mesh.geometryFor(entry.first, state.time());
            for (int i = 0; i < g.nr(); ++i) {
                for (int j = 0; j < g.nq(); ++j) {
                    ConservedState U = entry.second[g.index(i, j)] * (1.0 / g.cellVolume(i, j));
                    PrimitiveState W = rig.hydro->toPrimitive(U);
                    EXPECT_NEAR(W.rho, 1.0, 1e-10);
                    EXPECT_NEAR(W.p, 1.0, 1e-10);
                    EXPECT_NEAR(W.ur, 0.0, 1e-10);
                    EXPECT_NEAR(W.uq, 0.0, 1e-10);
                }
            }
        }
    }
}

TEST(Scheme, ReflectingEdgesConserveMassAndEnergy) {
    for (auto system : {HydroSystem::Euler, HydroSystem::Relativistic}) {
        SchemeRig rig(reflectingExplosion(system));
        WorkerPool pool(4);

        SolutionState initial = rig.initial();
        SolutionState state = rig.advance(initial, pool, 20);

        ConservedState before = initial.totals();
        ConservedState after = state.totals();
        EXPECT_LE(relativeDifference(before.mass, after.mass), 1e-12);
        EXPECT_LE(relativeDifference(before.energy, after.energy), 1e-12);
        EXPECT_LE(relativeDifference(before.scalar, after.scalar), 1e-12);
        EXPECT_GT(state.time(), initial.time());
    }
}

// ---- Determinism ----

TEST(Scheme, ResultIndependentOfPoolSize) {
    SchemeRig rig(reflectingExplosion(HydroSystem::Euler));
    SolutionState initial = rig.initial();

    SolutionState serial = rig.advance(initial, WorkerPool(1), 4);
    SolutionState parallel = rig.advance(initial, WorkerPool(4), 4);
    expectStatesEqual(serial, parallel);
}

TEST(Scheme, FoldEqualsRepeatedSingleSteps) {
    SchemeRig rig(reflectingExplosion(HydroSystem::Relativistic));
    WorkerPool pool(3);
    SolutionState initial = rig.initial();

    SolutionState folded = rig.advance(initial, pool, 3);
    SolutionState stepped = initial;
    for (int n = 0; n < 3; ++n)
        stepped = rig.advance(stepped, pool, 1);

    expectStatesEqual(folded, stepped);
}

TEST(Scheme, InputStateIsUntouched) {
    SchemeRig rig(reflectingExplosion(HydroSystem::Euler));
    WorkerPool pool(2);
    SolutionState initial = rig.initial();
    SolutionState copy = initial;

    SolutionState next = rig.advance(initial, pool, 2);
    expectStatesEqual(initial, copy);
    EXPECT_EQ(next.iteration(), initial.iteration() + 2);
    EXPECT_GT(next.time(), initial.time());
}

TEST(Scheme, FirstOrderStepRuns) {
    SimulationConfig config = reflectingExplosion(HydroSystem::Euler);
    config.hydro.RKOrder = 1;
    config.hydro.riemannSolver = RiemannSolverType::HLLC;
    SchemeRig rig(config);
    WorkerPool pool(2);

    SolutionState initial = rig.initial();
    SolutionState state = rig.advance(initial, pool, 3);
    EXPECT_LE(relativeDifference(initial.totals().mass, state.totals().mass), 1e-12);
}

TEST(Scheme, RejectsNonPositiveFold) {
    SchemeRig rig(smallConfig());
    WorkerPool pool(1);
    EXPECT_THROW(rig.advance(rig.initial(), pool, 0), ConfigurationError);
}

// ---- Failures ----

TEST(Scheme, UnphysicalCellAbortsWithLocation) {
    SchemeRig rig(smallConfig());
    WorkerPool pool(4);
    SolutionState initial = rig.initial();

    SolutionState::BlockMap solution = initial.solution();
    solution[BlockIndex(1)][5].mass = -1.0;
    SolutionState broken(initial.iteration(), initial.time(), solution);

    try {
        rig.advance(broken, pool, 1);
        FAIL() << "expected PhysicsError";
    } catch (const PhysicsError& e) {
        EXPECT_EQ(e.quantity(), "mass density");
        ASSERT_TRUE(e.hasLocation());
        EXPECT_EQ(e.block(), 1);
        EXPECT_EQ(e.cell(), 5);
        EXPECT_EQ(e.time(), initial.time());
    }
}

TEST(Scheme, LowestBlockFailureIsReported) {
    SchemeRig rig(smallConfig());
    WorkerPool pool(4);
    SolutionState initial = rig.initial();

    SolutionState::BlockMap solution = initial.solution();
    solution[BlockIndex(2)][0].mass = -1.0;
    solution[BlockIndex(0)][7].mass = -2.0;
    SolutionState broken(initial.iteration(), initial.time(), solution);

    try {
        rig.advance(broken, pool, 1);
        FAIL() << "expected PhysicsError";
    } catch (const PhysicsError& e) {
        EXPECT_EQ(e.block(), 0);
        EXPECT_EQ(e.cell(), 7);
        EXPECT_DOUBLE_EQ(e.value(), -2.0 / rig.mesh.geometryFor(BlockIndex(0), 0.0).cellVolume(0, 7));
    }
}

TEST(Scheme, ZeroWaveSpeedIsFatal) {
    SimulationConfig config = smallConfig();
    SchemeRig rig(config);
    StalledHydro stalled(config.hydro);
    WorkerPool pool(2);

    try {
        rig.scheme.advance(rig.initial(), stalled, *rig.model, rig.mesh, pool, 1);
        FAIL() << "expected PhysicsError";
    } catch (const PhysicsError& e) {
        EXPECT_EQ(e.quantity(), "time step");
        EXPECT_FALSE(std::isfinite(e.value()));
    }
}

TEST(Scheme, MissingNeighborIsAConfigurationError) {
    SchemeRig rig(smallConfig());
    WorkerPool pool(2);
    SolutionState initial = rig.initial();

    SolutionState::BlockMap solution = initial.solution();
    solution.erase(BlockIndex(1));
    SolutionState gapped(0, 0.0, solution);

    EXPECT_THROW(rig.advance(gapped, pool, 1), ConfigurationError);
}

// ---- Domain shape ----

TEST(Scheme, SingleBlockDomain) {
    SimulationConfig config = smallConfig();
    config.mesh.outerRadius = 2.0;
    SchemeRig rig(config);
    WorkerPool pool(4);

    SolutionState initial = rig.initial();
    ASSERT_EQ(initial.numBlocks(), 1u);

    SolutionState state = rig.advance(initial, pool, 3);
    EXPECT_EQ(state.numBlocks(), 1u);
    EXPECT_LE(relativeDifference(initial.totals().mass, state.totals().mass), 1e-12);

    const auto& [index, U] = *state.solution().begin();
    BlockGeometry g = rig.mesh.geometryFor(index, state.time());
    for (int i = 0; i < g.nr(); ++i) {
        for (int j = 0; j < g.nq(); ++j) {
            PrimitiveState W = rig.hydro->toPrimitive(U[g.index(i, j)] * (1.0 / g.cellVolume(i, j)));
            EXPECT_NEAR(W.rho, 1.0, 1e-10) << i << "," << j;
            EXPECT_NEAR(W.p, 1.0, 1e-10) << i << "," << j;
            EXPECT_NEAR(W.ur, 0.0, 1e-10) << i << "," << j;
            EXPECT_NEAR(W.uq, 0.0, 1e-10) << i << "," << j;
        }
    }
}

TEST(Scheme, ExcisionDropsAndAddsBlocks) {
    SimulationConfig config = smallConfig();
    config.mesh.innerExcisionSpeed = 50.0;
    config.mesh.outerExcisionSpeed = 100.0;
    SchemeRig rig(config);
    WorkerPool pool(2);

    SolutionState initial = rig.initial();
    ASSERT_TRUE(initial.contains(BlockIndex(0)));
    ASSERT_FALSE(initial.contains(BlockIndex(3)));

    SolutionState state = rig.advance(initial, pool, 1);
    auto active = rig.mesh.activeBlocks(state.time());

    ASSERT_EQ(state.numBlocks(), active.size());
    for (BlockIndex b : active) {
        ASSERT_TRUE(state.contains(b));
        EXPECT_EQ(state.block(b).size(), rig.mesh.geometryFor(b, state.time()).numCells());
    }
    EXPECT_FALSE(state.contains(BlockIndex(0)));
    EXPECT_TRUE(state.contains(BlockIndex(3)));

    // The new block is sampled from the uniform model
    const auto& fresh = state.block(BlockIndex(3));
    BlockGeometry g = rig.mesh.geometryFor(BlockIndex(3), state.time());
    EXPECT_NEAR(fresh[g.index(0, 0)].mass / g.cellVolume(0, 0), 1.0, 1e-12);

    // And the grown domain keeps stepping
    EXPECT_NO_THROW(rig.advance(state, pool, 1));
}
