#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "SimulationConfig.hpp"
#include "State.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

namespace Kilonova {
namespace test {

/// Three blocks of 4 x 16 zones between r = 1 and r = 10, uniform gas at rest.
inline SimulationConfig smallConfig(HydroSystem system = HydroSystem::Euler) {
    SimulationConfig config;
    config.hydro.system = system;
    config.hydro.gammaLawIndex = system == HydroSystem::Euler ? 5.0 / 3.0 : 4.0 / 3.0;
    config.hydro.cfl = 0.3;
    config.hydro.RKOrder = 2;
    config.hydro.riemannSolver = RiemannSolverType::HLLE;

    config.model.type = ModelType::Uniform;
    config.model.uniform.density = 1.0;
    config.model.uniform.pressure = 1.0;

    config.mesh.innerRadius = 1.0;
    config.mesh.outerRadius = 10.0;
    config.mesh.referenceRadius = 1.0;
    config.mesh.numPolarZones = 16;
    config.mesh.blockSize = 4;

    config.control.finalTime = 1.0;
    config.control.checkpointInterval = 0.25;
    config.control.productsInterval = 0.5;
    config.control.numThreads = 2;
    return config;
}

inline double relativeDifference(double a, double b) {
    double scale = std::max(std::abs(a), std::abs(b));
    return scale == 0.0 ? 0.0 : std::abs(a - b) / scale;
}

inline void expectConservedNear(const ConservedState& a, const ConservedState& b, double tol) {
    EXPECT_LE(relativeDifference(a.mass, b.mass), tol);
    EXPECT_LE(relativeDifference(a.momR, b.momR), tol);
    EXPECT_LE(relativeDifference(a.momQ, b.momQ), tol);
    EXPECT_LE(relativeDifference(a.energy, b.energy), tol);
    EXPECT_LE(relativeDifference(a.scalar, b.scalar), tol);
}

inline void expectConservedEqual(const ConservedState& a, const ConservedState& b) {
    EXPECT_EQ(a.mass, b.mass);
    EXPECT_EQ(a.momR, b.momR);
    EXPECT_EQ(a.momQ, b.momQ);
    EXPECT_EQ(a.energy, b.energy);
    EXPECT_EQ(a.scalar, b.scalar);
}

} // namespace test
} // namespace Kilonova

#endif // TEST_HELPERS_HPP
