#include "Errors.hpp"
#include "Runtime.hpp"
#include "Simulation.hpp"
#include "SimulationConfig.hpp"

#include <iostream>

using namespace Kilonova;

// Newtonian point explosion in a uniform medium, closed by reflecting walls.
int main(int argc, char** argv) {
    SimulationConfig config;

    config.hydro.system = HydroSystem::Euler;
    config.hydro.gammaLawIndex = 5.0 / 3.0;
    config.hydro.plmTheta = 1.5;
    config.hydro.cfl = 0.4;
    config.hydro.RKOrder = 2;
    config.hydro.riemannSolver = RiemannSolverType::HLLC;

    config.model.type = ModelType::Explosion;
    config.model.explosion.radius = 2.0;
    config.model.explosion.densityIn = 1.0;
    config.model.explosion.pressureIn = 100.0;
    config.model.explosion.densityOut = 1.0;
    config.model.explosion.pressureOut = 0.01;

    config.mesh.innerRadius = 1.0;
    config.mesh.outerRadius = 20.0;
    config.mesh.referenceRadius = 1.0;
    config.mesh.numPolarZones = 32;
    config.mesh.blockSize = 8;
    config.mesh.innerBoundary = BoundaryCondition::Reflecting;
    config.mesh.outerBoundary = BoundaryCondition::Reflecting;

    config.control.finalTime = 1.0;
    config.control.checkpointInterval = 0.25;
    config.control.productsInterval = 0.05;
    config.control.fold = 10;
    config.control.outputDirectory = argc > 1 ? argv[1] : "explosion";

    try {
        Runtime rt(config.control.numThreads);
        Simulation sim(rt, config);

        ConservedState before = sim.state().totals();
        ConservedState after = sim.run().totals();

        rt.print("Total mass:   ", before.mass, " -> ", after.mass, "\n");
        rt.print("Total energy: ", before.energy, " -> ", after.energy, "\n");
    } catch (const std::exception& e) {
        std::cerr << "spherical_explosion: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
