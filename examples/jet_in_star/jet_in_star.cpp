#include "Errors.hpp"
#include "JetInStar.hpp"
#include "Runtime.hpp"
#include "Simulation.hpp"
#include "SimulationConfig.hpp"

#include <iostream>

using namespace Kilonova;

// Relativistic jet breaking out of a massive star (Duffell & MacFadyen 2015).
// Usage: jet_in_star [checkpoint]
int main(int argc, char** argv) {
    SimulationConfig config;

    config.hydro.system = HydroSystem::Relativistic;
    config.hydro.gammaLawIndex = 1.33;
    config.hydro.plmTheta = 1.5;
    config.hydro.cfl = 0.3;
    config.hydro.RKOrder = 2;
    config.hydro.riemannSolver = RiemannSolverType::HLLC;
    config.hydro.lightSpeed = JetInStar::lightSpeed;

    config.model.type = ModelType::JetInStar;
    config.model.jetInStar.engineDuration = 10.0;
    config.model.jetInStar.engineEnergy = 1e51;
    config.model.jetInStar.engineTheta = 0.1;
    config.model.jetInStar.engineU = 50.0;

    // ---- Mesh setup ----
    config.mesh.innerRadius = 1e9;
    config.mesh.outerRadius = 1e12;
    config.mesh.referenceRadius = 1e9;
    config.mesh.numPolarZones = 64;
    config.mesh.blockSize = 4;
    config.mesh.excisionDelay = 10.0;
    config.mesh.innerExcisionSpeed = 1e9;
    config.mesh.outerExcisionSpeed = 3e10;
    config.mesh.innerBoundary = BoundaryCondition::Model;
    config.mesh.outerBoundary = BoundaryCondition::Outflow;

    config.control.startTime = 0.0;
    config.control.finalTime = 3.0;
    config.control.checkpointInterval = 0.1;
    config.control.productsInterval = 0.1;
    config.control.fold = 100;
    config.control.numThreads = 0;
    config.control.outputDirectory = "data";

    try {
        Runtime rt(config.control.numThreads);
        Simulation sim(rt, config);

        if (argc > 1)
            sim.restore(argv[1]);

        sim.run();
    } catch (const PhysicsError& e) {
        std::cerr << "jet_in_star: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "jet_in_star: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
