#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include "Errors.hpp"
#include <cmath>
#include <string>

namespace Kilonova {

enum class HydroSystem {
    Euler,          // Newtonian gas dynamics
    Relativistic,   // special-relativistic gas dynamics, four-velocity primitives
};

enum class RiemannSolverType { HLLE, HLLC };

enum class BoundaryCondition {
    Model,          // ghost zones sampled from the initial model at the current time
    Reflecting,     // mirror with radial velocity negated
    Outflow,        // zero-gradient copy of the edge zones
};

enum class ModelType { Uniform, Explosion, JetInStar };

struct HydroParams {
    HydroSystem system = HydroSystem::Relativistic;
    double gammaLawIndex = 4.0 / 3.0;
    double plmTheta = 1.5;        // generalized minmod parameter, in [1, 2]
    double cfl = 0.3;
    int RKOrder = 2;
    RiemannSolverType riemannSolver = RiemannSolverType::HLLE;
    double lightSpeed = 1.0;      // relativistic only; 2.99792458e10 for cgs models
};

struct MeshParams {
    double innerRadius = 1.0;
    double outerRadius = 10.0;
    double referenceRadius = 1.0;
    int numPolarZones = 64;       // zones on [0, pi]; also fixes the radial log spacing
    int blockSize = 4;            // radial zones per block
    double excisionDelay = 0.0;
    double innerExcisionSpeed = 0.0;
    double outerExcisionSpeed = 0.0;
    BoundaryCondition innerBoundary = BoundaryCondition::Model;
    BoundaryCondition outerBoundary = BoundaryCondition::Model;
};

struct UniformParams {
    double density = 1.0;
    double pressure = 1.0;
    double velocityR = 0.0;
    double velocityQ = 0.0;
    double scalar = 0.0;
};

struct ExplosionParams {
    double radius = 2.0;          // initial extent of the over-pressured region
    double densityIn = 1.0;
    double pressureIn = 1.0;
    double densityOut = 0.1;
    double pressureOut = 0.01;
};

struct JetInStarParams {
    double engineDuration = 10.0;
    double engineEnergy = 1e51;   // isotropic equivalent, erg
    double engineTheta = 0.1;     // opening angle, radians
    double engineU = 50.0;        // engine four-velocity
};

struct ModelParams {
    ModelType type = ModelType::Uniform;
    UniformParams uniform;
    ExplosionParams explosion;
    JetInStarParams jetInStar;
};

struct ControlParams {
    double startTime = 0.0;
    double finalTime = 1.0;
    double checkpointInterval = 0.1;
    double productsInterval = 0.1;
    int fold = 1;                 // elementary steps per advance
    int numThreads = 0;           // 0 = OpenMP default
    std::string outputDirectory = "data";
};

struct SimulationConfig {
    HydroParams hydro;
    ModelParams model;
    MeshParams mesh;
    ControlParams control;

    // Radial ghost rows needed by piecewise-linear reconstruction
    static constexpr int nGhost = 2;

    void validate() const {
        const auto& h = hydro;
        if (!(h.gammaLawIndex > 1.0))
            throw ConfigurationError("hydro.gammaLawIndex must be > 1 (got " + std::to_string(h.gammaLawIndex) + ")");
        if (h.plmTheta < 1.0 || h.plmTheta > 2.0)
            throw ConfigurationError("hydro.plmTheta must lie in [1, 2] (got " + std::to_string(h.plmTheta) + ")");
        if (!(h.cfl > 0.0))
            throw ConfigurationError("hydro.cfl must be > 0");
        if (h.RKOrder < 1 || h.RKOrder > 2)
            throw ConfigurationError("hydro.RKOrder must be 1 or 2 (got " + std::to_string(h.RKOrder) + ")");
        if (!(h.lightSpeed > 0.0))
            throw ConfigurationError("hydro.lightSpeed must be > 0");

        const auto& m = mesh;
        if (!(m.innerRadius > 0.0))
            throw ConfigurationError("mesh.innerRadius must be > 0");
        if (!(m.outerRadius > m.innerRadius))
            throw ConfigurationError("mesh.outerRadius must be > innerRadius");
        if (!(m.referenceRadius > 0.0))
            throw ConfigurationError("mesh.referenceRadius must be > 0");
        if (m.numPolarZones < nGhost)
            throw ConfigurationError("mesh.numPolarZones must be >= " + std::to_string(nGhost)
                + " (got " + std::to_string(m.numPolarZones) + ")");
        if (m.blockSize < nGhost)
            throw ConfigurationError("mesh.blockSize=" + std::to_string(m.blockSize)
                + " is too small for the reconstruction stencil (need >= " + std::to_string(nGhost) + ")");
        if (m.excisionDelay < 0.0)
            throw ConfigurationError("mesh.excisionDelay must be >= 0");
        if (!std::isfinite(m.innerExcisionSpeed) || !std::isfinite(m.outerExcisionSpeed))
            throw ConfigurationError("mesh excision speeds must be finite");

        const auto& c = control;
        if (!(c.finalTime >= c.startTime))
            throw ConfigurationError("control.finalTime must be >= startTime");
        if (!(c.checkpointInterval > 0.0))
            throw ConfigurationError("control.checkpointInterval must be > 0");
        if (!(c.productsInterval > 0.0))
            throw ConfigurationError("control.productsInterval must be > 0");
        if (c.fold < 1)
            throw ConfigurationError("control.fold must be >= 1 (got " + std::to_string(c.fold) + ")");
        if (c.numThreads < 0)
            throw ConfigurationError("control.numThreads must be >= 0");

        if (model.type == ModelType::JetInStar && hydro.system != HydroSystem::Relativistic)
            throw ConfigurationError("the jet_in_star model requires relativistic hydrodynamics");
    }
};

} // namespace Kilonova

#endif // SIMULATION_CONFIG_HPP
