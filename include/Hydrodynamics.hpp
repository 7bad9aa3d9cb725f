#ifndef HYDRODYNAMICS_HPP
#define HYDRODYNAMICS_HPP

#include "State.hpp"
#include "SimulationConfig.hpp"
#include <memory>
#include <string>

namespace Kilonova {

struct RiemannFlux {
    ConservedState flux;          // flux density through a unit face area
    double maxWaveSpeed;          // largest signal speed magnitude at the face

    RiemannFlux() : maxWaveSpeed(0.0) {}
};

/// Radial and polar extent of one cell, for integrated source terms.
struct CellExtent {
    double r0, r1;
    double q0, q1;
};

/// Abstract hydrodynamic system on the axisymmetric polar mesh.
///
/// Instances are immutable after construction and shared read-only by all
/// workers. Conserved quantities passed in and returned are densities
/// (per unit volume); the scheme handles the volume integration.
class Hydrodynamics {
public:
    explicit Hydrodynamics(const HydroParams& params);
    virtual ~Hydrodynamics() = default;

    virtual std::string name() const = 0;

    virtual ConservedState toConserved(const PrimitiveState& W) const = 0;

    /// Recover primitives. Throws PhysicsError when no physical state
    /// matches U or the recovery does not converge; never clamps.
    virtual PrimitiveState toPrimitive(const ConservedState& U) const = 0;

    /// Physical flux of W through a face normal to the given axis.
    virtual ConservedState physicalFlux(const PrimitiveState& W, Axis axis) const = 0;

    /// Approximate Riemann solution at an interface.
    virtual RiemannFlux intercellFlux(const PrimitiveState& left,
                                      const PrimitiveState& right,
                                      Axis axis) const = 0;

    /// Geometric source terms of spherical-polar coordinates, integrated
    /// over the cell volume (rate of the volume-integrated conserved state).
    virtual ConservedState sourceTerms(const PrimitiveState& W,
                                       const CellExtent& cell) const = 0;

    /// Largest signal speed magnitude of a single state along an axis.
    virtual double maxSignalSpeed(const PrimitiveState& W, Axis axis) const = 0;

    double gamma() const { return params_.gammaLawIndex; }
    double plmTheta() const { return params_.plmTheta; }
    RiemannSolverType riemannSolver() const { return params_.riemannSolver; }
    const HydroParams& params() const { return params_; }

protected:
    HydroParams params_;
};

/// Build the system selected by params.system.
std::shared_ptr<Hydrodynamics> makeHydrodynamics(const HydroParams& params);

} // namespace Kilonova

#endif // HYDRODYNAMICS_HPP
