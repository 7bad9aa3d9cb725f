#ifndef RELATIVISTIC_HYDRO_HPP
#define RELATIVISTIC_HYDRO_HPP

#include "Hydrodynamics.hpp"

namespace Kilonova {

/// Special-relativistic gas dynamics with a gamma-law equation of state.
///
/// Primitive velocities are the spatial four-velocity (gamma-beta) and the
/// pressure is measured in units of rho c^2. The conserved energy excludes
/// the rest mass. Fluxes, wave speeds and sources are scaled by
/// params.lightSpeed so models may be set up in cgs units.
class RelativisticHydro : public Hydrodynamics {
public:
    explicit RelativisticHydro(const HydroParams& params);

    std::string name() const override { return "Relativistic"; }

    ConservedState toConserved(const PrimitiveState& W) const override;

    /// Newton-Raphson iteration on the pressure.
    PrimitiveState toPrimitive(const ConservedState& U) const override;

    ConservedState physicalFlux(const PrimitiveState& W, Axis axis) const override;
    RiemannFlux intercellFlux(const PrimitiveState& left,
                              const PrimitiveState& right,
                              Axis axis) const override;
    ConservedState sourceTerms(const PrimitiveState& W,
                               const CellExtent& cell) const override;
    double maxSignalSpeed(const PrimitiveState& W, Axis axis) const override;

    double lightSpeed() const { return params_.lightSpeed; }

    static constexpr int maxIterations = 50;
    static constexpr double tolerance = 1e-10;   // relative to the pressure

    static double lorentzFactor(const PrimitiveState& W);
    double enthalpyDensity(const PrimitiveState& W) const;
    double soundSpeedSquared(const PrimitiveState& W) const;

    /// Outer wave speeds (in units of c) of a single state along an axis.
    void outerWavespeeds(const PrimitiveState& W, Axis axis, double& am, double& ap) const;

private:
    // Both in units of c; the public entry points scale by lightSpeed
    ConservedState fluxUnscaled(const PrimitiveState& W, Axis axis) const;
    ConservedState hlleFlux(const PrimitiveState& left, const PrimitiveState& right,
                            Axis axis, double& speed) const;
    ConservedState hllcFlux(const PrimitiveState& left, const PrimitiveState& right,
                            Axis axis, double& speed) const;
};

} // namespace Kilonova

#endif // RELATIVISTIC_HYDRO_HPP
