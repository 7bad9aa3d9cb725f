#ifndef EULER_HYDRO_HPP
#define EULER_HYDRO_HPP

#include "Hydrodynamics.hpp"

namespace Kilonova {

/// Newtonian gas dynamics with a gamma-law equation of state.
class EulerHydro : public Hydrodynamics {
public:
    explicit EulerHydro(const HydroParams& params);

    std::string name() const override { return "Euler"; }

    ConservedState toConserved(const PrimitiveState& W) const override;
    PrimitiveState toPrimitive(const ConservedState& U) const override;
    ConservedState physicalFlux(const PrimitiveState& W, Axis axis) const override;
    RiemannFlux intercellFlux(const PrimitiveState& left,
                              const PrimitiveState& right,
                              Axis axis) const override;
    ConservedState sourceTerms(const PrimitiveState& W,
                               const CellExtent& cell) const override;
    double maxSignalSpeed(const PrimitiveState& W, Axis axis) const override;

    double soundSpeed(const PrimitiveState& W) const;

private:
    RiemannFlux hlleFlux(const PrimitiveState& left, const PrimitiveState& right, Axis axis) const;
    RiemannFlux hllcFlux(const PrimitiveState& left, const PrimitiveState& right, Axis axis) const;
};

} // namespace Kilonova

#endif // EULER_HYDRO_HPP
