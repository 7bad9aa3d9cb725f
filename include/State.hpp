#ifndef STATE_HPP
#define STATE_HPP

namespace Kilonova {

// Interface orientation on the polar mesh
enum class Axis { Radial, Polar };

// Primitive variables (per-cell bundle for conversions and reconstruction).
// For the relativistic system ur/uq are four-velocity components (gamma-beta).
struct PrimitiveState {
    double ur;                     // Radial velocity
    double uq;                     // Polar velocity
    double rho;                    // Mass density
    double p;                      // Gas pressure
    double scalar;                 // Passive scalar concentration

    PrimitiveState() : ur(0.0), uq(0.0), rho(0.0), p(0.0), scalar(0.0) {}
    PrimitiveState(double ur_, double uq_, double rho_, double p_, double scalar_ = 0.0)
        : ur(ur_), uq(uq_), rho(rho_), p(p_), scalar(scalar_) {}

    double velocity(Axis axis) const { return axis == Axis::Radial ? ur : uq; }
};

// Conserved variables. Densities when produced by a Hydrodynamics
// instance; volume-integrated totals when stored in a SolutionState.
struct ConservedState {
    double mass;
    double momR;                   // Radial momentum
    double momQ;                   // Polar momentum
    double energy;                 // Total energy (relativistic: minus rest mass)
    double scalar;                 // Mass-weighted passive scalar

    ConservedState() : mass(0.0), momR(0.0), momQ(0.0), energy(0.0), scalar(0.0) {}
    ConservedState(double mass_, double momR_, double momQ_, double energy_, double scalar_ = 0.0)
        : mass(mass_), momR(momR_), momQ(momQ_), energy(energy_), scalar(scalar_) {}

    ConservedState& operator+=(const ConservedState& b) {
        mass += b.mass; momR += b.momR; momQ += b.momQ;
        energy += b.energy; scalar += b.scalar;
        return *this;
    }
    ConservedState& operator-=(const ConservedState& b) {
        mass -= b.mass; momR -= b.momR; momQ -= b.momQ;
        energy -= b.energy; scalar -= b.scalar;
        return *this;
    }
    ConservedState& operator*=(double s) {
        mass *= s; momR *= s; momQ *= s; energy *= s; scalar *= s;
        return *this;
    }
};

inline ConservedState operator+(ConservedState a, const ConservedState& b) { return a += b; }
inline ConservedState operator-(ConservedState a, const ConservedState& b) { return a -= b; }
inline ConservedState operator*(ConservedState a, double s) { return a *= s; }
inline ConservedState operator*(double s, ConservedState a) { return a *= s; }

} // namespace Kilonova

#endif // STATE_HPP
