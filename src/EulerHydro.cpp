#include "EulerHydro.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace Kilonova {

EulerHydro::EulerHydro(const HydroParams& params)
    : Hydrodynamics(params)
{
}

double EulerHydro::soundSpeed(const PrimitiveState& W) const {
    return std::sqrt(gamma() * W.p / W.rho);
}

ConservedState EulerHydro::toConserved(const PrimitiveState& W) const {
    double ke = 0.5 * W.rho * (W.ur * W.ur + W.uq * W.uq);
    return ConservedState(W.rho,
                          W.rho * W.ur,
                          W.rho * W.uq,
                          W.p / (gamma() - 1.0) + ke,
                          W.rho * W.scalar);
}

PrimitiveState EulerHydro::toPrimitive(const ConservedState& U) const {
    if (!(U.mass > 0.0) || !std::isfinite(U.mass))
        throw PhysicsError("mass density", U.mass);

    PrimitiveState W;
    W.rho = U.mass;
    W.ur = U.momR / U.mass;
    W.uq = U.momQ / U.mass;
    W.scalar = U.scalar / U.mass;

    double ke = 0.5 * (U.momR * U.momR + U.momQ * U.momQ) / U.mass;
    W.p = (gamma() - 1.0) * (U.energy - ke);

    if (!(W.p > 0.0) || !std::isfinite(W.p))
        throw PhysicsError("gas pressure", W.p);
    return W;
}

ConservedState EulerHydro::physicalFlux(const PrimitiveState& W, Axis axis) const {
    double vn = W.velocity(axis);
    ConservedState F = toConserved(W) * vn;
    if (axis == Axis::Radial) F.momR += W.p;
    else                      F.momQ += W.p;
    F.energy += W.p * vn;
    return F;
}

double EulerHydro::maxSignalSpeed(const PrimitiveState& W, Axis axis) const {
    return std::abs(W.velocity(axis)) + soundSpeed(W);
}

RiemannFlux EulerHydro::intercellFlux(const PrimitiveState& left,
                                      const PrimitiveState& right,
                                      Axis axis) const {
    switch (params_.riemannSolver) {
        case RiemannSolverType::HLLE: return hlleFlux(left, right, axis);
        case RiemannSolverType::HLLC: return hllcFlux(left, right, axis);
    }
    return hlleFlux(left, right, axis); // unreachable
}

RiemannFlux EulerHydro::hlleFlux(const PrimitiveState& left,
                                 const PrimitiveState& right,
                                 Axis axis) const {
    double uL = left.velocity(axis);
    double uR = right.velocity(axis);
    double cL = soundSpeed(left);
    double cR = soundSpeed(right);

    // Davis estimates
    double sL = std::min(uL - cL, uR - cR);
    double sR = std::max(uL + cL, uR + cR);

    RiemannFlux result;
    result.maxWaveSpeed = std::max(std::abs(sL), std::abs(sR));

    if (sL >= 0.0) {
        result.flux = physicalFlux(left, axis);
    } else if (sR <= 0.0) {
        result.flux = physicalFlux(right, axis);
    } else {
        ConservedState FL = physicalFlux(left, axis);
        ConservedState FR = physicalFlux(right, axis);
        ConservedState UL = toConserved(left);
        ConservedState UR = toConserved(right);
        result.flux = (FL * sR - FR * sL + (UR - UL) * (sR * sL)) * (1.0 / (sR - sL));
    }
    return result;
}

RiemannFlux EulerHydro::hllcFlux(const PrimitiveState& left,
                                 const PrimitiveState& right,
                                 Axis axis) const {
    double uL = left.velocity(axis);
    double uR = right.velocity(axis);
    double cL = soundSpeed(left);
    double cR = soundSpeed(right);

    double sL = std::min(uL - cL, uR - cR);
    double sR = std::max(uL + cL, uR + cR);

    // HLLC contact wave speed
    double sStar = (right.p - left.p
                    + left.rho * uL * (sL - uL)
                    - right.rho * uR * (sR - uR))
                 / (left.rho * (sL - uL) - right.rho * (sR - uR));

    RiemannFlux result;
    result.maxWaveSpeed = std::max(std::abs(sL), std::abs(sR));

    if (sL >= 0.0) {
        result.flux = physicalFlux(left, axis);
        return result;
    }
    if (sR <= 0.0) {
        result.flux = physicalFlux(right, axis);
        return result;
    }

    // Star state on side K, moving with wave speed sK
    auto starFlux = [&](const PrimitiveState& K, double uK, double sK) {
        ConservedState UK = toConserved(K);
        double rhoStar = K.rho * (sK - uK) / (sK - sStar);

        ConservedState UStar;
        UStar.mass = rhoStar;
        UStar.momR = rhoStar * (axis == Axis::Radial ? sStar : K.ur);
        UStar.momQ = rhoStar * (axis == Axis::Polar ? sStar : K.uq);
        double eK = UK.energy / K.rho;
        UStar.energy = rhoStar * (eK + (sStar - uK) * (sStar + K.p / (K.rho * (sK - uK))));
        UStar.scalar = rhoStar * K.scalar;

        return physicalFlux(K, axis) + (UStar - UK) * sK;
    };

    if (sStar >= 0.0)
        result.flux = starFlux(left, uL, sL);
    else
        result.flux = starFlux(right, uR, sR);
    return result;
}

ConservedState EulerHydro::sourceTerms(const PrimitiveState& W,
                                       const CellExtent& cell) const {
    double dr2 = cell.r1 * cell.r1 - cell.r0 * cell.r0;
    double dcos = std::cos(cell.q0) - std::cos(cell.q1);
    double dsin = std::sin(cell.q1) - std::sin(cell.q0);

    ConservedState S;
    S.momR = std::numbers::pi * dr2 * dcos * (W.rho * W.uq * W.uq + 2.0 * W.p);
    S.momQ = std::numbers::pi * dr2 * (dsin * W.p - dcos * W.rho * W.ur * W.uq);
    return S;
}

} // namespace Kilonova
