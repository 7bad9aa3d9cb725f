#include "RelativisticHydro.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <sstream>

namespace Kilonova {

RelativisticHydro::RelativisticHydro(const HydroParams& params)
    : Hydrodynamics(params)
{
    if (!(params_.lightSpeed > 0.0))
        throw ConfigurationError("RelativisticHydro: lightSpeed must be > 0");
}

double RelativisticHydro::lorentzFactor(const PrimitiveState& W) {
    return std::sqrt(1.0 + W.ur * W.ur + W.uq * W.uq);
}

double RelativisticHydro::enthalpyDensity(const PrimitiveState& W) const {
    return W.rho + W.p * gamma() / (gamma() - 1.0);
}

double RelativisticHydro::soundSpeedSquared(const PrimitiveState& W) const {
    return gamma() * W.p / enthalpyDensity(W);
}

ConservedState RelativisticHydro::toConserved(const PrimitiveState& W) const {
    double w = lorentzFactor(W);
    double hg = enthalpyDensity(W);
    double d = W.rho * w;

    return ConservedState(d,
                          hg * w * W.ur,
                          hg * w * W.uq,
                          hg * w * w - W.p - d,
                          d * W.scalar);
}

PrimitiveState RelativisticHydro::toPrimitive(const ConservedState& U) const {
    const double D = U.mass;
    const double tau = U.energy;
    const double ss = U.momR * U.momR + U.momQ * U.momQ;

    if (!(D > 0.0) || !std::isfinite(D))
        throw PhysicsError("mass density", D);
    if (!std::isfinite(tau) || !std::isfinite(ss))
        throw PhysicsError("energy", tau, "non-finite conserved state");

    const double gm = gamma();
    double p = 0.0;
    bool converged = false;

    for (int n = 0; n < maxIterations; ++n) {
        double et = tau + p + D;
        double b2 = std::min(ss / (et * et), 1.0 - 1e-10);
        double w2 = 1.0 / (1.0 - b2);
        double w = std::sqrt(w2);
        double e = (tau + D * (1.0 - w) + p * (1.0 - w2)) / (D * w);
        double d = D / w;
        double h = 1.0 + e + p / d;
        double a2 = gm * p / (d * h);
        double f = d * e * (gm - 1.0) - p;
        double g = b2 * a2 - 1.0;

        p -= f / g;

        if (!std::isfinite(p))
            break;
        if (std::abs(f) <= tolerance * std::abs(p)) {
            converged = true;
            break;
        }
    }

    if (!converged) {
        std::ostringstream oss;
        oss << "pressure iteration did not converge in " << maxIterations << " iterations";
        throw PhysicsError("gas pressure", p, oss.str());
    }
    if (!(p > 0.0))
        throw PhysicsError("gas pressure", p);

    double et = tau + p + D;
    double v2 = ss / (et * et);
    if (!(v2 < 1.0))
        throw PhysicsError("velocity", std::sqrt(v2), "superluminal");

    double w = 1.0 / std::sqrt(1.0 - v2);

    PrimitiveState W;
    W.rho = D / w;
    W.ur = w * U.momR / et;
    W.uq = w * U.momQ / et;
    W.p = p;
    W.scalar = U.scalar / D;

    if (!(W.rho > 0.0))
        throw PhysicsError("mass density", W.rho);
    return W;
}

ConservedState RelativisticHydro::fluxUnscaled(const PrimitiveState& W, Axis axis) const {
    double vn = W.velocity(axis) / lorentzFactor(W);
    ConservedState F = toConserved(W) * vn;
    if (axis == Axis::Radial) F.momR += W.p;
    else                      F.momQ += W.p;
    F.energy += W.p * vn;
    return F;
}

ConservedState RelativisticHydro::physicalFlux(const PrimitiveState& W, Axis axis) const {
    return fluxUnscaled(W, axis) * lightSpeed();
}

void RelativisticHydro::outerWavespeeds(const PrimitiveState& W, Axis axis,
                                        double& am, double& ap) const {
    double a2 = soundSpeedSquared(W);
    double uu = W.ur * W.ur + W.uq * W.uq;
    double vn = W.velocity(axis) / lorentzFactor(W);
    double vv = uu / (1.0 + uu);
    double v2 = vn * vn;
    double k0 = std::sqrt(a2 * (1.0 - vv) * (1.0 - vv * a2 - v2 * (1.0 - a2)));

    am = (vn * (1.0 - a2) - k0) / (1.0 - vv * a2);
    ap = (vn * (1.0 - a2) + k0) / (1.0 - vv * a2);
}

double RelativisticHydro::maxSignalSpeed(const PrimitiveState& W, Axis axis) const {
    double am, ap;
    outerWavespeeds(W, axis, am, ap);
    return std::max(std::abs(am), std::abs(ap)) * lightSpeed();
}

RiemannFlux RelativisticHydro::intercellFlux(const PrimitiveState& left,
                                             const PrimitiveState& right,
                                             Axis axis) const {
    RiemannFlux result;
    double speed = 0.0;

    switch (params_.riemannSolver) {
        case RiemannSolverType::HLLE: result.flux = hlleFlux(left, right, axis, speed); break;
        case RiemannSolverType::HLLC: result.flux = hllcFlux(left, right, axis, speed); break;
    }

    result.flux *= lightSpeed();
    result.maxWaveSpeed = speed * lightSpeed();
    return result;
}

ConservedState RelativisticHydro::hlleFlux(const PrimitiveState& left,
                                           const PrimitiveState& right,
                                           Axis axis, double& speed) const {
    double amL, apL, amR, apR;
    outerWavespeeds(left, axis, amL, apL);
    outerWavespeeds(right, axis, amR, apR);

    double am = std::min(amL, amR);
    double ap = std::max(apL, apR);
    speed = std::max(std::abs(am), std::abs(ap));

    if (am >= 0.0) return fluxUnscaled(left, axis);
    if (ap <= 0.0) return fluxUnscaled(right, axis);

    ConservedState FL = fluxUnscaled(left, axis);
    ConservedState FR = fluxUnscaled(right, axis);
    ConservedState UL = toConserved(left);
    ConservedState UR = toConserved(right);

    return (FL * ap - FR * am + (UR - UL) * (ap * am)) * (1.0 / (ap - am));
}

ConservedState RelativisticHydro::hllcFlux(const PrimitiveState& left,
                                           const PrimitiveState& right,
                                           Axis axis, double& speed) const {
    double amL, apL, amR, apR;
    outerWavespeeds(left, axis, amL, apL);
    outerWavespeeds(right, axis, amR, apR);

    double am = std::min(amL, amR);
    double ap = std::max(apL, apR);
    speed = std::max(std::abs(am), std::abs(ap));

    ConservedState FL = fluxUnscaled(left, axis);
    ConservedState FR = fluxUnscaled(right, axis);

    if (am >= 0.0) return FL;
    if (ap <= 0.0) return FR;

    ConservedState UL = toConserved(left);
    ConservedState UR = toConserved(right);

    ConservedState Uhll = (UR * ap - UL * am - FR + FL) * (1.0 / (ap - am));
    ConservedState Fhll = (FL * ap - FR * am + (UR - UL) * (ap * am)) * (1.0 / (ap - am));

    const bool radial = (axis == Axis::Radial);
    double mHll = radial ? Uhll.momR : Uhll.momQ;
    double fmHll = radial ? Fhll.momR : Fhll.momQ;
    double eHll = Uhll.energy + Uhll.mass;
    double feHll = Fhll.energy + Fhll.mass;

    // Contact speed: root of feHll a^2 - (eHll + fmHll) a + mHll = 0 that lies in [-1, 1]
    // written as 2c / (b + sqrt(b^2 - 4ac)), which stays accurate as feHll -> 0
    double b = eHll + fmHll;
    double disc = std::max(b * b - 4.0 * feHll * mHll, 0.0);
    double aStar = 2.0 * mHll / (b + std::sqrt(disc));
    double pStar = -feHll * aStar + fmHll;

    auto starFlux = [&](const PrimitiveState& K, const ConservedState& UK,
                        const ConservedState& FK, double aK) {
        double vn = K.velocity(axis) / lorentzFactor(K);
        double fac = (aK - vn) / (aK - aStar);
        double eK = UK.energy + UK.mass;

        ConservedState UStar;
        UStar.mass = UK.mass * fac;
        UStar.scalar = UK.scalar * fac;
        double eStar = (eK * (aK - vn) + pStar * aStar - K.p * vn) / (aK - aStar);
        double mnStar = (eStar + pStar) * aStar;
        if (radial) {
            UStar.momR = mnStar;
            UStar.momQ = UK.momQ * fac;
        } else {
            UStar.momR = UK.momR * fac;
            UStar.momQ = mnStar;
        }
        UStar.energy = eStar - UStar.mass;

        return FK + (UStar - UK) * aK;
    };

    if (aStar >= 0.0)
        return starFlux(left, UL, FL, am);
    return starFlux(right, UR, FR, ap);
}

ConservedState RelativisticHydro::sourceTerms(const PrimitiveState& W,
                                              const CellExtent& cell) const {
    double dr2 = cell.r1 * cell.r1 - cell.r0 * cell.r0;
    double dcos = std::cos(cell.q0) - std::cos(cell.q1);
    double dsin = std::sin(cell.q1) - std::sin(cell.q0);
    double hg = enthalpyDensity(W);

    ConservedState S;
    S.momR = std::numbers::pi * dr2 * dcos * (hg * W.uq * W.uq + 2.0 * W.p);
    S.momQ = std::numbers::pi * dr2 * (dsin * W.p - dcos * hg * W.ur * W.uq);
    return S * lightSpeed();
}

} // namespace Kilonova
