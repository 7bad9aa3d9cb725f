#include "JetInStar.hpp"
#include <cmath>
#include <numbers>

namespace Kilonova {

namespace {
    // Progenitor constants of Duffell & MacFadyen (2015), arXiv:1407.8250
    constexpr double R0 = 7e10;
    constexpr double M0 = 2e33;
    const double RHO_C    = 3e7 * M0 / (1.33 * std::numbers::pi * R0 * R0 * R0);
    constexpr double R1 = 0.0017 * R0;
    constexpr double R2 = 0.0125 * R0;
    constexpr double R3 = 0.65 * R0;
    constexpr double K1 = 3.24;
    constexpr double K2 = 2.57;
    constexpr double N  = 16.7;
    const double RHO_WIND = 1e-9 * M0 / (1.33 * std::numbers::pi * R0 * R0 * R0);
    const double RHO_ENV  = 1e-7 * M0 / (1.33 * std::numbers::pi * R0 * R0 * R0);
    constexpr double R_NOZZ = 0.01 * R0;
    constexpr double R_ENV  = 1.2 * R0;
} // anonymous namespace

void JetInStar::validate() const {
    const auto& p = params_;
    if (!(p.engineDuration > 0.0))
        throw ConfigurationError("jet_in_star: engineDuration must be > 0");
    if (!(p.engineEnergy > 0.0))
        throw ConfigurationError("jet_in_star: engineEnergy must be > 0");
    if (!(p.engineTheta > 0.0) || !(p.engineTheta < 0.5 * std::numbers::pi))
        throw ConfigurationError("jet_in_star: engineTheta must lie in (0, pi/2)");
    if (!(p.engineU > 0.0))
        throw ConfigurationError("jet_in_star: engineU must be > 0");
}

double JetInStar::engineBeta() const {
    return params_.engineU / std::sqrt(1.0 + params_.engineU * params_.engineU);
}

bool JetInStar::inNozzle(double q) const {
    return q < params_.engineTheta || q > std::numbers::pi - params_.engineTheta;
}

JetInStar::Zone JetInStar::zone(double r, double q, double t) const {
    if (inNozzle(q) && r < jetHead(t))
        return Zone::Jet;
    if (r < R3)
        return Zone::Core;
    if (r < R_ENV)
        return Zone::Envelope;
    return Zone::Wind;
}

double JetInStar::nozzleFunction(double r, double q) const {
    double r0 = R_NOZZ / R0;
    double q2 = params_.engineTheta * params_.engineTheta;

    // N0 = 4 pi r0^3 (1 - exp(-2 / theta0^2)) theta0^2
    double n0 = 4.0 * std::numbers::pi * r0 * r0 * r0 * (1.0 - std::exp(-2.0 / q2)) * q2;

    double x = r / R_NOZZ;
    double cq = std::cos(q);
    double g = x * std::exp(-0.5 * x * x) * std::exp((cq * cq - 1.0) / q2);
    return g / n0;
}

double JetInStar::jetMassRatePerSteradian(double r, double q) const {
    double engineGamma = std::sqrt(1.0 + params_.engineU * params_.engineU);
    double luminosity = nozzleFunction(r, q) * params_.engineEnergy
                      / (4.0 * std::numbers::pi * params_.engineDuration);
    return luminosity / (engineGamma * lightSpeed * lightSpeed);
}

double JetInStar::ambientDensity(double r) const {
    if (r < R3) {
        double core = RHO_C * std::pow(1.0 - r / R3, N)
                    / (1.0 + std::pow(r / R1, K1) / (1.0 + std::pow(r / R2, K2)));
        return core + RHO_ENV * std::pow(r / R3, -2.0);
    }
    if (r < R_ENV)
        return RHO_ENV * std::pow(r / R3, -2.0);
    return RHO_WIND * std::pow(r / R_ENV, -2.0);
}

double JetInStar::massDensity(double r, double q, double t) const {
    if (zone(r, q, t) == Zone::Jet) {
        // Added to the ambient density; the nozzle profile underflows far out
        double jet = jetMassRatePerSteradian(r, q) / (r * r * params_.engineU * lightSpeed);
        return jet + ambientDensity(r);
    }
    return ambientDensity(r);
}

PrimitiveState JetInStar::primitiveAt(double r, double q, double t) const {
    double d = massDensity(r, q, t);
    double u = zone(r, q, t) == Zone::Jet ? params_.engineU : 0.0;
    return PrimitiveState(u, 0.0, d, d * uniformTemperature);
}

double JetInStar::scalarAt(double r, double q, double t) const {
    switch (zone(r, q, t)) {
        case Zone::Core:     return 1.0;
        case Zone::Jet:      return 1e2;
        case Zone::Envelope: return 1e-2 * std::pow(r / R3, -2.0);
        case Zone::Wind:     return 1e-5 * std::pow(r / R_ENV, -2.0);
    }
    return 0.0;
}

} // namespace Kilonova
