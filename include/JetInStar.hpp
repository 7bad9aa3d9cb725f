#ifndef JET_IN_STAR_HPP
#define JET_IN_STAR_HPP

#include "InitialModel.hpp"

namespace Kilonova {

/// Relativistic jet launched into a stellar progenitor with an envelope and
/// a wind, following Duffell & MacFadyen (2015). All quantities in cgs;
/// pressure is reported in units of rho c^2, so the relativistic system
/// must run with lightSpeed = JetInStar::lightSpeed.
class JetInStar : public InitialModel {
public:
    enum class Zone { Core, Envelope, Wind, Jet };

    static constexpr double lightSpeed = 2.99792458e10;
    static constexpr double uniformTemperature = 1e-3;

    explicit JetInStar(const JetInStarParams& params) : params_(params) {}

    std::string name() const override { return "jet_in_star"; }
    void validate() const override;
    PrimitiveState primitiveAt(double r, double q, double t) const override;
    double scalarAt(double r, double q, double t) const override;

    Zone zone(double r, double q, double t) const;

    /// Engine velocity in units of c.
    double engineBeta() const;
    /// Whether a polar angle is within engineTheta of either pole.
    bool inNozzle(double q) const;
    /// Radius reached by material launched at t = 0.
    double jetHead(double t) const { return engineBeta() * lightSpeed * t; }

    /// Normalized nozzle profile g(r, theta) of the engine injection.
    double nozzleFunction(double r, double q) const;

    /// Comoving mass density (g/cc).
    double massDensity(double r, double q, double t) const;

private:
    JetInStarParams params_;

    double jetMassRatePerSteradian(double r, double q) const;
    double ambientDensity(double r) const;
};

} // namespace Kilonova

#endif // JET_IN_STAR_HPP
