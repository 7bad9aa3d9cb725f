#include "Hydrodynamics.hpp"
#include "EulerHydro.hpp"
#include "RelativisticHydro.hpp"

namespace Kilonova {

Hydrodynamics::Hydrodynamics(const HydroParams& params)
    : params_(params)
{
    if (!(params_.gammaLawIndex > 1.0))
        throw ConfigurationError("Hydrodynamics: gammaLawIndex must be > 1");
    if (params_.plmTheta < 1.0 || params_.plmTheta > 2.0)
        throw ConfigurationError("Hydrodynamics: plmTheta must lie in [1, 2]");
}

std::shared_ptr<Hydrodynamics> makeHydrodynamics(const HydroParams& params) {
    switch (params.system) {
        case HydroSystem::Euler:        return std::make_shared<EulerHydro>(params);
        case HydroSystem::Relativistic: return std::make_shared<RelativisticHydro>(params);
    }
    throw ConfigurationError("makeHydrodynamics: unknown hydrodynamic system");
}

} // namespace Kilonova
