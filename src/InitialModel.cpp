#include "InitialModel.hpp"
#include "JetInStar.hpp"
#include <cmath>

namespace Kilonova {

// ---- UniformModel ----

void UniformModel::validate() const {
    if (!(params_.density > 0.0))
        throw ConfigurationError("uniform model: density must be > 0");
    if (!(params_.pressure > 0.0))
        throw ConfigurationError("uniform model: pressure must be > 0");
    if (!std::isfinite(params_.velocityR) || !std::isfinite(params_.velocityQ))
        throw ConfigurationError("uniform model: velocity must be finite");
}

PrimitiveState UniformModel::primitiveAt(double, double, double) const {
    return PrimitiveState(params_.velocityR, params_.velocityQ,
                          params_.density, params_.pressure);
}

double UniformModel::scalarAt(double, double, double) const {
    return params_.scalar;
}

// ---- ExplosionModel ----

void ExplosionModel::validate() const {
    const auto& p = params_;
    if (!(p.radius > 0.0))
        throw ConfigurationError("explosion model: radius must be > 0");
    if (!(p.densityIn > 0.0) || !(p.densityOut > 0.0))
        throw ConfigurationError("explosion model: densities must be > 0");
    if (!(p.pressureIn > 0.0) || !(p.pressureOut > 0.0))
        throw ConfigurationError("explosion model: pressures must be > 0");
}

PrimitiveState ExplosionModel::primitiveAt(double r, double, double) const {
    if (r < params_.radius)
        return PrimitiveState(0.0, 0.0, params_.densityIn, params_.pressureIn);
    return PrimitiveState(0.0, 0.0, params_.densityOut, params_.pressureOut);
}

double ExplosionModel::scalarAt(double r, double, double) const {
    return r < params_.radius ? 1.0 : 0.0;
}

// ---- Factory ----

std::shared_ptr<InitialModel> makeInitialModel(const ModelParams& params) {
    std::shared_ptr<InitialModel> model;

    switch (params.type) {
        case ModelType::Uniform:   model = std::make_shared<UniformModel>(params.uniform); break;
        case ModelType::Explosion: model = std::make_shared<ExplosionModel>(params.explosion); break;
        case ModelType::JetInStar: model = std::make_shared<JetInStar>(params.jetInStar); break;
    }
    if (!model)
        throw ConfigurationError("makeInitialModel: unknown model type");

    model->validate();
    return model;
}

} // namespace Kilonova
