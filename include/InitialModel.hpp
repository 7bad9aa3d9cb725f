#ifndef INITIAL_MODEL_HPP
#define INITIAL_MODEL_HPP

#include "State.hpp"
#include "SimulationConfig.hpp"
#include <memory>
#include <string>

namespace Kilonova {

/// Source of initial and boundary data as a function of (r, theta, t).
///
/// Used to fill the initial state, to supply ghost zones on Model
/// boundaries, and to populate blocks that enter the domain as it grows.
class InitialModel {
public:
    virtual ~InitialModel() = default;

    virtual std::string name() const = 0;

    /// Throws ConfigurationError for unusable parameters.
    virtual void validate() const = 0;

    virtual PrimitiveState primitiveAt(double r, double q, double t) const = 0;
    virtual double scalarAt(double r, double q, double t) const = 0;

    /// Primitive with the passive scalar filled in.
    PrimitiveState sample(double r, double q, double t) const {
        PrimitiveState W = primitiveAt(r, q, t);
        W.scalar = scalarAt(r, q, t);
        return W;
    }
};

/// Homogeneous medium.
class UniformModel : public InitialModel {
public:
    explicit UniformModel(const UniformParams& params) : params_(params) {}

    std::string name() const override { return "uniform"; }
    void validate() const override;
    PrimitiveState primitiveAt(double r, double q, double t) const override;
    double scalarAt(double r, double q, double t) const override;

private:
    UniformParams params_;
};

/// Spherical over-pressured region at rest inside a uniform ambient medium.
/// The scalar marks the ejecta (1 inside the initial radius, 0 outside).
class ExplosionModel : public InitialModel {
public:
    explicit ExplosionModel(const ExplosionParams& params) : params_(params) {}

    std::string name() const override { return "explosion"; }
    void validate() const override;
    PrimitiveState primitiveAt(double r, double q, double t) const override;
    double scalarAt(double r, double q, double t) const override;

private:
    ExplosionParams params_;
};

/// Build and validate the model selected by params.type.
std::shared_ptr<InitialModel> makeInitialModel(const ModelParams& params);

} // namespace Kilonova

#endif // INITIAL_MODEL_HPP
