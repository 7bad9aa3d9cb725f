#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Kilonova {

/// Malformed mesh, parameters or initial model. Raised before stepping
/// begins (validate()) or when geometry is requested for a block that
/// the mesh cannot represent.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// A conserved state with no physical primitive counterpart, or a
/// degenerate time step. Always fatal to the run.
///
/// The physics layer fills in the quantity and offending value; the
/// scheme re-throws with the block, cell and time attached.
class PhysicsError : public std::runtime_error {
public:
    PhysicsError(const std::string& quantity, double value,
                 const std::string& detail = "");

    const std::string& quantity() const { return quantity_; }
    double value() const { return value_; }
    const std::string& detail() const { return detail_; }

    /// Copy of this error with a location attached to the message.
    PhysicsError locatedAt(long block, long cell, double time) const;

    bool hasLocation() const { return hasLocation_; }
    long block() const { return block_; }
    long cell() const { return cell_; }
    double time() const { return time_; }

private:
    std::string quantity_;
    double value_;
    std::string detail_;
    bool hasLocation_ = false;
    long block_ = 0;
    long cell_ = 0;
    double time_ = 0.0;

    PhysicsError(const std::string& message, const PhysicsError& base,
                 long block, long cell, double time);
};

} // namespace Kilonova

#endif // ERRORS_HPP
