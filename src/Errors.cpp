#include "Errors.hpp"

#include <sstream>

namespace Kilonova {

static std::string describe(const std::string& quantity, double value,
                            const std::string& detail) {
    std::ostringstream oss;
    oss << "unphysical " << quantity << " (" << value << ")";
    if (!detail.empty()) oss << ": " << detail;
    return oss.str();
}

PhysicsError::PhysicsError(const std::string& quantity, double value,
                           const std::string& detail)
    : std::runtime_error(describe(quantity, value, detail))
    , quantity_(quantity)
    , value_(value)
    , detail_(detail)
{
}

PhysicsError::PhysicsError(const std::string& message, const PhysicsError& base,
                           long block, long cell, double time)
    : std::runtime_error(message)
    , quantity_(base.quantity_)
    , value_(base.value_)
    , detail_(base.detail_)
    , hasLocation_(true)
    , block_(block)
    , cell_(cell)
    , time_(time)
{
}

PhysicsError PhysicsError::locatedAt(long block, long cell, double time) const {
    std::ostringstream oss;
    oss << describe(quantity_, value_, detail_)
        << " in block " << block << ", cell " << cell
        << " at t = " << time;
    return PhysicsError(oss.str(), *this, block, cell, time);
}

} // namespace Kilonova
