#ifndef RECONSTRUCTION_HPP
#define RECONSTRUCTION_HPP

#include "GhostExchange.hpp"
#include "State.hpp"
#include <cstddef>
#include <vector>

namespace Kilonova {

/// Piecewise-linear reconstruction with the generalized minmod limiter.
///
/// theta = 1 is the most diffusive (minmod), theta = 2 the least
/// (monotonized central). Any theta in [1, 2] keeps the scheme TVD.
class Reconstructor {
public:
    explicit Reconstructor(double plmTheta = 1.5);

    /// Fill face states for every radial and polar face of a padded block.
    /// Needs two ghost zones on each side.
    void reconstruct(const PaddedBlock& block);

    /// Radial face i (between cells (i-1, j) and (i, j)), i in [0, nr].
    const PrimitiveState& rFaceLeft(int i, int j) const  { return rLeft_[rFaceIndex(i, j)]; }
    const PrimitiveState& rFaceRight(int i, int j) const { return rRight_[rFaceIndex(i, j)]; }

    /// Polar face j (between cells (i, j-1) and (i, j)), j in [0, nq].
    const PrimitiveState& qFaceLeft(int i, int j) const  { return qLeft_[qFaceIndex(i, j)]; }
    const PrimitiveState& qFaceRight(int i, int j) const { return qRight_[qFaceIndex(i, j)]; }

    double theta() const { return theta_; }

    /// Limited difference across a zone with neighbors yl, yr.
    static double plmGradient(double yl, double y0, double yr, double theta);

    PrimitiveState gradient(const PrimitiveState& wl,
                            const PrimitiveState& w0,
                            const PrimitiveState& wr) const;

private:
    double theta_;
    int nr_ = 0, nq_ = 0;

    std::vector<PrimitiveState> rLeft_, rRight_;
    std::vector<PrimitiveState> qLeft_, qRight_;

    std::size_t rFaceIndex(int i, int j) const { return static_cast<std::size_t>(i) * nq_ + j; }
    std::size_t qFaceIndex(int i, int j) const { return static_cast<std::size_t>(i) * (nq_ + 1) + j; }
};

} // namespace Kilonova

#endif // RECONSTRUCTION_HPP
