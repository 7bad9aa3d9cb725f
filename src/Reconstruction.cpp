#include "Reconstruction.hpp"
#include <algorithm>
#include <cmath>

namespace Kilonova {

namespace {
    inline double sgn(double x) {
        return static_cast<double>((0.0 < x) - (x < 0.0));
    }

    // Face values on either side of a zone: w0 -/+ half the limited difference
    inline PrimitiveState extrapolate(const PrimitiveState& w0, const PrimitiveState& g, double s) {
        return PrimitiveState(w0.ur + s * g.ur,
                              w0.uq + s * g.uq,
                              w0.rho + s * g.rho,
                              w0.p + s * g.p,
                              w0.scalar + s * g.scalar);
    }
} // anonymous namespace

Reconstructor::Reconstructor(double plmTheta)
    : theta_(plmTheta)
{}

double Reconstructor::plmGradient(double yl, double y0, double yr, double theta) {
    double a = (y0 - yl) * theta;
    double b = (yr - yl) * 0.5;
    double c = (yr - y0) * theta;
    return 0.25 * std::abs(sgn(a) + sgn(b)) * (sgn(a) + sgn(c))
         * std::min(std::abs(a), std::min(std::abs(b), std::abs(c)));
}

PrimitiveState Reconstructor::gradient(const PrimitiveState& wl,
                                       const PrimitiveState& w0,
                                       const PrimitiveState& wr) const {
    return PrimitiveState(plmGradient(wl.ur, w0.ur, wr.ur, theta_),
                          plmGradient(wl.uq, w0.uq, wr.uq, theta_),
                          plmGradient(wl.rho, w0.rho, wr.rho, theta_),
                          plmGradient(wl.p, w0.p, wr.p, theta_),
                          plmGradient(wl.scalar, w0.scalar, wr.scalar, theta_));
}

void Reconstructor::reconstruct(const PaddedBlock& block) {
    nr_ = block.nr();
    nq_ = block.nq();

    rLeft_.resize(static_cast<std::size_t>(nr_ + 1) * nq_);
    rRight_.resize(rLeft_.size());
    qLeft_.resize(static_cast<std::size_t>(nr_) * (nq_ + 1));
    qRight_.resize(qLeft_.size());

    // ---- Radial faces ----
    for (int j = 0; j < nq_; ++j) {
        for (int i = 0; i <= nr_; ++i) {
            const PrimitiveState& wll = block.at(i - 2, j);
            const PrimitiveState& wl  = block.at(i - 1, j);
            const PrimitiveState& wr  = block.at(i, j);
            const PrimitiveState& wrr = block.at(i + 1, j);

            rLeft_[rFaceIndex(i, j)]  = extrapolate(wl, gradient(wll, wl, wr), 0.5);
            rRight_[rFaceIndex(i, j)] = extrapolate(wr, gradient(wl, wr, wrr), -0.5);
        }
    }

    // ---- Polar faces ----
    for (int i = 0; i < nr_; ++i) {
        for (int j = 0; j <= nq_; ++j) {
            const PrimitiveState& wll = block.at(i, j - 2);
            const PrimitiveState& wl  = block.at(i, j - 1);
            const PrimitiveState& wr  = block.at(i, j);
            const PrimitiveState& wrr = block.at(i, j + 1);

            qLeft_[qFaceIndex(i, j)]  = extrapolate(wl, gradient(wll, wl, wr), 0.5);
            qRight_[qFaceIndex(i, j)] = extrapolate(wr, gradient(wl, wr, wrr), -0.5);
        }
    }
}

} // namespace Kilonova
