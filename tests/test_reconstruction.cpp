#include "GhostExchange.hpp"
#include "Reconstruction.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace Kilonova;

TEST(Reconstruction, GradientVanishesAtExtrema) {
    for (double theta : {1.0, 1.5, 2.0}) {
        EXPECT_EQ(Reconstructor::plmGradient(1.0, 2.0, 1.0, theta), 0.0);
        EXPECT_EQ(Reconstructor::plmGradient(3.0, 2.0, 3.0, theta), 0.0);
        EXPECT_EQ(Reconstructor::plmGradient(2.0, 2.0, 5.0, theta), 0.0);
    }
}

TEST(Reconstruction, ThetaSelectsLimiter) {
    // theta = 1 is minmod, theta = 2 is monotonized central
    EXPECT_DOUBLE_EQ(Reconstructor::plmGradient(0.0, 1.0, 3.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(Reconstructor::plmGradient(0.0, 1.0, 3.0, 2.0), 1.5);
    EXPECT_DOUBLE_EQ(Reconstructor::plmGradient(3.0, 1.0, 0.0, 1.0), -1.0);
    EXPECT_DOUBLE_EQ(Reconstructor::plmGradient(3.0, 1.0, 0.0, 2.0), -1.5);
}

TEST(Reconstruction, FaceValuesStayWithinNeighbors) {
    std::vector<double> y = {0.0, 0.1, 0.5, 2.0, 2.1, 2.1, 7.0, 7.5, 3.0, -1.0, -1.2};

    for (double theta : {1.0, 1.5, 2.0}) {
        for (std::size_t k = 1; k + 1 < y.size(); ++k) {
            double g = Reconstructor::plmGradient(y[k - 1], y[k], y[k + 1], theta);
            double lo = std::min({y[k - 1], y[k], y[k + 1]});
            double hi = std::max({y[k - 1], y[k], y[k + 1]});
            double slack = 1e-14 * (hi - lo);
            lo -= slack;
            hi += slack;
            EXPECT_GE(y[k] - 0.5 * g, lo);
            EXPECT_LE(y[k] - 0.5 * g, hi);
            EXPECT_GE(y[k] + 0.5 * g, lo);
            EXPECT_LE(y[k] + 0.5 * g, hi);
        }
    }
}

TEST(Reconstruction, UniformBlockGivesUniformFaces) {
    const int nr = 4, nq = 6, ng = 2;
    PaddedBlock block(nr, nq, ng);
    PrimitiveState W(0.3, -0.1, 2.0, 0.5, 1.0);
    for (int i = -ng; i < nr + ng; ++i)
        for (int j = -ng; j < nq + ng; ++j)
            block.at(i, j) = W;

    Reconstructor recon(1.5);
    recon.reconstruct(block);

    for (int i = 0; i <= nr; ++i) {
        for (int j = 0; j < nq; ++j) {
            EXPECT_EQ(recon.rFaceLeft(i, j).rho, W.rho);
            EXPECT_EQ(recon.rFaceRight(i, j).p, W.p);
        }
    }
    for (int i = 0; i < nr; ++i) {
        for (int j = 0; j <= nq; ++j) {
            EXPECT_EQ(recon.qFaceLeft(i, j).ur, W.ur);
            EXPECT_EQ(recon.qFaceRight(i, j).uq, W.uq);
        }
    }
}

TEST(Reconstruction, LinearProfileIsExact) {
    const int nr = 4, nq = 3, ng = 2;
    PaddedBlock block(nr, nq, ng);
    for (int i = -ng; i < nr + ng; ++i)
        for (int j = -ng; j < nq + ng; ++j)
            block.at(i, j) = PrimitiveState(0.0, 0.0, 10.0 + i, 1.0);

    Reconstructor recon(1.5);
    recon.reconstruct(block);

    for (int i = 0; i <= nr; ++i) {
        for (int j = 0; j < nq; ++j) {
            EXPECT_DOUBLE_EQ(recon.rFaceLeft(i, j).rho, 10.0 + i - 0.5);
            EXPECT_DOUBLE_EQ(recon.rFaceRight(i, j).rho, 10.0 + i - 0.5);
        }
    }
}
