#include "Errors.hpp"
#include "PolarMesh.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>

using namespace Kilonova;
using Kilonova::test::smallConfig;

TEST(PolarMesh, ActiveBlocksCoverDomain) {
    PolarMesh mesh(smallConfig().mesh);
    auto blocks = mesh.activeBlocks(0.0);

    ASSERT_EQ(blocks.size(), 3u);
    for (std::size_t k = 0; k < blocks.size(); ++k)
        EXPECT_EQ(blocks[k], BlockIndex(static_cast<long>(k)));

    EXPECT_LE(mesh.radialFace(0), mesh.innerRadius(0.0));
    EXPECT_GE(mesh.radialFace(3 * mesh.blockSize()), mesh.outerRadius(0.0));
    EXPECT_TRUE(mesh.isActive(BlockIndex(2), 0.0));
    EXPECT_FALSE(mesh.isActive(BlockIndex(3), 0.0));
}

TEST(PolarMesh, SpacingIsLogarithmic) {
    PolarMesh mesh(smallConfig().mesh);
    EXPECT_DOUBLE_EQ(mesh.dq(), std::numbers::pi / 16.0);
    EXPECT_DOUBLE_EQ(mesh.dlogr(), mesh.dq());
    EXPECT_NEAR(mesh.radialFace(5) / mesh.radialFace(4), std::exp(mesh.dlogr()), 1e-14);
    EXPECT_EQ(mesh.polarFace(0), 0.0);
    EXPECT_EQ(mesh.polarFace(16), std::numbers::pi);
}

TEST(PolarMesh, VolumesSumToShell) {
    PolarMesh mesh(smallConfig().mesh);
    double total = 0.0;
    for (BlockIndex b : mesh.activeBlocks(0.0)) {
        BlockGeometry g = mesh.geometryFor(b, 0.0);
        for (int i = 0; i < g.nr(); ++i)
            for (int j = 0; j < g.nq(); ++j)
                total += g.cellVolume(i, j);
    }
    double r0 = mesh.radialFace(0);
    double r1 = mesh.radialFace(3 * mesh.blockSize());
    double shell = 4.0 * std::numbers::pi / 3.0 * (r1 * r1 * r1 - r0 * r0 * r0);
    EXPECT_NEAR(total / shell, 1.0, 1e-12);
}

TEST(PolarMesh, FaceAreasCloseTheSphere) {
    PolarMesh mesh(smallConfig().mesh);
    BlockGeometry g = mesh.geometryFor(BlockIndex(1), 0.0);

    double area = 0.0;
    for (int j = 0; j < g.nq(); ++j)
        area += g.faceAreaR(0, j);
    EXPECT_NEAR(area, 4.0 * std::numbers::pi * g.faceR(0) * g.faceR(0), 1e-12 * area);

    for (int i = 0; i < g.nr(); ++i) {
        EXPECT_EQ(g.faceAreaQ(i, 0), 0.0);
        EXPECT_NEAR(g.faceAreaQ(i, g.nq()), 0.0, 1e-12 * g.faceAreaQ(i, g.nq() / 2));
    }
}

TEST(PolarMesh, AdjacentBlocksShareFaces) {
    PolarMesh mesh(smallConfig().mesh);
    BlockGeometry inner = mesh.geometryFor(BlockIndex(0), 0.0);
    BlockGeometry outer = mesh.geometryFor(BlockIndex(1), 0.0);

    EXPECT_EQ(inner.faceR(inner.nr()), outer.faceR(0));
    for (int j = 0; j < inner.nq(); ++j)
        EXPECT_EQ(inner.faceAreaR(inner.nr(), j), outer.faceAreaR(0, j));
}

TEST(PolarMesh, GeometryIsIdempotent) {
    PolarMesh mesh(smallConfig().mesh);
    BlockGeometry a = mesh.geometryFor(BlockIndex(2), 0.0);
    BlockGeometry b = mesh.geometryFor(BlockIndex(2), 0.0);

    ASSERT_EQ(a.numCells(), b.numCells());
    EXPECT_EQ(a.minCellLength(), b.minCellLength());
    for (int i = 0; i < a.nr(); ++i)
        for (int j = 0; j < a.nq(); ++j)
            EXPECT_EQ(a.cellVolume(i, j), b.cellVolume(i, j));
}

TEST(PolarMesh, MinCellLength) {
    PolarMesh mesh(smallConfig().mesh);
    BlockGeometry g = mesh.geometryFor(BlockIndex(0), 0.0);
    EXPECT_GT(g.minCellLength(), 0.0);
    EXPECT_LE(g.minCellLength(), g.faceR(1) - g.faceR(0));
    EXPECT_LE(g.minCellLength(), g.faceR(0) * mesh.dq());
}

TEST(PolarMesh, BlockOutsideLatticeThrows) {
    PolarMesh mesh(smallConfig().mesh);
    EXPECT_THROW(mesh.geometryFor(BlockIndex(3), 0.0), ConfigurationError);
    EXPECT_THROW(mesh.geometryFor(BlockIndex(-1), 0.0), ConfigurationError);
}

TEST(PolarMesh, ExcisionMovesDomain) {
    MeshParams params = smallConfig().mesh;
    params.excisionDelay = 1.0;
    params.innerExcisionSpeed = 2.0;
    params.outerExcisionSpeed = 20.0;
    PolarMesh mesh(params);

    EXPECT_EQ(mesh.activeBlocks(0.5), mesh.activeBlocks(0.0));
    EXPECT_DOUBLE_EQ(mesh.innerRadius(2.0), 3.0);
    EXPECT_DOUBLE_EQ(mesh.outerRadius(2.0), 30.0);

    // r in [3, 30]: block 0 ends near 2.19 and block 4 starts near 23.1
    auto blocks = mesh.activeBlocks(2.0);
    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_EQ(blocks.front(), BlockIndex(1));
    EXPECT_EQ(blocks.back(), BlockIndex(4));
    EXPECT_THROW(mesh.geometryFor(BlockIndex(0), 2.0), ConfigurationError);
    EXPECT_NO_THROW(mesh.geometryFor(BlockIndex(4), 2.0));
}

TEST(PolarMesh, EmptyDomainThrows) {
    MeshParams params = smallConfig().mesh;
    params.innerExcisionSpeed = 10.0;
    PolarMesh mesh(params);
    EXPECT_NO_THROW(mesh.activeBlocks(0.5));
    EXPECT_THROW(mesh.activeBlocks(1.0), ConfigurationError);
}

TEST(PolarMesh, RejectsMalformedParameters) {
    MeshParams params = smallConfig().mesh;
    params.blockSize = 1;
    EXPECT_THROW(PolarMesh{params}, ConfigurationError);

    params = smallConfig().mesh;
    params.numPolarZones = 1;
    EXPECT_THROW(PolarMesh{params}, ConfigurationError);

    params = smallConfig().mesh;
    params.outerRadius = params.innerRadius;
    EXPECT_THROW(PolarMesh{params}, ConfigurationError);

    params = smallConfig().mesh;
    params.referenceRadius = 0.0;
    EXPECT_THROW(PolarMesh{params}, ConfigurationError);
}
