#ifndef POLAR_MESH_HPP
#define POLAR_MESH_HPP

#include "BlockIndex.hpp"
#include "SimulationConfig.hpp"
#include <cstddef>
#include <vector>

namespace Kilonova {

/// Geometry of one block: a radial shell of blockSize zones spanning the
/// full polar range [0, pi]. Immutable once built; owned by whoever asked
/// for it.
///
/// Cell (i, j) has radial zone i in [0, nr) and polar zone j in [0, nq).
/// Indexing is polar-fastest, so a radial row of cells is contiguous.
class BlockGeometry {
public:
    BlockIndex block() const { return block_; }
    int nr() const { return nr_; }
    int nq() const { return nq_; }
    std::size_t numCells() const { return static_cast<std::size_t>(nr_) * nq_; }

    std::size_t index(int i, int j) const {
        return static_cast<std::size_t>(i) * nq_ + j;
    }

    /// Radial face i lies between cells (i-1, j) and (i, j), i in [0, nr].
    double faceR(int i) const { return faceR_[i]; }
    /// Polar face j lies between cells (i, j-1) and (i, j), j in [0, nq].
    double faceQ(int j) const { return faceQ_[j]; }

    double cellR(int i) const { return 0.5 * (faceR_[i] + faceR_[i + 1]); }
    double cellQ(int j) const { return 0.5 * (faceQ_[j] + faceQ_[j + 1]); }

    double cellVolume(int i, int j) const { return volume_[index(i, j)]; }

    /// Area of radial face i over polar zone j.
    double faceAreaR(int i, int j) const {
        return areaR_[static_cast<std::size_t>(i) * nq_ + j];
    }
    /// Area of polar face j over radial zone i.
    double faceAreaQ(int i, int j) const {
        return areaQ_[static_cast<std::size_t>(i) * (nq_ + 1) + j];
    }

    /// Smallest of the radial width and the arc length over all cells.
    double minCellLength() const { return minCellLength_; }

private:
    friend class PolarMesh;

    BlockIndex block_;
    int nr_ = 0;
    int nq_ = 0;
    std::vector<double> faceR_;
    std::vector<double> faceQ_;
    std::vector<double> volume_;
    std::vector<double> areaR_;    // (nr + 1) x nq
    std::vector<double> areaQ_;    // nr x (nq + 1)
    double minCellLength_ = 0.0;
};

/// Axisymmetric spherical-polar mesh, logarithmic in radius and uniform in
/// the polar angle, decomposed into radial blocks.
///
/// The radial log spacing equals the polar spacing (dlogr = pi / nq) so
/// zones are close to square. Radial face k sits at r_ref * exp(k dlogr);
/// every block derives its faces from these global positions, so adjacent
/// blocks agree on their shared face exactly.
///
/// The domain may move: after the excision delay the inner and outer edges
/// travel at their excision speeds, and the set of active blocks follows.
class PolarMesh {
public:
    explicit PolarMesh(const MeshParams& params);

    const MeshParams& params() const { return params_; }

    int numPolarZones() const { return params_.numPolarZones; }
    int blockSize() const { return params_.blockSize; }
    std::size_t cellsPerBlock() const {
        return static_cast<std::size_t>(params_.blockSize) * params_.numPolarZones;
    }

    double dlogr() const { return dlogr_; }
    double dq() const { return dq_; }

    /// Global radial face position; k may lie outside the active range.
    double radialFace(long k) const;
    /// Center of the global radial zone between faces k and k+1.
    double radialCenter(long k) const { return 0.5 * (radialFace(k) + radialFace(k + 1)); }
    double polarFace(int j) const;
    double polarCenter(int j) const { return 0.5 * (polarFace(j) + polarFace(j + 1)); }

    /// Domain edges at time t.
    double innerRadius(double t) const;
    double outerRadius(double t) const;

    /// Ordered, contiguous list of blocks overlapping the domain at time t.
    /// Throws ConfigurationError if the domain is empty or inverted.
    std::vector<BlockIndex> activeBlocks(double t) const;
    bool isActive(BlockIndex block, double t) const;

    /// Geometry of a block at time t. Throws ConfigurationError when the
    /// block is outside the active lattice or has non-positive extents.
    BlockGeometry geometryFor(BlockIndex block, double t) const;

private:
    MeshParams params_;
    double dlogr_;
    double dq_;

    void blockRange(double t, long& first, long& last) const;
};

} // namespace Kilonova

#endif // POLAR_MESH_HPP
