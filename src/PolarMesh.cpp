#include "PolarMesh.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <sstream>

namespace Kilonova {

PolarMesh::PolarMesh(const MeshParams& params)
    : params_(params)
{
    if (params_.numPolarZones < SimulationConfig::nGhost)
        throw ConfigurationError("PolarMesh: numPolarZones must be >= "
            + std::to_string(SimulationConfig::nGhost));
    if (params_.blockSize < SimulationConfig::nGhost)
        throw ConfigurationError("PolarMesh: blockSize must be >= "
            + std::to_string(SimulationConfig::nGhost));
    if (!(params_.referenceRadius > 0.0))
        throw ConfigurationError("PolarMesh: referenceRadius must be > 0");
    if (!(params_.innerRadius > 0.0) || !(params_.outerRadius > params_.innerRadius))
        throw ConfigurationError("PolarMesh: require 0 < innerRadius < outerRadius");

    dq_ = std::numbers::pi / params_.numPolarZones;
    dlogr_ = dq_;
}

double PolarMesh::radialFace(long k) const {
    return params_.referenceRadius * std::exp(static_cast<double>(k) * dlogr_);
}

double PolarMesh::polarFace(int j) const {
    // Pin the last face to pi so the axis cells close exactly
    if (j == params_.numPolarZones) return std::numbers::pi;
    return j * dq_;
}

double PolarMesh::innerRadius(double t) const {
    double elapsed = std::max(0.0, t - params_.excisionDelay);
    return params_.innerRadius + params_.innerExcisionSpeed * elapsed;
}

double PolarMesh::outerRadius(double t) const {
    double elapsed = std::max(0.0, t - params_.excisionDelay);
    return params_.outerRadius + params_.outerExcisionSpeed * elapsed;
}

void PolarMesh::blockRange(double t, long& first, long& last) const {
    double rIn = innerRadius(t);
    double rOut = outerRadius(t);

    if (!(rIn > 0.0) || !(rOut > rIn) || !std::isfinite(rOut)) {
        std::ostringstream oss;
        oss << "PolarMesh: empty domain at t = " << t
            << " (inner radius " << rIn << ", outer radius " << rOut << ")";
        throw ConfigurationError(oss.str());
    }

    // Positions in units of whole blocks; the tolerance keeps an edge that
    // sits on a block boundary from pulling in an extra block.
    const double blockLog = params_.blockSize * dlogr_;
    const double tol = 1e-10;
    double a = std::log(rIn / params_.referenceRadius) / blockLog;
    double b = std::log(rOut / params_.referenceRadius) / blockLog;

    first = static_cast<long>(std::floor(a + tol));
    last = static_cast<long>(std::ceil(b - tol)) - 1;
    if (last < first) last = first;
}

std::vector<BlockIndex> PolarMesh::activeBlocks(double t) const {
    long first, last;
    blockRange(t, first, last);

    std::vector<BlockIndex> blocks;
    blocks.reserve(static_cast<std::size_t>(last - first + 1));
    for (long b = first; b <= last; ++b)
        blocks.emplace_back(b);
    return blocks;
}

bool PolarMesh::isActive(BlockIndex block, double t) const {
    long first, last;
    blockRange(t, first, last);
    return block.radial >= first && block.radial <= last;
}

BlockGeometry PolarMesh::geometryFor(BlockIndex block, double t) const {
    if (!isActive(block, t)) {
        std::ostringstream oss;
        oss << "PolarMesh: block " << block << " is outside the active lattice at t = " << t;
        throw ConfigurationError(oss.str());
    }

    const int nr = params_.blockSize;
    const int nq = params_.numPolarZones;

    BlockGeometry g;
    g.block_ = block;
    g.nr_ = nr;
    g.nq_ = nq;

    g.faceR_.resize(nr + 1);
    const long k0 = block.radial * nr;
    for (int i = 0; i <= nr; ++i)
        g.faceR_[i] = radialFace(k0 + i);

    g.faceQ_.resize(nq + 1);
    for (int j = 0; j <= nq; ++j)
        g.faceQ_[j] = polarFace(j);

    g.volume_.resize(g.numCells());
    g.areaR_.resize(static_cast<std::size_t>(nr + 1) * nq);
    g.areaQ_.resize(static_cast<std::size_t>(nr) * (nq + 1));

    double minLength = std::numeric_limits<double>::max();

    for (int i = 0; i <= nr; ++i) {
        double r = g.faceR_[i];
        for (int j = 0; j < nq; ++j) {
            double dcos = std::cos(g.faceQ_[j]) - std::cos(g.faceQ_[j + 1]);
            g.areaR_[static_cast<std::size_t>(i) * nq + j] = 2.0 * std::numbers::pi * r * r * dcos;
        }
    }

    for (int i = 0; i < nr; ++i) {
        double r0 = g.faceR_[i];
        double r1 = g.faceR_[i + 1];
        double dr = r1 - r0;
        double dr2 = r1 * r1 - r0 * r0;
        double dr3 = r1 * r1 * r1 - r0 * r0 * r0;

        if (!(dr > 0.0) || !std::isfinite(dr3)) {
            std::ostringstream oss;
            oss << "PolarMesh: block " << block << " has non-positive radial extent in zone " << i;
            throw ConfigurationError(oss.str());
        }

        for (int j = 0; j <= nq; ++j)
            g.areaQ_[static_cast<std::size_t>(i) * (nq + 1) + j] = std::numbers::pi * dr2 * std::sin(g.faceQ_[j]);

        for (int j = 0; j < nq; ++j) {
            double dcos = std::cos(g.faceQ_[j]) - std::cos(g.faceQ_[j + 1]);
            double dV = 2.0 * std::numbers::pi / 3.0 * dr3 * dcos;
            if (!(dV > 0.0)) {
                std::ostringstream oss;
                oss << "PolarMesh: block " << block << " has non-positive volume in cell ("
                    << i << ", " << j << ")";
                throw ConfigurationError(oss.str());
            }
            g.volume_[g.index(i, j)] = dV;
        }

        minLength = std::min(minLength, std::min(dr, r0 * dq_));
    }

    g.minCellLength_ = minLength;
    return g;
}

} // namespace Kilonova
