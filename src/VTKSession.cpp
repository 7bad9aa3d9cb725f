#include "VTKSession.hpp"
#include "Hydrodynamics.hpp"
#include "PolarMesh.hpp"
#include "SolutionState.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Kilonova {

VTKSession::VTKSession(Runtime& rt, const std::string& baseName,
                       const PolarMesh& mesh, const Hydrodynamics& hydro,
                       const std::string& dir, int firstFileNum)
    : rt_(rt), mesh_(mesh), hydro_(hydro), baseName_(baseName), dir_(dir)
    , fileNum_(firstFileNum)
{
    // Entries from fileNum_ on belong to the run being replaced
    if (fileNum_ == 0 || !std::filesystem::exists(pvdPath()))
        VTKWriter::writePVD(pvdPath(), "w");
    else
        VTKWriter::truncatePVD(pvdPath(), fileNum_);
}

std::string VTKSession::write(const SolutionState& state) {
    std::ostringstream stem;
    stem << baseName_ << "." << std::setw(4) << std::setfill('0') << fileNum_;

    std::vector<BlockIndex> blocks;
    for (const auto& entry : state.solution())
        blocks.push_back(entry.first);

    const std::size_t n = blocks.size();
    const int nr = mesh_.blockSize();
    const int nq = mesh_.numPolarZones();

    std::vector<std::array<int,6>> extents(n);
    std::vector<std::string> files(n);
    for (std::size_t k = 0; k < n; ++k) {
        int i0 = static_cast<int>(k) * nr;
        extents[k] = {i0, i0 + nr, 0, nq, 0, 0};
        files[k] = stem.str() + "_b" + std::to_string(blocks[k].radial) + ".vts";
    }

    rt_.pool().parallelFor(n, [&](std::size_t k) {
        BlockGeometry g = mesh_.geometryFor(blocks[k], state.time());
        const auto& U = state.block(blocks[k]);

        std::vector<PrimitiveState> W(g.numCells());
        for (int i = 0; i < g.nr(); ++i) {
            for (int j = 0; j < g.nq(); ++j) {
                std::size_t idx = g.index(i, j);
                try {
                    W[idx] = hydro_.toPrimitive(U[idx] * (1.0 / g.cellVolume(i, j)));
                } catch (const PhysicsError& e) {
                    throw e.locatedAt(blocks[k].radial, static_cast<long>(idx), state.time());
                }
            }
        }
        VTKWriter::writeVTS(dir_ + "/" + files[k], g, W, extents[k], blocks[k].radial);
    });

    std::string pvtsFile = stem.str() + ".pvts";
    VTKWriter::writePVTS(dir_ + "/" + pvtsFile, static_cast<int>(n) * nr, nq, extents, files);
    VTKWriter::writePVD(pvdPath(), "a", state.time(), pvtsFile);

    fileNum_++;
    return dir_ + "/" + pvtsFile;
}

void VTKSession::finalize() {
    VTKWriter::writePVD(pvdPath(), "close");
}

} // namespace Kilonova
