#include "Runtime.hpp"

namespace Kilonova {

// ---- Constructor ----

Runtime::Runtime(int numThreads, bool quiet)
    : pool_(numThreads)
    , quiet_(quiet)
{
}

// ---- Mesh creation ----

PolarMesh Runtime::createMesh(const SimulationConfig& config) {
    config.validate();
    PolarMesh mesh(config.mesh);

    auto blocks = mesh.activeBlocks(config.control.startTime);
    print("Created polar mesh with ", blocks.size(), " blocks of ",
          mesh.blockSize(), " x ", mesh.numPolarZones(), " zones (",
          blocks.size() * mesh.cellsPerBlock(), " total) on ",
          numThreads(), " threads.\n");
    return mesh;
}

} // namespace Kilonova
