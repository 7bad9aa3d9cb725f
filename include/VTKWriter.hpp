#ifndef VTK_WRITER_HPP
#define VTK_WRITER_HPP

#include "State.hpp"
#include <array>
#include <string>
#include <vector>

namespace Kilonova {

class BlockGeometry;

/// VTK XML StructuredGrid writer for ParaView visualization.
///
/// Each block of the polar mesh becomes one .vts piece in the meridional
/// (x, z) plane, with x = r sin(theta) and z = r cos(theta). A .pvts
/// meta-file stitches the pieces together and a .pvd collection indexes
/// the time series.
class VTKWriter {
public:
    /// Write a single .vts piece file.
    /// pieceExtent: {i0, i1, j0, j1, k0, k1} point extent within the whole grid.
    /// blockId: radial block index for the "Block" cell data field.
    static void writeVTS(const std::string& filename,
                         const BlockGeometry& geometry,
                         const std::vector<PrimitiveState>& primitives,
                         const std::array<int,6>& pieceExtent,
                         long blockId);

    /// Write .pvts parallel meta-file referencing piece files.
    /// @param globalNr/Nq  Whole-grid cell counts for WholeExtent.
    static void writePVTS(const std::string& filename,
                          int globalNr, int globalNq,
                          const std::vector<std::array<int,6>>& pieceExtents,
                          const std::vector<std::string>& pieceFiles);

    /// Three-phase .pvd time-series file:
    ///   mode="w"     -- write header
    ///   mode="a"     -- append timestep entry
    ///   mode="close" -- write closing tags
    static void writePVD(const std::string& filename,
                         const std::string& mode,
                         double time = 0.0,
                         const std::string& dataFile = "");

    /// Keep only the first numKept timestep entries of an existing .pvd file.
    static void truncatePVD(const std::string& filename, int numKept);
};

} // namespace Kilonova

#endif // VTK_WRITER_HPP
