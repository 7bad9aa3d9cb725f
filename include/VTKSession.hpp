#ifndef VTK_SESSION_HPP
#define VTK_SESSION_HPP

#include "VTKWriter.hpp"
#include "Runtime.hpp"
#include <string>

namespace Kilonova {

class Hydrodynamics;
class PolarMesh;
class SolutionState;

/// Encapsulates the products output lifecycle: PVD open/append/close,
/// per-block VTS writing (one pool task per block) and the PVTS meta-file.
class VTKSession {
public:
    /// firstFileNum > 0 continues an existing series after a restart; its
    /// entries numbered firstFileNum and later are dropped.
    VTKSession(Runtime& rt, const std::string& baseName,
               const PolarMesh& mesh, const Hydrodynamics& hydro,
               const std::string& dir = "data", int firstFileNum = 0);

    /// Write the primitive fields of the state as the next products file.
    /// Returns the path of the .pvts meta-file.
    std::string write(const SolutionState& state);

    /// Close the PVD time-series file.
    void finalize();

    int fileNum() const { return fileNum_; }

private:
    Runtime& rt_;
    const PolarMesh& mesh_;
    const Hydrodynamics& hydro_;
    std::string baseName_;
    std::string dir_;
    int fileNum_ = 0;

    std::string pvdPath() const { return dir_ + "/" + baseName_ + ".pvd"; }
};

} // namespace Kilonova

#endif // VTK_SESSION_HPP
