#ifndef CHECKPOINT_HPP
#define CHECKPOINT_HPP

#include "SolutionState.hpp"
#include "Tasks.hpp"
#include <string>

namespace Kilonova {

/// Everything needed to resume a run: the solution and the task schedule.
struct Checkpoint {
    SolutionState state;
    Tasks tasks;
};

/// HDF5 checkpoint files.
///
/// Layout:
///   /                  attributes iteration, time
///   /tasks/<name>      attributes count, nextTime (one group per task)
///   /blocks/<radial>   dataset of shape (cells, 5): mass, momR, momQ,
///                      energy, scalar per cell
class CheckpointIO {
public:
    static void write(const std::string& filename,
                      const SolutionState& state,
                      const Tasks& tasks);

    /// Throws std::runtime_error for a missing, truncated or foreign file.
    static Checkpoint read(const std::string& filename);
};

} // namespace Kilonova

#endif // CHECKPOINT_HPP
