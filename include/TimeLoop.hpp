#ifndef TIME_LOOP_HPP
#define TIME_LOOP_HPP

#include "SolutionState.hpp"
#include "Tasks.hpp"

#include <functional>

namespace Kilonova {

class Runtime;

// ---- Time loop ----

struct TimeLoopParams {
    double finalTime;
    double checkpointInterval;
    double productsInterval;
    double progressInterval = 0.0;  // <= 0 disables progress reports
    int fold = 1;                   // elementary steps per advance, for the zone rate
};

/// Output hooks; an empty function disables the task.
/// The int argument is the file number (task count before this event).
struct SideEffects {
    std::function<void(const SolutionState&, const Tasks&, int)> writeCheckpoint;
    std::function<void(const SolutionState&, int)> writeProducts;
};

/// Perform every task that is due at the state's time, in the order
/// iteration message, checkpoint, products, progress report.
void performSideEffects(Runtime& rt,
                        const SolutionState& state,
                        Tasks& tasks,
                        const TimeLoopParams& params,
                        const SideEffects& effects);

/// Advance until state.time() >= finalTime, performing side effects before
/// every advance and once more at the end. Returns the final state.
SolutionState runTimeLoop(
    Runtime& rt,
    SolutionState state,
    Tasks& tasks,
    const std::function<SolutionState(const SolutionState&)>& advanceFn,
    const TimeLoopParams& params,
    const SideEffects& effects);

} // namespace Kilonova

#endif // TIME_LOOP_HPP
