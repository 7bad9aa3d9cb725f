#include "TimeLoop.hpp"
#include "Runtime.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace Kilonova {

void performSideEffects(Runtime& rt,
                        const SolutionState& state,
                        Tasks& tasks,
                        const TimeLoopParams& params,
                        const SideEffects& effects)
{
    const double time = state.time();

    if (tasks.iterationMessage.isDue(time)) {
        double seconds = tasks.iterationMessage.advance(0.0);
        // The first message of a run has no meaningful zone rate
        if (tasks.iterationMessage.countThisRun() > 1) {
            double mzps = 1e-6 * static_cast<double>(state.totalZones()) * params.fold / seconds;

            std::ostringstream oss;
            oss << "[" << std::setw(5) << std::setfill('0') << state.iteration() << "]"
                << std::setfill(' ')
                << " t=" << std::fixed << std::setprecision(3) << time
                << " blocks=" << state.numBlocks()
                << " Mzps=" << std::fixed << std::setprecision(2) << mzps << "\n";
            rt.print(oss.str());
        }
    }

    if (effects.writeCheckpoint && tasks.writeCheckpoint.isDue(time)) {
        tasks.writeCheckpoint.advance(params.checkpointInterval);
        effects.writeCheckpoint(state, tasks, static_cast<int>(tasks.writeCheckpoint.count() - 1));
    }

    if (effects.writeProducts && tasks.writeProducts.isDue(time)) {
        tasks.writeProducts.advance(params.productsInterval);
        effects.writeProducts(state, static_cast<int>(tasks.writeProducts.count() - 1));
    }

    if (params.progressInterval > 0.0 && tasks.reportProgress.isDue(time)) {
        double seconds = tasks.reportProgress.advance(params.progressInterval);
        if (tasks.reportProgress.countThisRun() > 1) {
            double pct = 100.0 * time / params.finalTime;

            std::ostringstream oss;
            oss << "  t/T = " << std::fixed << std::setprecision(1) << std::setw(5) << pct << "%"
                << " | wall since last report = " << std::scientific << std::setprecision(2)
                << seconds << " s\n";
            rt.print(oss.str());
        }
    }
}

SolutionState runTimeLoop(
    Runtime& rt,
    SolutionState state,
    Tasks& tasks,
    const std::function<SolutionState(const SolutionState&)>& advanceFn,
    const TimeLoopParams& params,
    const SideEffects& effects)
{
    rt.print("Running simulation to t = ", params.finalTime, "...\n");

    const std::uint64_t firstIteration = state.iteration();
    double wallTotal = 0.0;

    while (state.time() < params.finalTime) {
        performSideEffects(rt, state, tasks, params, effects);

        auto t0 = std::chrono::high_resolution_clock::now();
        state = advanceFn(state);
        auto t1 = std::chrono::high_resolution_clock::now();
        wallTotal += std::chrono::duration<double>(t1 - t0).count();
    }

    performSideEffects(rt, state, tasks, params, effects);

    {
        std::ostringstream summary;
        summary << "\nSimulation complete: " << state.iteration() - firstIteration
                << " steps, t = " << std::scientific << std::setprecision(6) << state.time()
                << ", wall time = " << std::fixed << std::setprecision(3) << wallTotal << " s\n";
        rt.print(summary.str());
    }

    return state;
}

} // namespace Kilonova
