#include "Simulation.hpp"
#include "Checkpoint.hpp"
#include "TimeLoop.hpp"
#include "VTKSession.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace Kilonova {

Simulation::Simulation(Runtime& rt, const SimulationConfig& config)
    : rt_(rt)
    , config_(config)
    , hydro_(makeHydrodynamics(config.hydro))
    , model_(makeInitialModel(config.model))
    , mesh_(rt.createMesh(config))
    , scheme_(config)
    , tasks_(config.control.startTime)
{
    state_ = SolutionState::fromModel(*model_, *hydro_, mesh_, config_.control.startTime);

    rt_.print("Hydrodynamics: ", hydro_->name(), ", model: ", model_->name(),
              ", ", state_.totalZones(), " zones.\n");
}

std::string Simulation::checkpointName(int index) {
    std::ostringstream oss;
    oss << "chkpt." << std::setw(4) << std::setfill('0') << index << ".h5";
    return oss.str();
}

void Simulation::restore(const std::string& checkpointFile) {
    Checkpoint chk = CheckpointIO::read(checkpointFile);

    // The restored block set must be exactly the active blocks at the restored time
    auto active = mesh_.activeBlocks(chk.state.time());
    const auto& solution = chk.state.solution();
    bool matches = solution.size() == active.size();
    for (std::size_t k = 0; matches && k < active.size(); ++k) {
        auto it = solution.find(active[k]);
        matches = it != solution.end()
            && it->second.size() == mesh_.geometryFor(active[k], chk.state.time()).numCells();
    }
    if (!matches)
        throw ConfigurationError("Simulation::restore: " + checkpointFile
            + " does not match the configured mesh");

    state_ = std::move(chk.state);
    tasks_ = chk.tasks;

    rt_.print("Restored ", checkpointFile, " at t = ", state_.time(),
              " (iteration ", state_.iteration(), ").\n");
}

const SolutionState& Simulation::run() {
    const auto& control = config_.control;
    const std::string& dir = control.outputDirectory;

    VTKSession vtk(rt_, "prods", mesh_, *hydro_, dir,
                   static_cast<int>(tasks_.writeProducts.count()));

    SideEffects effects;
    effects.writeCheckpoint = [&](const SolutionState& state, const Tasks& tasks, int index) {
        std::string filename = dir + "/" + checkpointName(index);
        rt_.print("write ", filename, "\n");
        CheckpointIO::write(filename, state, tasks);
    };
    effects.writeProducts = [&](const SolutionState& state, int) {
        std::string filename = vtk.write(state);
        rt_.print("write ", filename, "\n");
    };

    TimeLoopParams params{.finalTime          = control.finalTime,
                          .checkpointInterval = control.checkpointInterval,
                          .productsInterval   = control.productsInterval,
                          .progressInterval   = 0.1 * (control.finalTime - control.startTime),
                          .fold               = control.fold};

    auto advanceFn = [&](const SolutionState& state) {
        return scheme_.advance(state, *hydro_, *model_, mesh_, rt_.pool(), control.fold);
    };

    state_ = runTimeLoop(rt_, std::move(state_), tasks_, advanceFn, params, effects);
    vtk.finalize();
    return state_;
}

} // namespace Kilonova
