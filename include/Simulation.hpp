#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "Hydrodynamics.hpp"
#include "InitialModel.hpp"
#include "PolarMesh.hpp"
#include "Runtime.hpp"
#include "Scheme.hpp"
#include "SimulationConfig.hpp"
#include "SolutionState.hpp"
#include "Tasks.hpp"
#include <memory>
#include <string>

namespace Kilonova {

/// A configured run: physics, model, mesh and scheme selected once from
/// the configuration, plus the state and task schedule being advanced.
class Simulation {
public:
    /// Validates the configuration and samples the initial state.
    Simulation(Runtime& rt, const SimulationConfig& config);

    /// Replace the state and schedule with those of a checkpoint file.
    void restore(const std::string& checkpointFile);

    /// Run to control.finalTime, writing checkpoints and products into
    /// control.outputDirectory. Returns the final state.
    const SolutionState& run();

    const SimulationConfig& config() const { return config_; }
    const SolutionState& state() const { return state_; }
    const Tasks& tasks() const { return tasks_; }
    const Hydrodynamics& hydro() const { return *hydro_; }
    const InitialModel& model() const { return *model_; }
    const PolarMesh& mesh() const { return mesh_; }

    /// Output file names, e.g. chkpt.0003.h5
    static std::string checkpointName(int index);

private:
    Runtime& rt_;
    SimulationConfig config_;
    std::shared_ptr<Hydrodynamics> hydro_;
    std::shared_ptr<InitialModel> model_;
    PolarMesh mesh_;
    Scheme scheme_;
    SolutionState state_;
    Tasks tasks_;
};

} // namespace Kilonova

#endif // SIMULATION_HPP
