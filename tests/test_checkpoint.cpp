#include "Checkpoint.hpp"
#include "Errors.hpp"
#include "Hydrodynamics.hpp"
#include "InitialModel.hpp"
#include "PolarMesh.hpp"
#include "Runtime.hpp"
#include "Simulation.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Kilonova;
using Kilonova::test::expectConservedEqual;
using Kilonova::test::smallConfig;

namespace fs = std::filesystem;

namespace {

/// Fresh scratch directory per test, removed afterwards.
class CheckpointTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / ("kilonova_" + std::string(info->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

} // namespace

TEST_F(CheckpointTest, WriteReadRestoresStateAndSchedule) {
    SimulationConfig config = smallConfig();
    config.model.type = ModelType::Explosion;
    auto hydro = makeHydrodynamics(config.hydro);
    auto model = makeInitialModel(config.model);
    PolarMesh mesh(config.mesh);

    SolutionState source = SolutionState::fromModel(*model, *hydro, mesh);
    SolutionState state(42, 0.625, source.solution());

    Tasks tasks;
    tasks.writeCheckpoint.advance(0.25);
    tasks.writeCheckpoint.advance(0.25);
    tasks.writeProducts.advance(0.5);
    tasks.iterationMessage.advance(0.0);

    std::string filename = (dir / "out" / "chkpt.0001.h5").string();
    CheckpointIO::write(filename, state, tasks);
    Checkpoint chk = CheckpointIO::read(filename);

    EXPECT_EQ(chk.state.iteration(), 42u);
    EXPECT_EQ(chk.state.time(), 0.625);
    ASSERT_EQ(chk.state.numBlocks(), state.numBlocks());
    for (const auto& entry : state.solution()) {
        const auto& restored = chk.state.block(entry.first);
        ASSERT_EQ(restored.size(), entry.second.size());
        for (std::size_t c = 0; c < restored.size(); ++c)
            expectConservedEqual(restored[c], entry.second[c]);
    }

    EXPECT_EQ(chk.tasks.writeCheckpoint.count(), 2u);
    EXPECT_EQ(chk.tasks.writeCheckpoint.nextTime(), 0.5);
    EXPECT_EQ(chk.tasks.writeCheckpoint.countThisRun(), 0u);
    EXPECT_EQ(chk.tasks.writeProducts.count(), 1u);
    EXPECT_EQ(chk.tasks.writeProducts.nextTime(), 0.5);
    EXPECT_EQ(chk.tasks.iterationMessage.count(), 1u);
    EXPECT_EQ(chk.tasks.reportProgress.count(), 0u);
}

TEST_F(CheckpointTest, MissingFileThrows) {
    EXPECT_THROW(CheckpointIO::read((dir / "absent.h5").string()), std::runtime_error);
}

TEST_F(CheckpointTest, ForeignFileThrows) {
    std::string filename = (dir / "foreign.h5").string();
    {
        std::ofstream out(filename, std::ios::binary);
        out << "not a checkpoint at all";
    }
    EXPECT_THROW(CheckpointIO::read(filename), std::runtime_error);
}

TEST_F(CheckpointTest, TruncatedFileThrows) {
    SimulationConfig config = smallConfig();
    auto hydro = makeHydrodynamics(config.hydro);
    auto model = makeInitialModel(config.model);
    PolarMesh mesh(config.mesh);

    std::string filename = (dir / "chkpt.0000.h5").string();
    CheckpointIO::write(filename, SolutionState::fromModel(*model, *hydro, mesh), Tasks());
    fs::resize_file(filename, fs::file_size(filename) / 2);

    EXPECT_THROW(CheckpointIO::read(filename), std::runtime_error);
}

// ---- Full runs ----

TEST_F(CheckpointTest, RunWritesCheckpointsAndProducts) {
    SimulationConfig config = smallConfig();
    config.model.type = ModelType::Explosion;
    config.control.outputDirectory = dir.string();

    Runtime rt(2, true);
    Simulation sim(rt, config);
    const SolutionState& state = sim.run();

    EXPECT_GE(state.time(), 1.0);
    for (int n = 0; n < 5; ++n)
        EXPECT_TRUE(fs::exists(dir / Simulation::checkpointName(n))) << n;
    EXPECT_FALSE(fs::exists(dir / Simulation::checkpointName(5)));

    EXPECT_TRUE(fs::exists(dir / "prods.pvd"));
    EXPECT_TRUE(fs::exists(dir / "prods.0000.pvts"));
    EXPECT_TRUE(fs::exists(dir / "prods.0002.pvts"));
    EXPECT_TRUE(fs::exists(dir / "prods.0002_b0.vts"));
    EXPECT_FALSE(fs::exists(dir / "prods.0003.pvts"));
}

TEST_F(CheckpointTest, RestartContinuesSchedule) {
    SimulationConfig config = smallConfig();
    config.model.type = ModelType::Explosion;
    config.control.outputDirectory = dir.string();

    Runtime rt(2, true);
    Simulation first(rt, config);
    SolutionState reference = first.run();

    Simulation second(rt, config);
    second.restore((dir / Simulation::checkpointName(2)).string());
    EXPECT_GE(second.state().time(), 0.5);
    EXPECT_EQ(second.tasks().writeCheckpoint.count(), 3u);
    EXPECT_EQ(second.tasks().writeCheckpoint.nextTime(), 0.75);

    const SolutionState& resumed = second.run();
    EXPECT_EQ(resumed.iteration(), reference.iteration());
    EXPECT_EQ(resumed.time(), reference.time());
    EXPECT_EQ(second.tasks().writeCheckpoint.count(), 5u);

    // The products series lists each output once: t = 0, 0.5, 1
    std::ifstream pvd(dir / "prods.pvd");
    std::vector<std::string> entries;
    for (std::string line; std::getline(pvd, line);)
        if (line.find("<DataSet ") != std::string::npos)
            entries.push_back(line);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_NE(entries[0].find("prods.0000.pvts"), std::string::npos);
    EXPECT_NE(entries[1].find("prods.0001.pvts"), std::string::npos);
    EXPECT_NE(entries[2].find("prods.0002.pvts"), std::string::npos);
}

TEST_F(CheckpointTest, RestoreRejectsMismatchedMesh) {
    SimulationConfig config = smallConfig();
    config.control.outputDirectory = dir.string();
    Runtime rt(1, true);

    Simulation coarse(rt, config);
    std::string filename = (dir / "coarse.h5").string();
    CheckpointIO::write(filename, coarse.state(), coarse.tasks());

    SimulationConfig wider = config;
    wider.mesh.numPolarZones = 32;
    Simulation other(rt, wider);
    EXPECT_THROW(other.restore(filename), ConfigurationError);
}

TEST_F(CheckpointTest, RestoreRejectsMissingBlock) {
    SimulationConfig config = smallConfig();
    config.control.outputDirectory = dir.string();
    Runtime rt(1, true);

    Simulation sim(rt, config);
    ASSERT_EQ(sim.state().numBlocks(), 3u);

    SolutionState::BlockMap solution = sim.state().solution();
    solution.erase(BlockIndex(2));
    std::string filename = (dir / "gapped.h5").string();
    CheckpointIO::write(filename, SolutionState(0, 0.0, solution), sim.tasks());

    EXPECT_THROW(sim.restore(filename), ConfigurationError);
    EXPECT_EQ(sim.state().numBlocks(), 3u);
}

TEST_F(CheckpointTest, RestoreRejectsExtraBlock) {
    SimulationConfig config = smallConfig();
    config.control.outputDirectory = dir.string();
    Runtime rt(1, true);

    Simulation sim(rt, config);
    SolutionState::BlockMap solution = sim.state().solution();
    solution.emplace(BlockIndex(3), solution.at(BlockIndex(2)));
    std::string filename = (dir / "padded.h5").string();
    CheckpointIO::write(filename, SolutionState(0, 0.0, solution), sim.tasks());

    EXPECT_THROW(sim.restore(filename), ConfigurationError);
}
