#ifndef TASKS_HPP
#define TASKS_HPP

#include <chrono>
#include <cstdint>

namespace Kilonova {

/// A side effect (reporting, output) that recurs in simulation time.
///
/// The task is due when nextTime() <= the state's time. Performing it
/// advances nextTime by an interval, so nextTime never decreases.
class RecurringTask {
public:
    using Clock = std::chrono::steady_clock;

    /// Fresh task, first due at startTime.
    explicit RecurringTask(double startTime = 0.0);

    /// Restored task; the wall clock and per-run count start over.
    RecurringTask(std::uint64_t count, double nextTime);

    bool isDue(double time) const { return nextTime_ <= time; }

    /// Mark the task performed and reschedule it interval later.
    /// Returns the wall seconds since it was last performed.
    /// Throws std::invalid_argument for a negative interval.
    double advance(double interval);

    std::uint64_t count() const { return count_; }
    std::uint64_t countThisRun() const { return countThisRun_; }
    double nextTime() const { return nextTime_; }
    Clock::time_point lastPerformed() const { return lastPerformed_; }

private:
    std::uint64_t count_ = 0;
    double nextTime_ = 0.0;
    Clock::time_point lastPerformed_;
    std::uint64_t countThisRun_ = 0;
};

/// Every recurring task of a run. Saved with checkpoints.
struct Tasks {
    RecurringTask writeCheckpoint;
    RecurringTask writeProducts;
    RecurringTask iterationMessage;
    RecurringTask reportProgress;

    explicit Tasks(double startTime = 0.0)
        : writeCheckpoint(startTime)
        , writeProducts(startTime)
        , iterationMessage(startTime)
        , reportProgress(startTime) {}
};

} // namespace Kilonova

#endif // TASKS_HPP
