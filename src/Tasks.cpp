#include "Tasks.hpp"
#include <stdexcept>
#include <string>

namespace Kilonova {

RecurringTask::RecurringTask(double startTime)
    : nextTime_(startTime)
    , lastPerformed_(Clock::now())
{
}

RecurringTask::RecurringTask(std::uint64_t count, double nextTime)
    : count_(count)
    , nextTime_(nextTime)
    , lastPerformed_(Clock::now())
{
}

double RecurringTask::advance(double interval) {
    if (interval < 0.0)
        throw std::invalid_argument("RecurringTask::advance: negative interval "
            + std::to_string(interval));

    Clock::time_point now = Clock::now();
    double seconds = std::chrono::duration<double>(now - lastPerformed_).count();

    count_ += 1;
    countThisRun_ += 1;
    nextTime_ += interval;
    lastPerformed_ = now;
    return seconds;
}

} // namespace Kilonova
