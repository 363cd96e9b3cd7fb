#include <flowsched/algo/running_task_tracker.hpp>
#include <flowsched/algo/constraint_ledger.hpp>

#include <algorithm>

namespace flowsched::algo {

RunningTaskTracker::RunningTaskTracker(ConstraintLedger& ledger)
    : ledger_(ledger) {}

void RunningTaskTracker::add(core::Task& task, core::TimePoint now) {
    ledger_.add_running(task);
    task.set_start_time(now);
    task.set_state(core::TaskState::Running);
    running_.push_back(&task);
}

std::vector<core::Task*> RunningTaskTracker::release_finished(core::TimePoint current_time) {
    std::vector<core::Task*> released;

    auto finished = [&](core::Task* task) {
        auto finish = task->finish_time();
        return finish.has_value() && *finish <= current_time;
    };

    auto first_kept = std::stable_partition(running_.begin(), running_.end(),
                                            [&](core::Task* t) { return !finished(t); });
    released.assign(first_kept, running_.end());
    running_.erase(first_kept, running_.end());

    for (core::Task* task : released) {
        ledger_.remove_running(*task);
    }
    return released;
}

core::TimePoint RunningTaskTracker::next_finish_time() const {
    core::TimePoint earliest = core::TimePoint::infinity();
    for (const core::Task* task : running_) {
        auto finish = task->finish_time();
        if (finish.has_value() && *finish < earliest) {
            earliest = *finish;
        }
    }
    return earliest;
}

bool RunningTaskTracker::contains(const core::Task& task) const {
    return std::find(running_.begin(), running_.end(), &task) != running_.end();
}

} // namespace flowsched::algo
