#include <flowsched/algo/ready_job_selector.hpp>
#include <flowsched/algo/constraint_ledger.hpp>
#include <flowsched/algo/error.hpp>
#include <flowsched/algo/running_task_tracker.hpp>

#include <algorithm>
#include <string>

namespace flowsched::algo {

namespace {

// Earliest submission strictly after @p time, or infinity.
core::TimePoint next_submission_after(const std::vector<core::Task*>& pending,
                                      core::TimePoint time) {
    core::TimePoint next = core::TimePoint::infinity();
    for (const core::Task* task : pending) {
        if (task->submission_time() > time && task->submission_time() < next) {
            next = task->submission_time();
        }
    }
    return next;
}

} // anonymous namespace

ReadyJobSelector::ReadyJobSelector(const ConstraintLedger& ledger, RunningTaskTracker& tracker)
    : ledger_(ledger)
    , tracker_(tracker) {}

std::vector<core::Task*> ReadyJobSelector::eligible_now(const std::vector<core::Task*>& pending,
                                                        core::TimePoint time) const {
    std::vector<core::Task*> ready;
    for (core::Task* task : pending) {
        if (task->submission_time() <= time && ledger_.can_run(task->job_id(), task->index())) {
            ready.push_back(task);
        }
    }
    return ready;
}

ReadySet ReadyJobSelector::next_available(const std::vector<core::Task*>& pending,
                                          core::TimePoint time) {
    core::TimePoint current = time;
    while (true) {
        auto ready = eligible_now(pending, current);
        if (!ready.empty()) {
            return ReadySet{current, std::move(ready)};
        }
        if (pending.empty() && tracker_.empty()) {
            throw NoMoreWorkError("no pending and no running tasks");
        }

        core::TimePoint next = std::min(tracker_.next_finish_time(),
                                        next_submission_after(pending, current));
        if (next.is_infinite()) {
            throw NoMoreWorkError("no known completion or submission can unblock the " +
                                  std::to_string(pending.size()) + " pending task(s)");
        }

        // Overdue completions are released at the current time.
        current = std::max(current, next);
        tracker_.release_finished(current);
    }
}

} // namespace flowsched::algo
