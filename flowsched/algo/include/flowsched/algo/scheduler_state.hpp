#pragma once

#include <flowsched/algo/constraint_ledger.hpp>
#include <flowsched/algo/running_task_tracker.hpp>

#include <flowsched/core/task.hpp>

#include <optional>

namespace flowsched::algo {

/// @brief Mutable scheduling state shared by one simulation.
/// @ingroup algo
///
/// Groups the job constraints, the running set and the id of the task
/// dispatched in the previous cycle, which the next cycle uses to send the
/// lagged retrain message. One instance per simulation; pass it by
/// reference to every component that needs it.
struct SchedulerState {
    ConstraintLedger ledger;
    RunningTaskTracker tracker{ledger};

    /// @brief Task dispatched by the most recent cycle, across run() calls.
    std::optional<core::TaskId> last_dispatched;

    SchedulerState() = default;
    SchedulerState(const SchedulerState&) = delete;
    SchedulerState& operator=(const SchedulerState&) = delete;
    SchedulerState(SchedulerState&&) = delete;
    SchedulerState& operator=(SchedulerState&&) = delete;
};

} // namespace flowsched::algo
