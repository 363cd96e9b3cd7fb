#pragma once

#include <flowsched/core/task.hpp>
#include <flowsched/core/types.hpp>

#include <vector>

namespace flowsched::algo {

class ConstraintLedger;
class RunningTaskTracker;

/// @brief Tasks eligible at a given simulation time.
/// @ingroup algo
struct ReadySet {
    core::TimePoint time;             ///< Time at which @c tasks are eligible.
    std::vector<core::Task*> tasks;   ///< Eligible tasks, in pending-list order.
};

/// @brief Computes which pending tasks may start.
/// @ingroup algo
///
/// A pending task is eligible when its submission time has been reached
/// and the ConstraintLedger allows it to join its job's running set.
/// The selector never reorders: priority is the oracle's business.
///
/// @see ConstraintLedger, RunningTaskTracker, DispatchLoop
class ReadyJobSelector {
public:
    ReadyJobSelector(const ConstraintLedger& ledger, RunningTaskTracker& tracker);

    /// @brief Pending tasks that may start at @p time, in insertion order.
    /// @throws UnknownJobError if a task belongs to an unregistered job.
    [[nodiscard]] std::vector<core::Task*> eligible_now(const std::vector<core::Task*>& pending,
                                                        core::TimePoint time) const;

    /// @brief First time at or after @p time when some pending task is eligible.
    ///
    /// While nothing is eligible, time moves to the earlier of the next known
    /// completion and the next submission after the current time, and tasks
    /// that finished by then are released. Every step either advances time
    /// or releases a task, so the search is bounded.
    ///
    /// @return The effective time (never earlier than @p time) and the tasks
    ///         eligible then.
    /// @throws NoMoreWorkError if nothing is pending and nothing runs, or if
    ///         no known future event can make a pending task eligible.
    [[nodiscard]] ReadySet next_available(const std::vector<core::Task*>& pending,
                                          core::TimePoint time);

private:
    const ConstraintLedger& ledger_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    RunningTaskTracker& tracker_;     // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace flowsched::algo
