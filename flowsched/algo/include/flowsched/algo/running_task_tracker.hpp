#pragma once

#include <flowsched/core/task.hpp>
#include <flowsched/core/types.hpp>

#include <cstddef>
#include <vector>

namespace flowsched::algo {

class ConstraintLedger;

/// @brief Global list of in-flight tasks.
/// @ingroup algo
///
/// Holds non-owning pointers in dispatch order. Every task added here is
/// also recorded in the ConstraintLedger, and removed from it again when
/// released, so the two never disagree about what is running.
///
/// A task is released once its finish time is set and no later than the
/// time passed to release_finished(); tasks whose completion has not been
/// observed yet stay tracked.
///
/// @see ConstraintLedger, ReadyJobSelector
class RunningTaskTracker {
public:
    explicit RunningTaskTracker(ConstraintLedger& ledger);

    /// @brief Start tracking @p task, stamp its start time, mark it running.
    void add(core::Task& task, core::TimePoint now);

    /// @brief Remove and return every task that finished at or before @p current_time.
    ///
    /// Each released task is also removed from its job's running set. Tasks
    /// are returned in dispatch order. Calling this again with the same or
    /// a later time is safe; nothing happens when nothing has finished.
    std::vector<core::Task*> release_finished(core::TimePoint current_time);

    /// @brief Earliest known finish time among tracked tasks.
    /// @return TimePoint::infinity() when no tracked task has a finish time.
    [[nodiscard]] core::TimePoint next_finish_time() const;

    [[nodiscard]] bool contains(const core::Task& task) const;
    [[nodiscard]] std::size_t size() const noexcept { return running_.size(); }
    [[nodiscard]] bool empty() const noexcept { return running_.empty(); }
    [[nodiscard]] const std::vector<core::Task*>& tasks() const noexcept { return running_; }

private:
    ConstraintLedger& ledger_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::vector<core::Task*> running_;
};

} // namespace flowsched::algo
