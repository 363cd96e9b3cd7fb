#pragma once

#include <flowsched/core/task.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace flowsched::algo {

/// @brief Base exception for scheduling errors.
/// @ingroup algo
///
/// Everything the scheduling layer throws derives from this class so the
/// driver can separate scheduling failures from loader or engine errors.
class SchedulingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief A job definition cannot be turned into valid constraints.
/// @ingroup algo
///
/// Raised at load time when the parallel groups do not parse into
/// non-empty integer sets, when the concurrency limit is not a positive
/// integer, or when a job id is registered twice. Nothing is registered
/// when this is thrown.
///
/// @see ConstraintLedger::create_job, parse_parallel_groups
class MalformedConstraintError : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

/// @brief The ledger was queried for a job that was never registered.
/// @ingroup algo
///
/// Jobs must be registered before any of their tasks reach the scheduler,
/// so this always points at an integration bug upstream.
class UnknownJobError : public SchedulingError {
public:
    explicit UnknownJobError(core::JobId job_id)
        : SchedulingError("unknown job id " + std::to_string(job_id))
        , job_id_(job_id) {}

    [[nodiscard]] core::JobId job_id() const noexcept { return job_id_; }

private:
    core::JobId job_id_;
};

/// @brief A decide, reward or retrain call to the oracle failed.
/// @ingroup algo
///
/// Never retried: a lost feedback message would corrupt the oracle's
/// training signal, so the scheduling cycle halts instead.
class OracleUnavailableError : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

/// @brief The oracle answered with an action outside the ready list.
/// @ingroup algo
class InvalidDecisionError : public SchedulingError {
public:
    InvalidDecisionError(int action, std::size_t ready_count)
        : SchedulingError("oracle action " + std::to_string(action) +
                          " is outside the ready list of size " + std::to_string(ready_count))
        , action_(action) {}

    [[nodiscard]] int action() const noexcept { return action_; }

private:
    int action_;
};

/// @brief The oracle picked a task but no resource is idle.
/// @ingroup algo
///
/// Soft failure: the dispatch loop records it, skips the task for the
/// current pass and keeps going.
///
/// @see ResourcePlacer::place, DispatchLoop
class PlacementInvariantViolation : public SchedulingError {
public:
    explicit PlacementInvariantViolation(core::TaskId task_id)
        : SchedulingError("no idle resource for task " + std::to_string(task_id) +
                          " although the oracle reported capacity")
        , task_id_(task_id) {}

    [[nodiscard]] core::TaskId task_id() const noexcept { return task_id_; }

private:
    core::TaskId task_id_;
};

/// @brief Nothing pending can ever become eligible from what is known now.
/// @ingroup algo
///
/// Signals the caller to stop looking ahead. Not an abnormal condition.
///
/// @see ReadyJobSelector::next_available
class NoMoreWorkError : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

/// @brief The simulation has unfinished tasks but no way to make progress.
/// @ingroup algo
///
/// @see WorkflowSimulation::run
class SchedulingStalledError : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

} // namespace flowsched::algo
