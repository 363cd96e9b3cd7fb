#pragma once

#include <flowsched/algo/dispatch_loop.hpp>

#include <flowsched/core/deferred.hpp>
#include <flowsched/core/task.hpp>

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace flowsched::core {
class Engine;
} // namespace flowsched::core

namespace flowsched::algo {

/// @brief Drives a whole workflow through the engine.
/// @ingroup algo
///
/// Owns the pending list and the glue between engine events and the
/// DispatchLoop:
/// - a task enters the pending list once its last parent finished; tasks
///   without parents enter at start;
/// - every change (start, submission time reached, completion) requests one
///   deferred scheduling pass for the current timestep;
/// - each placed task gets a completion timer after
///   length / (mips * cores used) seconds;
/// - a completion stamps the finish time, frees the resource, releases the
///   children and requests a pass.
///
/// When the event queue runs dry while tasks are still pending, the
/// ReadyJobSelector is asked for the next time something can start. If
/// nothing ever can, the run fails with SchedulingStalledError.
///
/// The engine must be finalized before construction.
///
/// @see DispatchLoop, ResourcePlacer
class WorkflowSimulation {
public:
    /// @throws core::InvalidStateError if the engine is not finalized.
    /// @throws core::OutOfRangeError if a task names an unknown parent.
    WorkflowSimulation(core::Engine& engine, SchedulerState& state, ResourcePlacer& placer,
                       DecisionOracle& oracle, const StateEncoder& encoder, const RewardModel& reward);

    /// @brief Run until every task has finished.
    /// @throws SchedulingStalledError if unfinished tasks can never start.
    /// @throws InvalidDecisionError, OracleUnavailableError from the dispatch loop.
    void run();

    [[nodiscard]] const std::vector<core::Task*>& pending() const noexcept { return pending_; }
    [[nodiscard]] std::size_t finished_count() const noexcept { return finished_; }
    [[nodiscard]] std::size_t task_count() const noexcept { return total_; }

    /// @brief Number of deferred scheduling passes executed so far.
    [[nodiscard]] std::size_t passes() const noexcept { return passes_; }

    /// @brief Placement violations summed over all passes.
    [[nodiscard]] std::size_t placement_violations() const noexcept { return violations_; }

    [[nodiscard]] DispatchLoop& dispatch_loop() noexcept { return loop_; }

    WorkflowSimulation(const WorkflowSimulation&) = delete;
    WorkflowSimulation& operator=(const WorkflowSimulation&) = delete;

private:
    void on_schedule();
    void start_task(core::Task& task);
    void on_completion(core::Task& task);
    void make_eligible(core::Task& task);
    void check_progress();
    [[noreturn]] void stall(const char* why);

    core::Engine& engine_;
    SchedulerState& state_;
    ResourcePlacer& placer_;
    DispatchLoop loop_;

    std::vector<core::Task*> pending_;
    std::unordered_map<core::TaskId, std::vector<core::Task*>> children_;
    std::unordered_map<core::TaskId, std::size_t> waiting_parents_;
    core::DeferredId schedule_deferred_;

    std::size_t total_{0};
    std::size_t finished_{0};
    std::size_t passes_{0};
    std::size_t violations_{0};
};

} // namespace flowsched::algo
