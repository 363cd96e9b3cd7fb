#pragma once

#include <flowsched/algo/ready_job_selector.hpp>

#include <flowsched/core/resource.hpp>
#include <flowsched/core/task.hpp>

#include <cstddef>
#include <cstdint>
#include <unordered_set>
#include <vector>

namespace flowsched::core {
class Engine;
} // namespace flowsched::core

namespace flowsched::algo {

class DecisionOracle;
class ResourcePlacer;
class RewardModel;
class StateEncoder;
struct SchedulerState;

/// @brief Outcome of one DispatchLoop::run() pass.
/// @ingroup algo
struct DispatchResult {
    /// @brief Why the pass stopped.
    enum class ExitReason {
        NoReadyTasks,   ///< Nothing pending was eligible.
        OracleDeclined  ///< The oracle answered -1.
    };

    std::size_t placed{0};      ///< Tasks dispatched during the pass.
    std::size_t violations{0};  ///< Picks that found no idle resource.
    ExitReason reason{ExitReason::NoReadyTasks};
};

/// @brief Oracle-driven dispatch cycle.
/// @ingroup algo
///
/// Each cycle releases finished tasks, computes the eligible set, encodes
/// it, asks the oracle for an index and places the chosen task:
///
/// @code
/// READY -> ENCODING -> AWAITING_DECISION -> PLACED -> READY ...
///                                        \-> EXHAUSTED
/// @endcode
///
/// After each placement the reward for the placed task is reported, then
/// the previous cycle's task is retrained against this cycle's state. The
/// lag survives across run() calls through SchedulerState::last_dispatched.
///
/// Single-threaded. The pass runs at the engine's current time and never
/// advances it.
///
/// @see ReadyJobSelector, ResourcePlacer, DecisionOracle
class DispatchLoop {
public:
    DispatchLoop(core::Engine& engine, SchedulerState& state, ResourcePlacer& placer,
                 DecisionOracle& oracle, const StateEncoder& encoder, const RewardModel& reward);

    /// @brief Dispatch as many pending tasks as the oracle accepts.
    ///
    /// Placed tasks are erased from @p pending and recorded in the tracker.
    /// A pick that finds every resource busy is traced as a placement
    /// violation and the task is skipped until the next pass.
    ///
    /// @throws InvalidDecisionError if the oracle picks an invalid index.
    /// @throws OracleUnavailableError on oracle failure.
    /// @throws UnknownJobError if a pending task's job is not registered.
    DispatchResult run(std::vector<core::Task*>& pending);

    [[nodiscard]] ReadyJobSelector& selector() noexcept { return selector_; }

    DispatchLoop(const DispatchLoop&) = delete;
    DispatchLoop& operator=(const DispatchLoop&) = delete;

private:
    [[nodiscard]] std::vector<core::Task*> ready_tasks(const std::vector<core::Task*>& pending,
                                                       const std::unordered_set<core::Task*>& skipped) const;
    void send_feedback(const core::Task& task, const core::Resource& resource,
                       const std::vector<int64_t>& state);

    core::Engine& engine_;
    SchedulerState& state_;
    ResourcePlacer& placer_;
    DecisionOracle& oracle_;
    const StateEncoder& encoder_;
    const RewardModel& reward_;
    ReadyJobSelector selector_;
};

} // namespace flowsched::algo
