#pragma once

#include <flowsched/core/task.hpp>
#include <flowsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace flowsched::algo {

/// @brief Side information sent with every decision request.
/// @ingroup algo_oracle
struct DecisionContext {
    core::TimePoint time;        ///< Simulation time of the dispatch cycle.
    std::size_t ready_count;     ///< Number of tasks the action may index.
    std::size_t idle_resources;  ///< Idle placeable resources at request time.
};

/// @brief Abstract interface to the external decision-making policy.
/// @ingroup algo_oracle
///
/// All calls are blocking round-trips. Implementations report any transport
/// failure as OracleUnavailableError and never retry on their own: a lost
/// reward or retrain message would silently corrupt the training signal.
///
/// @see DispatchLoop, FirstFitOracle
class DecisionOracle {
public:
    virtual ~DecisionOracle() = default;

    /// @brief Pick the next task to dispatch.
    /// @param context Cycle metadata.
    /// @param state   Encoded ready tasks and resources.
    /// @return Index into the ready list, or -1 when no resource can take any
    ///         ready task right now.
    virtual int32_t decide(const DecisionContext& context, const std::vector<int64_t>& state) = 0;

    /// @brief Report the reward earned by dispatching @p task_id.
    virtual void report_reward(core::TaskId task_id, double reward) = 0;

    /// @brief Close the learning step of @p previous_task_id with the state
    ///        observed one cycle later.
    virtual void retrain(core::TaskId previous_task_id, const std::vector<int64_t>& state) = 0;

protected:
    DecisionOracle() = default;
    DecisionOracle(const DecisionOracle&) = default;
    DecisionOracle& operator=(const DecisionOracle&) = default;
    DecisionOracle(DecisionOracle&&) = default;
    DecisionOracle& operator=(DecisionOracle&&) = default;
};

} // namespace flowsched::algo
