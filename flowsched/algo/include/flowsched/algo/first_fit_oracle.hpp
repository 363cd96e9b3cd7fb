#pragma once

#include <flowsched/algo/oracle.hpp>

#include <cstddef>

namespace flowsched::algo {

/// @brief In-process baseline policy: dispatch the oldest ready task.
/// @ingroup algo_oracle
///
/// Returns 0 whenever a resource is idle and -1 otherwise, which turns the
/// dispatch loop into plain FCFS first-fit. Feedback is counted but not
/// used. Handy for running workflows without an external policy server.
class FirstFitOracle : public DecisionOracle {
public:
    int32_t decide(const DecisionContext& context, const std::vector<int64_t>& state) override;
    void report_reward(core::TaskId task_id, double reward) override;
    void retrain(core::TaskId previous_task_id, const std::vector<int64_t>& state) override;

    [[nodiscard]] std::size_t decisions() const noexcept { return decisions_; }
    [[nodiscard]] std::size_t rewards() const noexcept { return rewards_; }
    [[nodiscard]] std::size_t retrains() const noexcept { return retrains_; }

    /// @brief Sum of all rewards reported so far.
    [[nodiscard]] double total_reward() const noexcept { return total_reward_; }

private:
    std::size_t decisions_{0};
    std::size_t rewards_{0};
    std::size_t retrains_{0};
    double total_reward_{0.0};
};

} // namespace flowsched::algo
