#pragma once

#include <flowsched/core/resource.hpp>
#include <flowsched/core/task.hpp>

namespace flowsched::algo {

/// @brief Scores a placement for the oracle's learning signal.
/// @ingroup algo_oracle
///
/// Must be a deterministic function of the task and resource attributes.
class RewardModel {
public:
    virtual ~RewardModel() = default;

    [[nodiscard]] virtual double reward(const core::Task& task, const core::Resource& resource) const = 0;

protected:
    RewardModel() = default;
    RewardModel(const RewardModel&) = default;
    RewardModel& operator=(const RewardModel&) = default;
};

/// @brief Negative expected execution time of the task on the resource.
/// @ingroup algo_oracle
///
/// Faster placements earn rewards closer to zero.
/// @see execution_time
class ExecutionTimeReward : public RewardModel {
public:
    [[nodiscard]] double reward(const core::Task& task, const core::Resource& resource) const override;
};

/// @brief Seconds @p task needs on @p resource.
///
/// length / (mips * cores used), where the task uses at most as many cores
/// as the resource has.
[[nodiscard]] double execution_time(const core::Task& task, const core::Resource& resource);

} // namespace flowsched::algo
