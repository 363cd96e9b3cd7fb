#include <flowsched/algo/reward_model.hpp>

#include <algorithm>

namespace flowsched::algo {

double execution_time(const core::Task& task, const core::Resource& resource) {
    auto cores = std::min(task.cores(), resource.cores());
    return task.length_mi() / (resource.mips() * static_cast<double>(cores));
}

double ExecutionTimeReward::reward(const core::Task& task, const core::Resource& resource) const {
    return -execution_time(task, resource);
}

} // namespace flowsched::algo
