#include <flowsched/algo/first_fit_oracle.hpp>

namespace flowsched::algo {

int32_t FirstFitOracle::decide(const DecisionContext& context,
                               const std::vector<int64_t>& /*state*/) {
    ++decisions_;
    if (context.ready_count == 0 || context.idle_resources == 0) {
        return -1;
    }
    return 0;
}

void FirstFitOracle::report_reward(core::TaskId /*task_id*/, double reward) {
    ++rewards_;
    total_reward_ += reward;
}

void FirstFitOracle::retrain(core::TaskId /*previous_task_id*/,
                             const std::vector<int64_t>& /*state*/) {
    ++retrains_;
}

} // namespace flowsched::algo
