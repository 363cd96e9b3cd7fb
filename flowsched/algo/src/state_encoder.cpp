#include <flowsched/algo/state_encoder.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace flowsched::algo {

FixedShapeEncoder::FixedShapeEncoder(std::size_t max_tasks)
    : max_tasks_(max_tasks) {
    if (max_tasks == 0) {
        throw std::invalid_argument("FixedShapeEncoder needs at least one task slot");
    }
}

std::vector<int64_t> FixedShapeEncoder::encode(const std::vector<core::Task*>& ready,
                                               const std::vector<core::Resource*>& resources) const {
    std::size_t visible = std::min(ready.size(), max_tasks_);

    std::vector<int64_t> state;
    state.reserve(2 + resources.size() * RESOURCE_FIELDS + max_tasks_ * TASK_FIELDS);

    state.push_back(static_cast<int64_t>(visible));
    state.push_back(static_cast<int64_t>(resources.size()));

    for (const core::Resource* resource : resources) {
        state.push_back(static_cast<int64_t>(resource->id()));
        state.push_back(resource->idle() ? 0 : 1);
        state.push_back(std::llround(resource->mips()));
        state.push_back(static_cast<int64_t>(resource->cores()));
        state.push_back(static_cast<int64_t>(resource->ram_mb()));
    }

    for (std::size_t slot = 0; slot < max_tasks_; ++slot) {
        if (slot < visible) {
            const core::Task* task = ready[slot];
            state.push_back(static_cast<int64_t>(task->id()));
            state.push_back(static_cast<int64_t>(task->job_id()));
            state.push_back(std::llround(task->length_mi()));
            state.push_back(static_cast<int64_t>(task->cores()));
        } else {
            state.insert(state.end(), TASK_FIELDS, 0);
        }
    }
    return state;
}

} // namespace flowsched::algo
