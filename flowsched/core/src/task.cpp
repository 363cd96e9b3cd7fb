#include <flowsched/core/task.hpp>
#include <flowsched/core/error.hpp>

#include <string>

namespace flowsched::core {

Task::Task(TaskId id, JobId job_id, int64_t index, TimePoint submission,
           double length_mi, uint32_t cores)
    : id_(id)
    , job_id_(job_id)
    , index_(index)
    , submission_(submission)
    , length_mi_(length_mi)
    , cores_(cores) {
    if (length_mi <= 0.0) {
        throw InvalidStateError("task " + std::to_string(id) + ": length must be positive");
    }
    if (cores == 0) {
        throw InvalidStateError("task " + std::to_string(id) + ": cores must be at least 1");
    }
}

} // namespace flowsched::core
