#pragma once

#include <flowsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace flowsched::core {

class Resource;

/// @brief Lifecycle of a workflow task.
/// @ingroup core
enum class TaskState {
    Pending,   ///< Waiting for its parent tasks to finish.
    Eligible,  ///< Precedence cleared, waiting in the scheduler's pending list.
    Running,   ///< Bound to a resource and executing.
    Finished   ///< Completion event fired; record kept for reporting.
};

/// @brief Identifier of a job in the workflow.
using JobId = uint64_t;

/// @brief Identifier of a task, unique across the workflow.
using TaskId = uint64_t;

/// @brief An individually schedulable unit of a workflow job.
/// @ingroup core
///
/// A task carries two identities. id() is unique across the workflow and is
/// what the decision oracle sees; index() is the task's number within its
/// job and is what parallel groups refer to.
///
/// The simulation owns tasks (through Platform) for the whole run. Schedulers
/// only ever hold non-owning pointers. Only the dispatch path writes
/// start_time(); only the completion path writes finish_time().
///
/// Tasks are non-copyable but movable.
///
/// @see Resource, Platform
class Task {
public:
    /// @brief Construct a new Task.
    /// @param id         Workflow-unique task identifier.
    /// @param job_id     Identifier of the owning job.
    /// @param index      Task number inside the job, as used by parallel groups.
    /// @param submission Earliest time the task may run once precedence clears.
    /// @param length_mi  Amount of work in millions of instructions.
    /// @param cores      Number of cores the task asks for (at least 1).
    Task(TaskId id, JobId job_id, int64_t index, TimePoint submission,
         double length_mi, uint32_t cores = 1);

    [[nodiscard]] TaskId id() const noexcept { return id_; }
    [[nodiscard]] JobId job_id() const noexcept { return job_id_; }
    [[nodiscard]] int64_t index() const noexcept { return index_; }
    [[nodiscard]] TimePoint submission_time() const noexcept { return submission_; }
    [[nodiscard]] double length_mi() const noexcept { return length_mi_; }
    [[nodiscard]] uint32_t cores() const noexcept { return cores_; }

    [[nodiscard]] TaskState state() const noexcept { return state_; }
    void set_state(TaskState state) noexcept { state_ = state; }

    /// @brief Time the task was dispatched, if it has been.
    [[nodiscard]] std::optional<TimePoint> start_time() const noexcept { return start_time_; }
    void set_start_time(TimePoint time) noexcept { start_time_ = time; }

    /// @brief Time the task finished; unset while pending or running.
    [[nodiscard]] std::optional<TimePoint> finish_time() const noexcept { return finish_time_; }
    void set_finish_time(TimePoint time) noexcept { finish_time_ = time; }

    /// @brief Resource the task is (or was last) bound to, or nullptr.
    [[nodiscard]] Resource* resource() const noexcept { return resource_; }
    void set_resource(Resource* resource) noexcept { resource_ = resource; }

    /// @brief Ids of the tasks that must finish before this one may start.
    [[nodiscard]] const std::vector<TaskId>& parents() const noexcept { return parents_; }
    void add_parent(TaskId parent) { parents_.push_back(parent); }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&) = default;
    Task& operator=(Task&&) = default;

private:
    TaskId id_;
    JobId job_id_;
    int64_t index_;
    TimePoint submission_;
    double length_mi_;
    uint32_t cores_;
    TaskState state_{TaskState::Pending};
    std::optional<TimePoint> start_time_;
    std::optional<TimePoint> finish_time_;
    Resource* resource_{nullptr};
    std::vector<TaskId> parents_;
};

} // namespace flowsched::core
