#pragma once

#include <flowsched/core/resource.hpp>
#include <flowsched/core/task.hpp>
#include <flowsched/core/types.hpp>

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

namespace flowsched::core {

/// @brief Container for the resources and tasks of a simulation.
///
/// The Platform owns every Resource and Task. Factory methods (add_*) must
/// be called before finalize(). After finalization, collections are locked;
/// the objects themselves stay mutable so the simulation can update their
/// state.
///
/// Internally uses `vector<unique_ptr<T>>` for stable references (objects
/// do not move when the vector grows) plus id indexes for lookup.
///
/// @see Engine, Resource, Task
/// @ingroup core_hardware
class Platform {
public:
    Platform() = default;

    /// @name Factory Methods
    /// @brief Must be called before finalize().
    /// @{

    /// @brief Add a resource.
    /// @throws AlreadyFinalizedError after finalize().
    /// @throws InvalidStateError if @p id is already used.
    Resource& add_resource(uint64_t id, double mips, uint32_t cores, uint64_t ram_mb,
                           bool mobile = false);

    /// @brief Add a task.
    /// @throws AlreadyFinalizedError after finalize().
    /// @throws InvalidStateError if @p id is already used.
    Task& add_task(TaskId id, JobId job_id, int64_t index, TimePoint submission,
                   double length_mi, uint32_t cores = 1);

    /// @}

    [[nodiscard]] std::size_t resource_count() const noexcept { return resources_.size(); }
    [[nodiscard]] std::size_t task_count() const noexcept { return tasks_.size(); }

    /// @name Indexed Access
    /// @brief Zero-based, in registration order.
    /// @{
    [[nodiscard]] Resource& resource(std::size_t idx) { return *resources_[idx]; }
    [[nodiscard]] const Resource& resource(std::size_t idx) const { return *resources_[idx]; }
    [[nodiscard]] Task& task(std::size_t idx) { return *tasks_[idx]; }
    [[nodiscard]] const Task& task(std::size_t idx) const { return *tasks_[idx]; }
    /// @}

    /// @brief Look a task up by its workflow id.
    /// @throws OutOfRangeError if no task has this id.
    [[nodiscard]] Task& task_by_id(TaskId id);

    [[nodiscard]] bool contains_task(TaskId id) const { return tasks_by_id_.contains(id); }

    /// @brief Look a resource up by its id.
    /// @throws OutOfRangeError if no resource has this id.
    [[nodiscard]] Resource& resource_by_id(uint64_t id);

    /// @brief Non-mobile resources, in registration order.
    [[nodiscard]] std::vector<Resource*> placeable_resources();

    /// @brief Finalize the platform, locking all collections. Idempotent.
    void finalize() noexcept { finalized_ = true; }

    [[nodiscard]] bool is_finalized() const noexcept { return finalized_; }

    Platform(const Platform&) = delete;
    Platform& operator=(const Platform&) = delete;
    Platform(Platform&&) = delete;
    Platform& operator=(Platform&&) = delete;

private:
    bool finalized_{false};

    std::vector<std::unique_ptr<Resource>> resources_;
    std::vector<std::unique_ptr<Task>> tasks_;
    std::unordered_map<uint64_t, Resource*> resources_by_id_;
    std::unordered_map<TaskId, Task*> tasks_by_id_;
};

} // namespace flowsched::core
