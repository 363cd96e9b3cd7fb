#pragma once

#include <flowsched/core/resource.hpp>
#include <flowsched/core/task.hpp>

#include <cstddef>
#include <vector>

namespace flowsched::algo {

/// @brief First-idle placement of tasks onto resources.
/// @ingroup algo
///
/// Resources are probed in the order they were given at construction
/// (registration order), so placement is deterministic. Claiming a resource
/// marks it Busy and binds the task in the same call; nothing can observe
/// the resource as idle in between.
///
/// Every placed task is appended to the scheduled() list, which the
/// simulation drains to start execution.
///
/// @see DispatchLoop, core::Resource
class ResourcePlacer {
public:
    /// @param resources Placeable resources in registration order (non-owning).
    explicit ResourcePlacer(std::vector<core::Resource*> resources);

    /// @brief Bind @p task to the first idle resource.
    /// @return The claimed resource, or nullptr when every resource is busy.
    core::Resource* place_first_idle(core::Task& task);

    /// @brief Like place_first_idle() but failing loudly.
    /// @throws PlacementInvariantViolation when every resource is busy.
    core::Resource& place(core::Task& task);

    /// @brief Completion path: free the resource @p task is bound to.
    ///
    /// This Busy -> Idle transition is what makes the resource available
    /// to later placements.
    /// @throws core::InvalidStateError if @p task is not bound to a busy resource.
    void release(core::Task& task);

    /// @brief Tasks placed since the last take_scheduled(), in placement order.
    [[nodiscard]] const std::vector<core::Task*>& scheduled() const noexcept { return scheduled_; }

    /// @brief Hand over and clear the scheduled list.
    std::vector<core::Task*> take_scheduled();

    [[nodiscard]] std::size_t idle_count() const;
    [[nodiscard]] const std::vector<core::Resource*>& resources() const noexcept { return resources_; }

private:
    std::vector<core::Resource*> resources_;
    std::vector<core::Task*> scheduled_;
};

} // namespace flowsched::algo
