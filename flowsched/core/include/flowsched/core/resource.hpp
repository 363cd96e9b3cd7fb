#pragma once

#include <cstdint>

namespace flowsched::core {

class Task;

/// @brief Binary availability state of a resource.
/// @ingroup core_hardware
enum class ResourceState {
    Idle,  ///< Free to receive a task.
    Busy   ///< Bound to exactly one task.
};

/// @brief A compute node or virtual machine tasks are placed on.
/// @ingroup core_hardware
///
/// Capacity attributes (MIPS, cores, RAM) are carried for encoding and
/// reward computation only; placement looks at nothing but the
/// Idle/Busy state. A mobile resource is never used for placement.
///
/// The only Busy -> Idle transition is release(), driven by task
/// completion.
///
/// @see Platform, Task
class Resource {
public:
    /// @brief Construct an idle resource.
    /// @param id     Resource identifier (unique within the platform).
    /// @param mips   Processing speed per core, in MIPS.
    /// @param cores  Number of cores.
    /// @param ram_mb Memory in megabytes.
    /// @param mobile True for mobile devices excluded from placement.
    Resource(uint64_t id, double mips, uint32_t cores, uint64_t ram_mb, bool mobile = false);

    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] double mips() const noexcept { return mips_; }
    [[nodiscard]] uint32_t cores() const noexcept { return cores_; }
    [[nodiscard]] uint64_t ram_mb() const noexcept { return ram_mb_; }
    [[nodiscard]] bool mobile() const noexcept { return mobile_; }

    [[nodiscard]] ResourceState state() const noexcept { return state_; }
    [[nodiscard]] bool idle() const noexcept { return state_ == ResourceState::Idle; }

    /// @brief Task currently bound to this resource, or nullptr when idle.
    [[nodiscard]] Task* task() const noexcept { return task_; }

    /// @brief Mark the resource Busy and bind @p task to it.
    /// @throws InvalidStateError if the resource is already busy.
    void assign(Task& task);

    /// @brief Unbind the current task and return to Idle.
    /// @throws InvalidStateError if the resource is idle.
    void release();

    Resource(const Resource&) = delete;
    Resource& operator=(const Resource&) = delete;
    Resource(Resource&&) = default;
    Resource& operator=(Resource&&) = default;

private:
    uint64_t id_;
    double mips_;
    uint32_t cores_;
    uint64_t ram_mb_;
    bool mobile_;
    ResourceState state_{ResourceState::Idle};
    Task* task_{nullptr};
};

} // namespace flowsched::core
