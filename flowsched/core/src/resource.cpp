#include <flowsched/core/resource.hpp>
#include <flowsched/core/error.hpp>
#include <flowsched/core/task.hpp>

#include <string>

namespace flowsched::core {

Resource::Resource(uint64_t id, double mips, uint32_t cores, uint64_t ram_mb, bool mobile)
    : id_(id)
    , mips_(mips)
    , cores_(cores)
    , ram_mb_(ram_mb)
    , mobile_(mobile) {
    if (mips <= 0.0) {
        throw InvalidStateError("resource " + std::to_string(id) + ": mips must be positive");
    }
    if (cores == 0) {
        throw InvalidStateError("resource " + std::to_string(id) + ": cores must be at least 1");
    }
}

void Resource::assign(Task& task) {
    if (state_ != ResourceState::Idle) {
        throw InvalidStateError("resource " + std::to_string(id_) + " is busy with task " +
                                std::to_string(task_->id()));
    }
    state_ = ResourceState::Busy;
    task_ = &task;
    task.set_resource(this);
}

void Resource::release() {
    if (state_ != ResourceState::Busy) {
        throw InvalidStateError("resource " + std::to_string(id_) + " is already idle");
    }
    state_ = ResourceState::Idle;
    task_ = nullptr;
}

} // namespace flowsched::core
