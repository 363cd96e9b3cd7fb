#include <flowsched/core/platform.hpp>
#include <flowsched/core/error.hpp>

#include <memory>
#include <string>

namespace flowsched::core {

Resource& Platform::add_resource(uint64_t id, double mips, uint32_t cores, uint64_t ram_mb,
                                 bool mobile) {
    if (finalized_) {
        throw AlreadyFinalizedError("Cannot add resource after finalize()");
    }
    if (resources_by_id_.contains(id)) {
        throw InvalidStateError("duplicate resource id " + std::to_string(id));
    }

    resources_.push_back(std::make_unique<Resource>(id, mips, cores, ram_mb, mobile));
    Resource& resource = *resources_.back();
    resources_by_id_.emplace(id, &resource);
    return resource;
}

Task& Platform::add_task(TaskId id, JobId job_id, int64_t index, TimePoint submission,
                         double length_mi, uint32_t cores) {
    if (finalized_) {
        throw AlreadyFinalizedError("Cannot add task after finalize()");
    }
    if (tasks_by_id_.contains(id)) {
        throw InvalidStateError("duplicate task id " + std::to_string(id));
    }

    tasks_.push_back(std::make_unique<Task>(id, job_id, index, submission, length_mi, cores));
    Task& task = *tasks_.back();
    tasks_by_id_.emplace(id, &task);
    return task;
}

Task& Platform::task_by_id(TaskId id) {
    auto it = tasks_by_id_.find(id);
    if (it == tasks_by_id_.end()) {
        throw OutOfRangeError("unknown task id " + std::to_string(id));
    }
    return *it->second;
}

Resource& Platform::resource_by_id(uint64_t id) {
    auto it = resources_by_id_.find(id);
    if (it == resources_by_id_.end()) {
        throw OutOfRangeError("unknown resource id " + std::to_string(id));
    }
    return *it->second;
}

std::vector<Resource*> Platform::placeable_resources() {
    std::vector<Resource*> result;
    result.reserve(resources_.size());
    for (auto& resource : resources_) {
        if (!resource->mobile()) {
            result.push_back(resource.get());
        }
    }
    return result;
}

} // namespace flowsched::core
