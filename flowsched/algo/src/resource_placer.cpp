#include <flowsched/algo/resource_placer.hpp>
#include <flowsched/algo/error.hpp>

#include <flowsched/core/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace flowsched::algo {

ResourcePlacer::ResourcePlacer(std::vector<core::Resource*> resources)
    : resources_(std::move(resources)) {}

core::Resource* ResourcePlacer::place_first_idle(core::Task& task) {
    for (core::Resource* resource : resources_) {
        if (resource->idle()) {
            resource->assign(task);
            scheduled_.push_back(&task);
            return resource;
        }
    }
    return nullptr;
}

core::Resource& ResourcePlacer::place(core::Task& task) {
    core::Resource* resource = place_first_idle(task);
    if (resource == nullptr) {
        throw PlacementInvariantViolation(task.id());
    }
    return *resource;
}

void ResourcePlacer::release(core::Task& task) {
    core::Resource* resource = task.resource();
    if (resource == nullptr || resource->task() != &task) {
        throw core::InvalidStateError("task " + std::to_string(task.id()) +
                                      " is not bound to a resource");
    }
    resource->release();
}

std::vector<core::Task*> ResourcePlacer::take_scheduled() {
    std::vector<core::Task*> out;
    out.swap(scheduled_);
    return out;
}

std::size_t ResourcePlacer::idle_count() const {
    return static_cast<std::size_t>(std::count_if(resources_.begin(), resources_.end(),
                                                  [](const core::Resource* r) { return r->idle(); }));
}

} // namespace flowsched::algo
