#include <flowsched/core/engine.hpp>
#include <flowsched/core/error.hpp>
#include <flowsched/core/platform.hpp>

#include <string>
#include <utility>

namespace flowsched::core {

Engine::Engine()
    : platform_(std::make_unique<Platform>()) {}

Engine::~Engine() = default;

void Engine::run() {
    fire_deferred_callbacks();
    while (!event_queue_.empty()) {
        process_instant();
    }
}

void Engine::add_timer(TimePoint when, int priority, std::function<void()> callback) {
    if (when < current_time_) {
        throw InvalidStateError("timer at " + std::to_string(time_to_seconds(when)) +
                                " s is earlier than current time " +
                                std::to_string(time_to_seconds(current_time_)) + " s");
    }
    event_queue_.emplace(EventKey{when, priority, sequence_++}, std::move(callback));
}

void Engine::add_timer(TimePoint when, std::function<void()> callback) {
    add_timer(when, EventPriority::TIMER_DEFAULT, std::move(callback));
}

DeferredId Engine::register_deferred(std::function<void()> callback) {
    deferred_callbacks_.push_back(DeferredCallback{std::move(callback), false});
    return DeferredId(deferred_callbacks_.size() - 1);
}

void Engine::request_deferred(DeferredId deferred_id) {
    if (deferred_id && deferred_id.index_ < deferred_callbacks_.size()) {
        deferred_callbacks_[deferred_id.index_].requested = true;
    }
}

void Engine::finalize() {
    platform_->finalize();
    finalized_ = true;
}

Platform& Engine::platform() noexcept {
    return *platform_;
}

const Platform& Engine::platform() const noexcept {
    return *platform_;
}

void Engine::process_instant() {
    current_time_ = event_queue_.begin()->first.time;

    while (!event_queue_.empty() && event_queue_.begin()->first.time == current_time_) {
        auto node = event_queue_.extract(event_queue_.begin());
        if (node.mapped()) {
            node.mapped()();
        }
    }

    fire_deferred_callbacks();
}

void Engine::fire_deferred_callbacks() {
    // Copied out: a callback may register or request deferred entries.
    std::vector<std::function<void()>> due;
    for (auto& deferred : deferred_callbacks_) {
        if (deferred.requested) {
            deferred.requested = false;
            due.push_back(deferred.callback);
        }
    }
    for (auto& callback : due) {
        if (callback) {
            callback();
        }
    }
}

} // namespace flowsched::core
