#include <flowsched/algo/workflow_simulation.hpp>

#include <flowsched/algo/error.hpp>
#include <flowsched/algo/resource_placer.hpp>
#include <flowsched/algo/reward_model.hpp>
#include <flowsched/algo/scheduler_state.hpp>

#include <flowsched/core/engine.hpp>
#include <flowsched/core/error.hpp>
#include <flowsched/core/platform.hpp>

#include <sstream>
#include <string>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace flowsched::algo {

WorkflowSimulation::WorkflowSimulation(core::Engine& engine, SchedulerState& state,
                                       ResourcePlacer& placer, DecisionOracle& oracle,
                                       const StateEncoder& encoder, const RewardModel& reward)
    : engine_(engine)
    , state_(state)
    , placer_(placer)
    , loop_(engine, state, placer, oracle, encoder, reward) {
    if (!engine.is_finalized()) {
        throw core::InvalidStateError("WorkflowSimulation requires a finalized engine");
    }

    auto& platform = engine.platform();
    total_ = platform.task_count();
    for (std::size_t i = 0; i < total_; ++i) {
        core::Task& task = platform.task(i);
        waiting_parents_[task.id()] = task.parents().size();
        for (core::TaskId parent : task.parents()) {
            // Validates the parent id
            core::Task& parent_task = platform.task_by_id(parent);
            children_[parent_task.id()].push_back(&task);
        }
    }

    schedule_deferred_ = engine.register_deferred([this]() { on_schedule(); });
}

void WorkflowSimulation::run() {
    auto& platform = engine_.platform();
    for (std::size_t i = 0; i < total_; ++i) {
        core::Task& task = platform.task(i);
        if (task.state() == core::TaskState::Pending && task.parents().empty()) {
            make_eligible(task);
        }
    }

    engine_.request_deferred(schedule_deferred_);
    engine_.run();

    if (finished_ != total_) {
        stall("event queue drained");
    }
}

void WorkflowSimulation::make_eligible(core::Task& task) {
    task.set_state(core::TaskState::Eligible);
    pending_.push_back(&task);

    engine_.trace([&](core::TraceWriter& w) {
        w.type("task_eligible");
        w.field("task_id", static_cast<uint64_t>(task.id()));
        w.field("job_id", static_cast<uint64_t>(task.job_id()));
    });

    if (task.submission_time() > engine_.time()) {
        engine_.add_timer(task.submission_time(), core::EventPriority::TASK_SUBMISSION,
                          [this]() { engine_.request_deferred(schedule_deferred_); });
    } else {
        engine_.request_deferred(schedule_deferred_);
    }
}

void WorkflowSimulation::on_schedule() {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    ++passes_;
    auto result = loop_.run(pending_);
    violations_ += result.violations;

    for (core::Task* task : placer_.take_scheduled()) {
        start_task(*task);
    }

    check_progress();
}

void WorkflowSimulation::start_task(core::Task& task) {
    core::Resource* resource = task.resource();
    if (resource == nullptr) {
        throw core::InvalidStateError("scheduled task " + std::to_string(task.id()) +
                                      " is not bound to a resource");
    }

    double seconds = execution_time(task, *resource);
    double remaining = core::time_to_seconds(core::TimePoint::infinity()) -
                       core::time_to_seconds(engine_.time());
    if (!(seconds < remaining)) {
        throw core::OutOfRangeError("execution time of task " + std::to_string(task.id()) +
                                    " on resource " + std::to_string(resource->id()) +
                                    " exceeds the representable time range");
    }

    auto duration = core::duration_from_seconds_ceil(seconds);
    engine_.add_timer(engine_.time() + duration, core::EventPriority::TASK_COMPLETION,
                      [this, &task]() { on_completion(task); });

    engine_.trace([&](core::TraceWriter& w) {
        w.type("task_started");
        w.field("task_id", static_cast<uint64_t>(task.id()));
        w.field("resource_id", resource->id());
        w.field("duration", core::duration_to_seconds(duration));
    });
}

void WorkflowSimulation::on_completion(core::Task& task) {
    task.set_finish_time(engine_.time());
    task.set_state(core::TaskState::Finished);
    placer_.release(task);
    ++finished_;

    engine_.trace([&](core::TraceWriter& w) {
        w.type("task_finished");
        w.field("task_id", static_cast<uint64_t>(task.id()));
        w.field("job_id", static_cast<uint64_t>(task.job_id()));
    });

    auto it = children_.find(task.id());
    if (it != children_.end()) {
        for (core::Task* child : it->second) {
            if (--waiting_parents_[child->id()] == 0) {
                make_eligible(*child);
            }
        }
    }

    engine_.request_deferred(schedule_deferred_);
}

void WorkflowSimulation::check_progress() {
    if (pending_.empty() || engine_.has_pending_events()) {
        return;
    }

    // Nothing queued will wake us up again: look ahead ourselves
    ReadySet next;
    try {
        next = loop_.selector().next_available(pending_, engine_.time());
    } catch (const NoMoreWorkError&) {
        stall("no pending task can become eligible");
    }

    if (next.time > engine_.time()) {
        engine_.add_timer(next.time, [this]() { engine_.request_deferred(schedule_deferred_); });
        return;
    }
    if (state_.tracker.empty()) {
        stall("oracle declined every ready task with nothing running");
    }
}

void WorkflowSimulation::stall(const char* why) {
    std::ostringstream msg;
    msg << "scheduling stalled at t=" << core::time_to_seconds(engine_.time()) << "s (" << why
        << "), " << (total_ - finished_) << " unfinished task(s):";

    auto& platform = engine_.platform();
    for (std::size_t i = 0; i < platform.task_count(); ++i) {
        const core::Task& task = platform.task(i);
        if (task.state() != core::TaskState::Finished) {
            msg << ' ' << task.id();
        }
    }
    throw SchedulingStalledError(msg.str());
}

} // namespace flowsched::algo
