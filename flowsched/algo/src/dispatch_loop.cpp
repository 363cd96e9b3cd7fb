#include <flowsched/algo/dispatch_loop.hpp>

#include <flowsched/algo/error.hpp>
#include <flowsched/algo/oracle.hpp>
#include <flowsched/algo/resource_placer.hpp>
#include <flowsched/algo/reward_model.hpp>
#include <flowsched/algo/scheduler_state.hpp>
#include <flowsched/algo/state_encoder.hpp>

#include <flowsched/core/engine.hpp>

#include <algorithm>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace flowsched::algo {

namespace {

const char* reason_name(DispatchResult::ExitReason reason) {
    switch (reason) {
    case DispatchResult::ExitReason::NoReadyTasks:
        return "no_ready_tasks";
    case DispatchResult::ExitReason::OracleDeclined:
        return "oracle_declined";
    }
    return "unknown";
}

} // namespace

DispatchLoop::DispatchLoop(core::Engine& engine, SchedulerState& state, ResourcePlacer& placer,
                           DecisionOracle& oracle, const StateEncoder& encoder,
                           const RewardModel& reward)
    : engine_(engine)
    , state_(state)
    , placer_(placer)
    , oracle_(oracle)
    , encoder_(encoder)
    , reward_(reward)
    , selector_(state.ledger, state.tracker) {}

std::vector<core::Task*> DispatchLoop::ready_tasks(const std::vector<core::Task*>& pending,
                                                   const std::unordered_set<core::Task*>& skipped) const {
    auto ready = selector_.eligible_now(pending, engine_.time());
    if (!skipped.empty()) {
        std::erase_if(ready, [&](core::Task* task) { return skipped.contains(task); });
    }
    // The oracle can only index what the encoding shows it
    if (ready.size() > encoder_.visible_tasks()) {
        ready.resize(encoder_.visible_tasks());
    }
    return ready;
}

DispatchResult DispatchLoop::run(std::vector<core::Task*>& pending) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    DispatchResult result;
    std::unordered_set<core::Task*> skipped;

    while (true) {
        // READY
        state_.tracker.release_finished(engine_.time());
        auto ready = ready_tasks(pending, skipped);
        if (ready.empty()) {
            result.reason = DispatchResult::ExitReason::NoReadyTasks;
            break;
        }

        // ENCODING
        auto encoded = encoder_.encode(ready, placer_.resources());

        // AWAITING_DECISION
        DecisionContext context{engine_.time(), ready.size(), placer_.idle_count()};
        int32_t action = oracle_.decide(context, encoded);
        if (action == -1) {
            result.reason = DispatchResult::ExitReason::OracleDeclined;
            break;
        }
        if (action < 0 || static_cast<std::size_t>(action) >= ready.size()) {
            throw InvalidDecisionError(action, ready.size());
        }

        // PLACED
        core::Task& task = *ready[static_cast<std::size_t>(action)];
        core::Resource* resource = nullptr;
        try {
            resource = &placer_.place(task);
        } catch (const PlacementInvariantViolation& e) {
            ++result.violations;
            skipped.insert(&task);
            engine_.trace([&](core::TraceWriter& w) {
                w.type("placement_violation");
                w.field("task_id", static_cast<uint64_t>(e.task_id()));
                w.field("action", static_cast<uint64_t>(action));
            });
            continue;
        }

        state_.tracker.add(task, engine_.time());
        std::erase(pending, &task);
        ++result.placed;

        engine_.trace([&](core::TraceWriter& w) {
            w.type("dispatch");
            w.field("task_id", static_cast<uint64_t>(task.id()));
            w.field("job_id", static_cast<uint64_t>(task.job_id()));
            w.field("resource_id", resource->id());
            w.field("action", static_cast<uint64_t>(action));
        });

        send_feedback(task, *resource, encoded);
    }

    engine_.trace([&](core::TraceWriter& w) {
        w.type("dispatch_exhausted");
        w.field("reason", reason_name(result.reason));
        w.field("placed", static_cast<uint64_t>(result.placed));
        w.field("pending", static_cast<uint64_t>(pending.size()));
    });
    return result;
}

void DispatchLoop::send_feedback(const core::Task& task, const core::Resource& resource,
                                 const std::vector<int64_t>& state) {
    double reward = reward_.reward(task, resource);
    oracle_.report_reward(task.id(), reward);
    engine_.trace([&](core::TraceWriter& w) {
        w.type("reward");
        w.field("task_id", static_cast<uint64_t>(task.id()));
        w.field("reward", reward);
    });

    if (state_.last_dispatched) {
        core::TaskId previous = *state_.last_dispatched;
        oracle_.retrain(previous, state);
        engine_.trace([&](core::TraceWriter& w) {
            w.type("retrain");
            w.field("task_id", static_cast<uint64_t>(previous));
        });
    }
    state_.last_dispatched = task.id();
}

} // namespace flowsched::algo
