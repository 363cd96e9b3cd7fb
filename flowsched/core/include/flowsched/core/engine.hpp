#pragma once

#include <flowsched/core/deferred.hpp>
#include <flowsched/core/event.hpp>
#include <flowsched/core/trace_writer.hpp>
#include <flowsched/core/types.hpp>

#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace flowsched::core {

class Platform;

/// @brief Simulation clock and event queue.
///
/// Owns the Platform. Time jumps from one queued instant to the next; at
/// each instant every due timer fires in (priority, insertion) order, then
/// the deferred callbacks requested during that instant run once.
///
/// @code
/// core::Engine engine;
/// // ... fill engine.platform() ...
/// engine.finalize();
/// auto pass = engine.register_deferred([&] { schedule(); });
/// engine.request_deferred(pass);
/// engine.run();
/// @endcode
///
/// Single-threaded.
///
/// @ingroup core_engine
class Engine {
public:
    Engine();
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    [[nodiscard]] TimePoint time() const noexcept { return current_time_; }

    /// @brief Process instants until no timer is left.
    ///
    /// Deferred callbacks requested before the call fire first, at the
    /// current time.
    void run();

    [[nodiscard]] bool has_pending_events() const noexcept { return !event_queue_.empty(); }

    /// @brief Queue @p callback at @p when.
    /// @throws InvalidStateError if @p when is earlier than time().
    void add_timer(TimePoint when, int priority, std::function<void()> callback);
    void add_timer(TimePoint when, std::function<void()> callback);

    /// @brief Register a callback that runs at the end of an instant when requested.
    DeferredId register_deferred(std::function<void()> callback);

    /// @brief Mark @p deferred_id to run at the end of the current instant.
    ///
    /// Requests made during the deferred phase itself carry over to the
    /// next instant.
    void request_deferred(DeferredId deferred_id);

    /// @brief Install the trace sink. Not owned; nullptr disables tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Emit one record through @p func, stamped with time(), if a writer is set.
    template<typename F>
    void trace(F&& func);

    /// @brief Lock the platform. Required before scheduling starts.
    void finalize();

    [[nodiscard]] bool is_finalized() const noexcept { return finalized_; }

    [[nodiscard]] Platform& platform() noexcept;
    [[nodiscard]] const Platform& platform() const noexcept;

private:
    struct DeferredCallback {
        std::function<void()> callback;
        bool requested{false};
    };

    void process_instant();
    void fire_deferred_callbacks();

    TimePoint current_time_{};
    uint64_t sequence_{0};
    bool finalized_{false};

    std::map<EventKey, std::function<void()>> event_queue_;
    std::vector<DeferredCallback> deferred_callbacks_;
    TraceWriter* trace_writer_{nullptr};

    std::unique_ptr<Platform> platform_;
};

template<typename F>
void Engine::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_time_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace flowsched::core
