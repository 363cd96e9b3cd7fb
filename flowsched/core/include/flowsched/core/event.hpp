#pragma once

#include <flowsched/core/types.hpp>

#include <compare>
#include <cstdint>

namespace flowsched::core {

/// @brief Queue order: time, then priority (lower first), then insertion.
/// @ingroup core_events
struct EventKey {
    TimePoint time;
    int priority;
    uint64_t sequence;

    auto operator<=>(const EventKey&) const = default;
};

/// @brief Timer priorities used by the scheduler.
///
/// Completions fire before submissions at the same instant, so the
/// scheduling pass that follows sees the freed resources.
///
/// @ingroup core_events
struct EventPriority {
    static constexpr int TASK_COMPLETION = -200;
    static constexpr int TASK_SUBMISSION = -100;
    static constexpr int TIMER_DEFAULT = 0;
};

} // namespace flowsched::core
