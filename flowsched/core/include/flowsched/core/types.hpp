#pragma once

#include <compare>
#include <cstdint>
#include <limits>

namespace flowsched::core {

/// @brief Signed nanosecond interval.
///
/// Built only through the bridge functions below, which take seconds.
/// Callers converting user input must keep values under
/// `time_to_seconds(TimePoint::infinity())`; larger values do not fit.
///
/// @ingroup core_types
class Duration {
    int64_t ns_{0};

    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    static constexpr int64_t secs_to_ns(double s) noexcept {
        return static_cast<int64_t>(s * 1e9 + (s >= 0.0 ? 0.5 : -0.5));
    }

    static constexpr int64_t secs_to_ns_ceil(double s) noexcept {
        double ns_d = s * 1e9;
        auto ns_i = static_cast<int64_t>(ns_d);
        return static_cast<double>(ns_i) < ns_d ? ns_i + 1 : ns_i;
    }

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_seconds_ceil(double s) noexcept;
    friend class TimePoint;

public:
    constexpr Duration() noexcept = default;

    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ns_) * 1e-9;
    }
    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept { return ns_; }

    constexpr Duration operator+(Duration rhs) const noexcept { return Duration{ns_ + rhs.ns_}; }
    constexpr Duration operator-(Duration rhs) const noexcept { return Duration{ns_ - rhs.ns_}; }

    constexpr auto operator<=>(const Duration&) const noexcept = default;
};

/// @brief Simulation instant, as an offset from time zero.
///
/// infinity() stands for "no known future instant". It orders after every
/// finite instant and is never used in arithmetic.
///
/// @ingroup core_types
class TimePoint {
    Duration offset_;

    explicit constexpr TimePoint(Duration d) noexcept : offset_(d) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;

public:
    constexpr TimePoint() noexcept = default;

    static constexpr TimePoint infinity() noexcept {
        return TimePoint{Duration{std::numeric_limits<int64_t>::max()}};
    }

    [[nodiscard]] constexpr bool is_infinite() const noexcept { return *this == infinity(); }

    [[nodiscard]] constexpr double seconds() const noexcept { return offset_.seconds(); }

    constexpr TimePoint operator+(Duration d) const noexcept { return TimePoint{offset_ + d}; }
    constexpr Duration operator-(TimePoint rhs) const noexcept { return offset_ - rhs.offset_; }

    constexpr auto operator<=>(const TimePoint&) const noexcept = default;
};

/// @brief Seconds to Duration, rounded to the nearest nanosecond.
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::secs_to_ns(s)};
}

/// @brief Seconds to Duration, rounded up.
///
/// Completion timers use this so a task never finishes before its work is done.
[[nodiscard]] constexpr Duration duration_from_seconds_ceil(double s) noexcept {
    return Duration{Duration::secs_to_ns_ceil(s)};
}

[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.seconds();
}

} // namespace flowsched::core
