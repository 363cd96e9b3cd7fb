#pragma once

#include <flowsched/core/resource.hpp>
#include <flowsched/core/task.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace flowsched::algo {

/// @brief Turns the ready list and the resource pool into the oracle's input.
/// @ingroup algo_oracle
///
/// The layout is a contract with the oracle; the dispatch loop treats the
/// vector as opaque.
class StateEncoder {
public:
    virtual ~StateEncoder() = default;

    /// @brief Encode a dispatch cycle.
    [[nodiscard]] virtual std::vector<int64_t> encode(const std::vector<core::Task*>& ready,
                                                      const std::vector<core::Resource*>& resources) const = 0;

    /// @brief Largest number of ready tasks an encoding can describe.
    ///
    /// The oracle can only pick among the first visible_tasks() entries of
    /// the ready list.
    [[nodiscard]] virtual std::size_t visible_tasks() const noexcept = 0;

protected:
    StateEncoder() = default;
    StateEncoder(const StateEncoder&) = default;
    StateEncoder& operator=(const StateEncoder&) = default;
};

/// @brief Encoder whose output length depends only on the pool size.
/// @ingroup algo_oracle
///
/// Layout:
/// @code
/// [ready_count, resource_count,
///  per resource:       id, busy, mips, cores, ram_mb,
///  per task slot (N):  id, job_id, length_mi, cores]
/// @endcode
/// Empty task slots are zero-filled; ready_count is clamped to N.
class FixedShapeEncoder : public StateEncoder {
public:
    static constexpr std::size_t RESOURCE_FIELDS = 5;
    static constexpr std::size_t TASK_FIELDS = 4;

    /// @param max_tasks Number of task slots (N), at least 1.
    /// @throws std::invalid_argument if @p max_tasks is zero.
    explicit FixedShapeEncoder(std::size_t max_tasks);

    [[nodiscard]] std::vector<int64_t> encode(const std::vector<core::Task*>& ready,
                                              const std::vector<core::Resource*>& resources) const override;

    [[nodiscard]] std::size_t visible_tasks() const noexcept override { return max_tasks_; }

private:
    std::size_t max_tasks_;
};

} // namespace flowsched::algo
