#pragma once

#include <flowsched/core/task.hpp>

#include <cstddef>
#include <cstdint>
#include <set>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace flowsched::algo {

/// @brief Set of task indices of one job that may run together.
using ParallelGroup = std::set<int64_t>;

/// @brief Parse a bracketed group list such as `[[1,2],[2,3,4]]`.
///
/// Whitespace between tokens is ignored. The list must contain at least one
/// group and every group at least one integer.
///
/// @throws MalformedConstraintError on any syntax error.
[[nodiscard]] std::vector<ParallelGroup> parse_parallel_groups(std::string_view text);

/// @brief Parse a concurrency limit given as text.
/// @throws MalformedConstraintError unless @p text is a positive integer.
[[nodiscard]] uint32_t parse_max_parallel(std::string_view text);

/// @brief Parallelism rules and running set of a single job.
/// @ingroup algo
///
/// Parallel groups are a whitelist of co-running sets rather than a plain
/// counter: every set of tasks of this job that runs at the same time must
/// be contained in one declared group, and never exceed max_parallel().
class JobConstraints {
public:
    JobConstraints(core::JobId id, uint32_t max_parallel, std::vector<ParallelGroup> groups);

    [[nodiscard]] core::JobId id() const noexcept { return id_; }
    [[nodiscard]] uint32_t max_parallel() const noexcept { return max_parallel_; }
    [[nodiscard]] const std::vector<ParallelGroup>& parallel_groups() const noexcept { return groups_; }

    /// @brief Indices of this job's tasks currently executing.
    [[nodiscard]] const std::set<int64_t>& running() const noexcept { return running_; }

    /// @brief True if task @p index may start alongside the current running set.
    [[nodiscard]] bool can_run(int64_t index) const;

    void add_running(int64_t index) { running_.insert(index); }
    void remove_running(int64_t index) { running_.erase(index); }

private:
    core::JobId id_;
    uint32_t max_parallel_;
    std::vector<ParallelGroup> groups_;
    std::set<int64_t> running_;
};

/// @brief Registry of per-job constraints and running sets.
/// @ingroup algo
///
/// Jobs are registered once, when the workflow loads, and live for the whole
/// simulation. The ledger is mutated only from the scheduling thread and does
/// no locking of its own.
///
/// @see RunningTaskTracker, ReadyJobSelector
class ConstraintLedger {
public:
    ConstraintLedger() = default;

    /// @brief Register a job from its textual definition.
    /// @param job_id                          Job identifier.
    /// @param max_parallel_executable_tasks   Concurrency limit as text, e.g. `"2"`.
    /// @param tasks_which_can_run_in_parallel Groups as text, e.g. `"[[1,2],[3]]"`.
    /// @throws MalformedConstraintError if either field is invalid or the id is taken.
    void create_job(core::JobId job_id, std::string_view max_parallel_executable_tasks,
                    std::string_view tasks_which_can_run_in_parallel);

    /// @brief Register a job from already parsed constraints.
    /// @throws MalformedConstraintError if @p max_parallel is zero, a group is
    ///         empty, no group is given, or the id is taken.
    void create_job(core::JobId job_id, uint32_t max_parallel, std::vector<ParallelGroup> groups);

    /// @brief True if task @p task_index of job @p job_id may start now.
    /// @throws UnknownJobError if the job was never registered.
    [[nodiscard]] bool can_run(core::JobId job_id, int64_t task_index) const;

    /// @brief Record @p task as running in its job.
    ///
    /// Not re-validated: callers check can_run() for the same state first.
    /// @throws UnknownJobError if the task's job was never registered.
    void add_running(const core::Task& task);

    /// @brief Remove @p task from its job's running set. No-op if absent.
    /// @throws UnknownJobError if the task's job was never registered.
    void remove_running(const core::Task& task);

    /// @brief Access a registered job.
    /// @throws UnknownJobError if the job was never registered.
    [[nodiscard]] const JobConstraints& job(core::JobId job_id) const;

    [[nodiscard]] bool contains(core::JobId job_id) const { return jobs_.contains(job_id); }
    [[nodiscard]] std::size_t job_count() const noexcept { return jobs_.size(); }

    ConstraintLedger(const ConstraintLedger&) = delete;
    ConstraintLedger& operator=(const ConstraintLedger&) = delete;

private:
    JobConstraints& lookup(core::JobId job_id);

    std::unordered_map<core::JobId, JobConstraints> jobs_;
};

} // namespace flowsched::algo
