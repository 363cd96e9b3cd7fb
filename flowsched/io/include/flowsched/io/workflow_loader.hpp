#pragma once

/// @file workflow_loader.hpp
/// @brief Data structures and functions for loading workflow JSON files.
/// @ingroup io_loaders

#include <flowsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace flowsched::io {

/// @brief One task of a workflow job, as read from JSON.
///
/// @ingroup io_loaders
/// @see JobParams
struct TaskParams {
    uint64_t id;                    ///< Workflow-unique task id.
    int64_t index;                  ///< Number inside the job, as used by parallel groups.
    core::TimePoint submission{};   ///< Earliest start time.
    double length_mi;               ///< Work in millions of instructions.
    uint32_t cores{1};              ///< Requested cores.
    std::vector<uint64_t> parents;  ///< Ids of tasks that must finish first.
};

/// @brief A workflow job and its parallelism constraints.
///
/// The constraint fields are kept as text; ConstraintLedger parses them
/// when the workflow is injected.
///
/// @ingroup io_loaders
/// @see WorkflowData, inject_workflow
struct JobParams {
    uint64_t id;
    std::string max_parallel_executable_tasks;    ///< e.g. `"2"`.
    std::string tasks_which_can_run_in_parallel;  ///< e.g. `"[[1,2],[3]]"`.
    std::vector<TaskParams> tasks;
};

/// @brief A complete workflow: jobs, their tasks and the precedence edges.
///
/// @ingroup io_loaders
/// @see load_workflow
struct WorkflowData {
    std::vector<JobParams> jobs;

    /// @brief Total number of tasks over all jobs.
    [[nodiscard]] std::size_t task_count() const;
};

/// @brief Load a workflow from a JSON file.
///
/// Expected layout:
/// @code
/// {"jobs": [{"id": 1,
///            "max_parallel_executable_tasks": "2",
///            "tasks_which_can_run_in_parallel": "[[1,2],[3]]",
///            "tasks": [{"id": 10, "index": 1, "submission": 0.0,
///                       "length": 1000, "cores": 1, "parents": []}]}]}
/// @endcode
/// `max_parallel_executable_tasks` may also be an integer. `submission`
/// (seconds) defaults to 0, `cores` to 1 and `parents` to none.
///
/// Besides field types, the loader checks that job and task ids are unique,
/// that parents exist and that the precedence graph has no cycle.
///
/// @throws LoaderError  If the file cannot be read or the content is invalid.
/// @see load_workflow_from_string, inject_workflow
WorkflowData load_workflow(const std::filesystem::path& path);

/// @brief Load a workflow from a JSON string.
/// @throws LoaderError  If the JSON is malformed or fails validation.
/// @see load_workflow
WorkflowData load_workflow_from_string(std::string_view json);

} // namespace flowsched::io
