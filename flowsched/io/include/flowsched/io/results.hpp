#pragma once

/// @file results.hpp
/// @brief Per-task outcome of a run and its JSON serialisation.
/// @ingroup io_results

#include <flowsched/core/platform.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace flowsched::io {

/// @brief Outcome of one task. Times are in seconds.
/// @ingroup io_results
struct TaskResult {
    uint64_t id;
    uint64_t job_id;
    int64_t index;
    std::optional<uint64_t> resource_id;  ///< Unset if the task never ran.
    double submission;
    std::optional<double> start;
    std::optional<double> finish;
    std::string state;                    ///< "pending", "eligible", "running" or "finished".
};

/// @brief Outcome of a whole run.
/// @ingroup io_results
struct SimulationResults {
    std::vector<TaskResult> tasks;   ///< In platform registration order.
    std::size_t finished{0};
    double makespan{0.0};            ///< Latest finish time.
    double mean_flow_time{0.0};      ///< Mean of finish - submission over finished tasks.
    double mean_wait_time{0.0};      ///< Mean of start - submission over started tasks.
};

/// @brief Name of a task state as written to the results file.
[[nodiscard]] const char* state_name(core::TaskState state) noexcept;

/// @brief Snapshot every task of @p platform.
[[nodiscard]] SimulationResults collect_results(const core::Platform& platform);

/// @brief Serialise @p results as a JSON object `{"summary": {...}, "tasks": [...]}`.
void write_results_to_stream(const SimulationResults& results, std::ostream& out);

/// @brief Serialise @p results to the file at @p path.
/// @throws LoaderError if the file cannot be opened.
void write_results(const SimulationResults& results, const std::filesystem::path& path);

} // namespace flowsched::io
