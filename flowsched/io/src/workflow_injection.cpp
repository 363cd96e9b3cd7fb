#include <flowsched/io/workflow_injection.hpp>
#include <flowsched/io/error.hpp>

#include <flowsched/algo/error.hpp>
#include <flowsched/core/error.hpp>
#include <flowsched/core/platform.hpp>
#include <flowsched/core/task.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace flowsched::io {

namespace {

struct ParsedJob {
    const JobParams* job;
    uint32_t max_parallel;
    std::vector<algo::ParallelGroup> groups;
};

// Everything that can reject the workflow, checked before the first mutation
std::vector<ParsedJob> parse_jobs(const core::Platform& platform,
                                  const algo::ConstraintLedger& ledger,
                                  const WorkflowData& workflow) {
    if (platform.is_finalized()) {
        throw core::AlreadyFinalizedError("cannot inject a workflow after finalize()");
    }

    std::vector<ParsedJob> parsed;
    parsed.reserve(workflow.jobs.size());
    for (const auto& job : workflow.jobs) {
        if (ledger.contains(job.id)) {
            throw algo::MalformedConstraintError("job " + std::to_string(job.id) +
                                                 ": already registered");
        }
        for (const auto& params : job.tasks) {
            if (platform.contains_task(params.id)) {
                throw LoaderError("duplicate task id " + std::to_string(params.id),
                                  "job " + std::to_string(job.id));
            }
        }
        parsed.push_back({&job, algo::parse_max_parallel(job.max_parallel_executable_tasks),
                          algo::parse_parallel_groups(job.tasks_which_can_run_in_parallel)});
    }
    return parsed;
}

} // anonymous namespace

std::vector<core::Task*> inject_workflow(core::Engine& engine, algo::ConstraintLedger& ledger,
                                         const WorkflowData& workflow) {
    auto& platform = engine.platform();
    auto parsed = parse_jobs(platform, ledger, workflow);

    std::vector<core::Task*> tasks;
    tasks.reserve(workflow.task_count());

    for (auto& entry : parsed) {
        const JobParams& job = *entry.job;
        ledger.create_job(job.id, entry.max_parallel, std::move(entry.groups));

        for (const auto& params : job.tasks) {
            auto& task = platform.add_task(params.id, job.id, params.index, params.submission,
                                           params.length_mi, params.cores);
            for (uint64_t parent : params.parents) {
                task.add_parent(parent);
            }
            tasks.push_back(&task);
        }
    }
    return tasks;
}

} // namespace flowsched::io
