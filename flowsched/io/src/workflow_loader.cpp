#include <flowsched/io/workflow_loader.hpp>
#include <flowsched/io/error.hpp>

#include "json_access.hpp"

#include <cmath>
#include <deque>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace flowsched::io {

using namespace detail;

namespace {

std::string read_max_parallel(const rapidjson::Value& job, const std::string& ctx) {
    const auto& member = get_member(job, "max_parallel_executable_tasks", ctx);
    if (member.IsString()) {
        return {member.GetString(), member.GetStringLength()};
    }
    if (member.IsInt64()) {
        return std::to_string(member.GetInt64());
    }
    throw LoaderError("field 'max_parallel_executable_tasks' must be a string or an integer", ctx);
}

TaskParams read_task(const rapidjson::Value& obj, const std::string& ctx) {
    TaskParams task{};
    task.id = get_uint64(obj, "id", ctx);
    task.index = get_int64(obj, "index", ctx);

    double submission = obj.HasMember("submission") ? get_double(obj, "submission", ctx) : 0.0;
    if (!std::isfinite(submission) || submission < 0.0) {
        throw LoaderError("submission must be a non-negative number of seconds", ctx);
    }
    if (submission >= core::time_to_seconds(core::TimePoint::infinity())) {
        throw LoaderError("submission exceeds the representable time range", ctx);
    }
    task.submission = core::time_from_seconds(submission);

    task.length_mi = get_double(obj, "length", ctx);
    if (!(task.length_mi > 0.0)) {
        throw LoaderError("length must be positive", ctx);
    }

    auto cores = get_uint64_or(obj, "cores", 1, ctx);
    if (cores == 0 || cores > std::numeric_limits<uint32_t>::max()) {
        throw LoaderError("cores must be between 1 and 2^32-1", ctx);
    }
    task.cores = static_cast<uint32_t>(cores);

    if (obj.HasMember("parents")) {
        const auto& parents = get_array(obj, "parents", ctx);
        task.parents.reserve(parents.Size());
        for (rapidjson::SizeType p = 0; p < parents.Size(); ++p) {
            if (!parents[p].IsUint64()) {
                throw LoaderError("parent ids must be non-negative integers", ctx);
            }
            task.parents.push_back(parents[p].GetUint64());
        }
    }
    return task;
}

// Unique ids, existing parents, acyclic precedence graph
void validate(const WorkflowData& workflow) {
    std::unordered_set<uint64_t> job_ids;
    std::unordered_map<uint64_t, const TaskParams*> tasks;

    for (const auto& job : workflow.jobs) {
        if (!job_ids.insert(job.id).second) {
            throw LoaderError("duplicate job id " + std::to_string(job.id), "workflow");
        }
        for (const auto& task : job.tasks) {
            if (!tasks.emplace(task.id, &task).second) {
                throw LoaderError("duplicate task id " + std::to_string(task.id), "workflow");
            }
        }
    }

    std::unordered_map<uint64_t, std::size_t> in_degree;
    std::unordered_map<uint64_t, std::vector<uint64_t>> children;
    for (const auto& [id, task] : tasks) {
        in_degree.try_emplace(id, 0);
        for (uint64_t parent : task->parents) {
            if (!tasks.contains(parent)) {
                throw LoaderError("unknown parent " + std::to_string(parent),
                                  "task " + std::to_string(id));
            }
            if (parent == id) {
                throw LoaderError("task lists itself as parent", "task " + std::to_string(id));
            }
            children[parent].push_back(id);
            ++in_degree[id];
        }
    }

    std::deque<uint64_t> ready;
    for (const auto& [id, degree] : in_degree) {
        if (degree == 0) {
            ready.push_back(id);
        }
    }
    std::size_t visited = 0;
    while (!ready.empty()) {
        uint64_t id = ready.front();
        ready.pop_front();
        ++visited;
        for (uint64_t child : children[id]) {
            if (--in_degree[child] == 0) {
                ready.push_back(child);
            }
        }
    }
    if (visited != tasks.size()) {
        throw LoaderError("precedence graph contains a cycle", "workflow");
    }
}

} // anonymous namespace

std::size_t WorkflowData::task_count() const {
    std::size_t count = 0;
    for (const auto& job : jobs) {
        count += job.tasks.size();
    }
    return count;
}

WorkflowData load_workflow(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_workflow_from_string(oss.str());
}

WorkflowData load_workflow_from_string(std::string_view json) {
    rapidjson::Document doc;
    parse_object(doc, json, "workflow");

    WorkflowData workflow;
    const auto& jobs = get_array(doc, "jobs", "workflow");
    workflow.jobs.reserve(jobs.Size());

    for (rapidjson::SizeType j = 0; j < jobs.Size(); ++j) {
        const auto& job_obj = jobs[j];
        std::string ctx = "jobs[" + std::to_string(j) + "]";

        JobParams job{};
        job.id = get_uint64(job_obj, "id", ctx);
        job.max_parallel_executable_tasks = read_max_parallel(job_obj, ctx);
        job.tasks_which_can_run_in_parallel =
            get_string(job_obj, "tasks_which_can_run_in_parallel", ctx);

        const auto& tasks = get_array(job_obj, "tasks", ctx);
        job.tasks.reserve(tasks.Size());
        for (rapidjson::SizeType t = 0; t < tasks.Size(); ++t) {
            job.tasks.push_back(read_task(tasks[t], ctx + ".tasks[" + std::to_string(t) + "]"));
        }
        workflow.jobs.push_back(std::move(job));
    }

    validate(workflow);
    return workflow;
}

} // namespace flowsched::io
