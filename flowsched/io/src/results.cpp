#include <flowsched/io/results.hpp>
#include <flowsched/io/error.hpp>

#include <flowsched/core/resource.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <fstream>
#include <utility>

namespace flowsched::io {

const char* state_name(core::TaskState state) noexcept {
    switch (state) {
    case core::TaskState::Pending:
        return "pending";
    case core::TaskState::Eligible:
        return "eligible";
    case core::TaskState::Running:
        return "running";
    case core::TaskState::Finished:
        return "finished";
    }
    return "unknown";
}

SimulationResults collect_results(const core::Platform& platform) {
    SimulationResults results;
    results.tasks.reserve(platform.task_count());

    double flow_sum = 0.0;
    double wait_sum = 0.0;
    std::size_t started = 0;

    for (std::size_t i = 0; i < platform.task_count(); ++i) {
        const core::Task& task = platform.task(i);

        TaskResult result{};
        result.id = task.id();
        result.job_id = task.job_id();
        result.index = task.index();
        result.submission = core::time_to_seconds(task.submission_time());
        result.state = state_name(task.state());
        if (task.resource() != nullptr) {
            result.resource_id = task.resource()->id();
        }
        if (auto start = task.start_time()) {
            result.start = core::time_to_seconds(*start);
            wait_sum += *result.start - result.submission;
            ++started;
        }
        if (auto finish = task.finish_time()) {
            result.finish = core::time_to_seconds(*finish);
            results.makespan = std::max(results.makespan, *result.finish);
            flow_sum += *result.finish - result.submission;
            ++results.finished;
        }
        results.tasks.push_back(std::move(result));
    }

    if (results.finished > 0) {
        results.mean_flow_time = flow_sum / static_cast<double>(results.finished);
    }
    if (started > 0) {
        results.mean_wait_time = wait_sum / static_cast<double>(started);
    }
    return results;
}

void write_results_to_stream(const SimulationResults& results, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("summary");
    writer.StartObject();
    writer.Key("tasks");
    writer.Uint64(results.tasks.size());
    writer.Key("finished");
    writer.Uint64(results.finished);
    writer.Key("makespan");
    writer.Double(results.makespan);
    writer.Key("mean_flow_time");
    writer.Double(results.mean_flow_time);
    writer.Key("mean_wait_time");
    writer.Double(results.mean_wait_time);
    writer.EndObject();

    writer.Key("tasks");
    writer.StartArray();
    for (const auto& task : results.tasks) {
        writer.StartObject();
        writer.Key("id");
        writer.Uint64(task.id);
        writer.Key("job");
        writer.Uint64(task.job_id);
        writer.Key("index");
        writer.Int64(task.index);
        writer.Key("resource");
        if (task.resource_id) {
            writer.Uint64(*task.resource_id);
        } else {
            writer.Null();
        }
        writer.Key("submission");
        writer.Double(task.submission);
        writer.Key("start");
        if (task.start) {
            writer.Double(*task.start);
        } else {
            writer.Null();
        }
        writer.Key("finish");
        if (task.finish) {
            writer.Double(*task.finish);
        } else {
            writer.Null();
        }
        writer.Key("state");
        writer.String(task.state.c_str());
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString() << '\n';
}

void write_results(const SimulationResults& results, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_results_to_stream(results, file);
}

} // namespace flowsched::io
