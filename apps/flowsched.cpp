#include <flowsched/core/engine.hpp>
#include <flowsched/core/error.hpp>
#include <flowsched/core/platform.hpp>
#include <flowsched/core/types.hpp>

#include <flowsched/algo/error.hpp>
#include <flowsched/algo/first_fit_oracle.hpp>
#include <flowsched/algo/resource_placer.hpp>
#include <flowsched/algo/reward_model.hpp>
#include <flowsched/algo/scheduler_state.hpp>
#include <flowsched/algo/state_encoder.hpp>
#include <flowsched/algo/workflow_simulation.hpp>

#include <flowsched/io/error.hpp>
#include <flowsched/io/oracle_client.hpp>
#include <flowsched/io/platform_loader.hpp>
#include <flowsched/io/results.hpp>
#include <flowsched/io/trace_writers.hpp>
#include <flowsched/io/workflow_injection.hpp>
#include <flowsched/io/workflow_loader.hpp>

#include <cxxopts.hpp>

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

namespace core = flowsched::core;
namespace algo = flowsched::algo;
namespace io = flowsched::io;

struct Config {
    std::string platform_file;
    std::string workflow_file;
    std::string oracle{"first-fit"};
    int oracle_timeout_ms{5000};
    std::size_t max_ready{16};
    std::string trace_file{"-"};
    std::string format{"json"};
    std::string results_file;
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("flowsched", "Online workflow scheduler with a pluggable decision oracle");

    options.add_options()
        ("p,platform", "Resource pool (JSON)", cxxopts::value<std::string>())
        ("w,workflow", "Workflow jobs and tasks (JSON)", cxxopts::value<std::string>())
        ("oracle", "Oracle: first-fit|HOST:PORT (default: first-fit)", cxxopts::value<std::string>()->default_value("first-fit"))
        ("oracle-timeout", "Oracle I/O timeout in ms (default: 5000)", cxxopts::value<int>()->default_value("5000"))
        ("max-ready", "Ready tasks visible to the oracle (default: 16)", cxxopts::value<std::size_t>()->default_value("16"))
        ("o,trace", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Trace format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("r,results", "Write per-task results (JSON) to this file", cxxopts::value<std::string>())
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("platform") == 0U) {
        std::cerr << "Error: --platform is required" << std::endl;
        std::exit(64);
    }

    if (result.count("workflow") == 0U) {
        std::cerr << "Error: --workflow is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.platform_file = result["platform"].as<std::string>();
    config.workflow_file = result["workflow"].as<std::string>();
    config.oracle = result["oracle"].as<std::string>();
    config.oracle_timeout_ms = result["oracle-timeout"].as<int>();
    config.max_ready = result["max-ready"].as<std::size_t>();
    config.trace_file = result["trace"].as<std::string>();
    config.format = result["format"].as<std::string>();
    if (result.count("results") != 0U) {
        config.results_file = result["results"].as<std::string>();
    }
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown trace format '" << config.format << "'" << std::endl;
        std::exit(64);
    }
    if (config.max_ready == 0) {
        std::cerr << "Error: --max-ready must be at least 1" << std::endl;
        std::exit(64);
    }
    if (config.oracle_timeout_ms <= 0) {
        std::cerr << "Error: --oracle-timeout must be positive" << std::endl;
        std::exit(64);
    }

    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading platform from: " << config.platform_file << std::endl;
            std::cerr << "Loading workflow from: " << config.workflow_file << std::endl;
        }

        // 1. Engine and resource pool
        core::Engine engine;
        io::load_platform(engine, config.platform_file);

        // 2. Jobs into the ledger, tasks into the platform (before finalize)
        algo::SchedulerState state;
        auto workflow = io::load_workflow(config.workflow_file);
        io::inject_workflow(engine, state.ledger, workflow);
        engine.finalize();

        // 3. Oracle
        std::unique_ptr<io::TcpChannel> channel;
        std::unique_ptr<algo::DecisionOracle> oracle;
        if (config.oracle == "first-fit") {
            oracle = std::make_unique<algo::FirstFitOracle>();
        } else {
            auto endpoint = io::parse_endpoint(config.oracle);
            if (config.verbose) {
                std::cerr << "Connecting to oracle at " << endpoint.host << ":" << endpoint.port
                          << std::endl;
            }
            channel = std::make_unique<io::TcpChannel>(
                endpoint, std::chrono::milliseconds{config.oracle_timeout_ms});
            oracle = std::make_unique<io::JsonLineOracle>(*channel);
        }

        // 4. Scheduler
        algo::ResourcePlacer placer(engine.platform().placeable_resources());
        algo::FixedShapeEncoder encoder(config.max_ready);
        algo::ExecutionTimeReward reward;
        algo::WorkflowSimulation simulation(engine, state, placer, *oracle, encoder, reward);

        // 5. Trace writer
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        std::unique_ptr<core::TraceWriter> writer;
        if (config.format != "null" && config.trace_file != "-") {
            outfile.open(config.trace_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.trace_file << std::endl;
                return 1;
            }
            out = &outfile;
        }

        if (config.format == "null") {
            writer = std::make_unique<io::NullTraceWriter>();
        } else if (config.format == "text") {
            writer = std::make_unique<io::TextualTraceWriter>(*out, out == &std::cout);
        } else {
            writer = std::make_unique<io::JsonTraceWriter>(*out);
        }
        engine.set_trace_writer(writer.get());

        if (config.verbose) {
            std::cerr << "Scheduling " << workflow.task_count() << " tasks of "
                      << workflow.jobs.size() << " jobs on " << placer.resources().size()
                      << " resources..." << std::endl;
        }

        // 6. Run
        simulation.run();

        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        auto results = io::collect_results(engine.platform());
        if (!config.results_file.empty()) {
            io::write_results(results, config.results_file);
        }

        if (config.verbose) {
            std::cerr << "Simulation complete at time: " << core::time_to_seconds(engine.time())
                      << "s" << std::endl;
            std::cerr << "  finished tasks:       " << results.finished << "/" << results.tasks.size()
                      << std::endl;
            std::cerr << "  makespan:             " << results.makespan << "s" << std::endl;
            std::cerr << "  mean flow time:       " << results.mean_flow_time << "s" << std::endl;
            std::cerr << "  scheduling passes:    " << simulation.passes() << std::endl;
            std::cerr << "  placement violations: " << simulation.placement_violations() << std::endl;
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const algo::OracleUnavailableError& e) {
        std::cerr << "Oracle error: " << e.what() << std::endl;
        return 3;
    }
    catch (const algo::InvalidDecisionError& e) {
        std::cerr << "Oracle error: " << e.what() << std::endl;
        return 3;
    }
    catch (const algo::SchedulingError& e) {
        std::cerr << "Scheduling error: " << e.what() << std::endl;
        return 2;
    }
    catch (const core::SimulationError& e) {
        std::cerr << "Simulation error: " << e.what() << std::endl;
        return 2;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
