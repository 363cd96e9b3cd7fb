#pragma once

/// @file workflow_injection.hpp
/// @brief Turning loaded workflow data into platform tasks and job constraints.
/// @ingroup io_loaders

#include <flowsched/io/workflow_loader.hpp>

#include <flowsched/algo/constraint_ledger.hpp>
#include <flowsched/core/engine.hpp>

#include <vector>

namespace flowsched::io {

/// @brief Register the workflow's jobs and create its tasks.
///
/// Every job's constraints are parsed and every task id checked first; only
/// then are the jobs registered in @p ledger and their tasks added to the
/// engine's platform. A rejected workflow leaves both untouched. Tasks are
/// created in file order.
///
/// @note Must be called **before** `Engine::finalize()`.
///
/// @return Pointers to the created tasks, in file order.
///
/// @throws algo::MalformedConstraintError  If a job's constraints do not parse.
/// @throws algo::MalformedConstraintError  If a job id is already registered.
/// @throws LoaderError  If a task id is already present in the platform.
/// @throws core::AlreadyFinalizedError  If the platform is finalized.
///
/// @see load_workflow, algo::ConstraintLedger::create_job
std::vector<core::Task*> inject_workflow(core::Engine& engine, algo::ConstraintLedger& ledger,
                                         const WorkflowData& workflow);

} // namespace flowsched::io
