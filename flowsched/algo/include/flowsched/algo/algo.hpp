#pragma once

/// @defgroup algo Algo Library
/// @brief Constraint ledger, ready-set selection, oracle-driven dispatch, placement.
///
/// The algo library implements the online scheduler on top of the core
/// simulation engine: per-job parallelism constraints, the running-task
/// tracker, eligibility computation, the dispatch loop that consults a
/// DecisionOracle, first-idle resource placement, and the workflow driver
/// that ties them to engine events. Depends on core only.

/// @defgroup algo_oracle Decision Oracle
/// @ingroup algo
/// @brief Oracle interface, state encoding, and reward models.

#include <flowsched/algo/constraint_ledger.hpp>
#include <flowsched/algo/dispatch_loop.hpp>
#include <flowsched/algo/error.hpp>
#include <flowsched/algo/first_fit_oracle.hpp>
#include <flowsched/algo/oracle.hpp>
#include <flowsched/algo/ready_job_selector.hpp>
#include <flowsched/algo/resource_placer.hpp>
#include <flowsched/algo/reward_model.hpp>
#include <flowsched/algo/running_task_tracker.hpp>
#include <flowsched/algo/scheduler_state.hpp>
#include <flowsched/algo/state_encoder.hpp>
#include <flowsched/algo/workflow_simulation.hpp>
