#pragma once

/// @defgroup io I/O Library
/// @brief JSON loading, trace output, results, and the oracle protocol.
///
/// The I/O library handles every external format: the platform and
/// workflow JSON files, simulation traces (JSON, textual, in-memory),
/// the per-task results file, and the line-delimited JSON protocol used
/// to talk to a remote decision oracle. Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Platform and workflow JSON loaders.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers.

/// @defgroup io_results Results
/// @ingroup io
/// @brief Per-task outcome and summary statistics.

/// @defgroup io_oracle Oracle Client
/// @ingroup io
/// @brief Transport and protocol to an external decision oracle.

#include <flowsched/io/error.hpp>
#include <flowsched/io/oracle_client.hpp>
#include <flowsched/io/platform_loader.hpp>
#include <flowsched/io/results.hpp>
#include <flowsched/io/trace_writers.hpp>
#include <flowsched/io/workflow_injection.hpp>
#include <flowsched/io/workflow_loader.hpp>
