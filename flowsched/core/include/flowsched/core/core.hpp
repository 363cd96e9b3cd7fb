#pragma once

/// @defgroup core Core Library
/// @brief Clock, platform model and trace sink. Knows nothing about scheduling.

/// @defgroup core_types Types
/// @ingroup core

/// @defgroup core_engine Engine
/// @ingroup core

/// @defgroup core_hardware Platform Model
/// @ingroup core
/// @brief Platform, Resource and Task.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Queue keys, priorities and deferred handles.

#include <flowsched/core/types.hpp>
#include <flowsched/core/error.hpp>
#include <flowsched/core/event.hpp>
#include <flowsched/core/deferred.hpp>
#include <flowsched/core/trace_writer.hpp>

#include <flowsched/core/task.hpp>
#include <flowsched/core/resource.hpp>
#include <flowsched/core/platform.hpp>

#include <flowsched/core/engine.hpp>
