#pragma once

#include <stdexcept>
#include <string>

namespace flowsched::core {

/// @brief Root of the core library's exceptions.
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Operation not allowed in the object's current state
///        (busy resource, timer in the past, duplicate id).
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Unknown id, or a value outside the representable range.
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Platform modified after finalize().
/// @ingroup core
class AlreadyFinalizedError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace flowsched::core
