#pragma once

/// @file error.hpp
/// @brief Exception types for the flowsched I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace flowsched::io {

/// @brief Exception for input errors (reading, parsing, validation).
///
/// Thrown by the loaders when a JSON document is malformed, a required
/// field is missing or has the wrong type, or a value fails validation
/// (duplicate ids, unknown parents, dependency cycles).
///
/// @ingroup io
/// @see load_platform, load_workflow
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Where it happened, e.g. a file path or `jobs[2].tasks[0]`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace flowsched::io
