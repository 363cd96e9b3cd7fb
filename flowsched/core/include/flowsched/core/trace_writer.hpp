#pragma once

#include <flowsched/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace flowsched::core {

/// @brief Sink for structured scheduling records.
/// @ingroup core
///
/// A record is one begin(), one type(), any number of field() calls and one
/// end(). Engine::trace() drives this sequence; the io library provides JSON,
/// text and in-memory sinks.
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    virtual void begin(TimePoint time) = 0;
    virtual void type(std::string_view name) = 0;
    virtual void field(std::string_view key, double value) = 0;
    virtual void field(std::string_view key, uint64_t value) = 0;
    virtual void field(std::string_view key, std::string_view value) = 0;
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
};

} // namespace flowsched::core
