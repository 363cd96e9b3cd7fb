#pragma once

/// @file trace_writers.hpp
/// @brief TraceWriter sinks: none, JSON, memory and aligned text.
/// @ingroup io_writers

#include <flowsched/core/trace_writer.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace flowsched::io {

/// @brief Discards every record (`--format null`).
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint /*time*/) override {}
    void type(std::string_view /*name*/) override {}
    void field(std::string_view /*key*/, double /*value*/) override {}
    void field(std::string_view /*key*/, uint64_t /*value*/) override {}
    void field(std::string_view /*key*/, std::string_view /*value*/) override {}
    void end() override {}
};

/// @brief Streams records as `[{"time": s, "type": ..., <fields>}, ...]`.
///
/// The array is closed by finalize() or, failing that, the destructor.
///
/// @ingroup io_writers
class JsonTraceWriter : public core::TraceWriter {
public:
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the array and flush. Idempotent.
    void finalize();

private:
    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer_;
    bool finalized_{false};
};

/// @brief One record captured by MemoryTraceWriter.
/// @ingroup io_writers
struct TraceRecord {
    double time{0.0};
    std::string type;
    std::unordered_map<std::string, std::variant<double, uint64_t, std::string>> fields;

    /// @throws std::out_of_range, std::bad_variant_access
    [[nodiscard]] uint64_t uint_field(const std::string& key) const {
        return std::get<uint64_t>(fields.at(key));
    }
};

/// @brief Keeps every record, for assertions in tests.
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    [[nodiscard]] std::vector<const TraceRecord*> of_type(std::string_view type) const;
    [[nodiscard]] std::size_t count(std::string_view type) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable trace, one aligned line per record.
///
/// @code
/// [   12.50000] (+   2.50000)        dispatch: task_id = 4, job_id = 1, ...
/// @endcode
/// Colours, when enabled, follow the record family: green for dispatch,
/// cyan for oracle feedback, blue for completion, red for placement
/// violations.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    double time_{0.0};
    std::optional<double> last_printed_;
    std::string type_;
    std::vector<std::pair<std::string, std::string>> fields_;
};

} // namespace flowsched::io
