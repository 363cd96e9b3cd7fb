#include <flowsched/io/trace_writers.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace flowsched::io {

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , stream_(output)
    , writer_(stream_) {
    writer_.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::key(std::string_view name) {
    writer_.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::begin(core::TimePoint time) {
    writer_.StartObject();
    key("time");
    writer_.Double(core::time_to_seconds(time));
}

void JsonTraceWriter::type(std::string_view name) {
    key("type");
    writer_.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::field(std::string_view name, double value) {
    key(name);
    writer_.Double(value);
}

void JsonTraceWriter::field(std::string_view name, uint64_t value) {
    key(name);
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view name, std::string_view value) {
    key(name);
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonTraceWriter::end() {
    writer_.EndObject();
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    writer_.EndArray();
    stream_.Flush();
    output_ << '\n';
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = core::time_to_seconds(time);
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::vector<const TraceRecord*> MemoryTraceWriter::of_type(std::string_view type) const {
    std::vector<const TraceRecord*> matching;
    for (const auto& record : records_) {
        if (record.type == type) {
            matching.push_back(&record);
        }
    }
    return matching;
}

std::size_t MemoryTraceWriter::count(std::string_view type) const {
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [type](const TraceRecord& record) { return record.type == type; }));
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

namespace {

constexpr const char* COLOR_RESET = "\033[0m";

const char* color_for(std::string_view type) {
    if (type == "dispatch" || type == "task_started") {
        return "\033[32m";
    }
    if (type == "reward" || type == "retrain") {
        return "\033[36m";
    }
    if (type == "task_finished") {
        return "\033[34m";
    }
    if (type == "placement_violation") {
        return "\033[31m";
    }
    return "\033[2m";
}

} // anonymous namespace

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    time_ = core::time_to_seconds(time);
    type_.clear();
    fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    fields_.emplace_back(std::string(key), oss.str());
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    fields_.emplace_back(std::string(key), std::to_string(value));
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    fields_.emplace_back(std::string(key), std::string(value));
}

void TextualTraceWriter::end() {
    std::ostringstream line;
    line << std::fixed << std::setprecision(5);
    line << "[" << std::setw(11) << time_ << "] ";
    if (last_printed_ && *last_printed_ != time_) {
        line << "(+" << std::setw(11) << (time_ - *last_printed_) << ") ";
    } else {
        line << std::string(15, ' ');
    }

    if (color_enabled_) {
        line << color_for(type_);
    }
    line << std::setw(20) << std::right << type_;
    if (color_enabled_) {
        line << COLOR_RESET;
    }
    line << ":";

    const char* sep = " ";
    for (const auto& [key, value] : fields_) {
        line << sep << key << " = " << value;
        sep = ", ";
    }
    line << '\n';

    output_ << line.str();
    last_printed_ = time_;
}

} // namespace flowsched::io
