#include <flowsched/io/trace_writers.hpp>

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace flowsched::io;
using namespace flowsched::core;

class TraceWritersTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    void write_dispatch(TraceWriter& writer, double at) {
        writer.begin(time(at));
        writer.type("dispatch");
        writer.field("task_id", uint64_t{7});
        writer.field("reward", -1.5);
        writer.field("reason", "oracle_declined");
        writer.end();
    }
};

// =============================================================================
// NullTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, NullWriterAcceptsAllCalls) {
    NullTraceWriter writer;

    write_dispatch(writer, 0.0);
    writer.begin(time(1.0));
    writer.type("another_event");
    writer.end();
}

// =============================================================================
// JsonTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, JsonWriterEmptyArray) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
    }

    EXPECT_EQ(oss.str(), "[]\n");
}

TEST_F(TraceWritersTest, JsonWriterRecordsParse) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        write_dispatch(writer, 0.5);
        write_dispatch(writer, 2.0);
    }

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 2u);

    const auto& record = doc[0];
    EXPECT_DOUBLE_EQ(record["time"].GetDouble(), 0.5);
    EXPECT_STREQ(record["type"].GetString(), "dispatch");
    EXPECT_EQ(record["task_id"].GetUint64(), 7u);
    EXPECT_DOUBLE_EQ(record["reward"].GetDouble(), -1.5);
    EXPECT_STREQ(record["reason"].GetString(), "oracle_declined");
    EXPECT_DOUBLE_EQ(doc[1]["time"].GetDouble(), 2.0);
}

TEST_F(TraceWritersTest, JsonWriterFinalizeIsIdempotent) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        write_dispatch(writer, 0.0);
        writer.finalize();
        writer.finalize();
    }

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc.Size(), 1u);
}

// =============================================================================
// MemoryTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, MemoryWriterKeepsRecords) {
    MemoryTraceWriter writer;
    write_dispatch(writer, 1.0);
    writer.begin(time(3.0));
    writer.type("retrain");
    writer.field("task_id", uint64_t{2});
    writer.end();

    ASSERT_EQ(writer.records().size(), 2u);
    EXPECT_EQ(writer.count("dispatch"), 1u);
    EXPECT_EQ(writer.count("missing"), 0u);

    const auto& dispatch = writer.records()[0];
    EXPECT_DOUBLE_EQ(dispatch.time, 1.0);
    EXPECT_EQ(dispatch.uint_field("task_id"), 7u);
    EXPECT_DOUBLE_EQ(std::get<double>(dispatch.fields.at("reward")), -1.5);
    EXPECT_EQ(std::get<std::string>(dispatch.fields.at("reason")), "oracle_declined");

    auto retrains = writer.of_type("retrain");
    ASSERT_EQ(retrains.size(), 1u);
    EXPECT_DOUBLE_EQ(retrains[0]->time, 3.0);

    writer.clear();
    EXPECT_TRUE(writer.records().empty());
}

// =============================================================================
// TextualTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, TextualWriterFormatsFields) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss, false);

    write_dispatch(writer, 1.0);

    std::string line = oss.str();
    EXPECT_NE(line.find("[    1.00000]"), std::string::npos);
    EXPECT_NE(line.find("dispatch:"), std::string::npos);
    EXPECT_NE(line.find("task_id = 7, reward = -1.5, reason = oracle_declined"), std::string::npos);
    EXPECT_EQ(line.find("\033["), std::string::npos);
}

TEST_F(TraceWritersTest, TextualWriterShowsDelta) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss, false);

    write_dispatch(writer, 1.0);
    write_dispatch(writer, 3.5);

    EXPECT_NE(oss.str().find("(+    2.50000)"), std::string::npos);
}

TEST_F(TraceWritersTest, TextualWriterColorsByType) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss, true);

    writer.begin(time(0.0));
    writer.type("placement_violation");
    writer.end();

    EXPECT_NE(oss.str().find("\033[31m"), std::string::npos);
}

TEST_F(TraceWritersTest, TextualWriterKeepsStreamFormatting) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss, false);

    write_dispatch(writer, 1.0);
    oss.str("");
    oss << 0.25;

    EXPECT_EQ(oss.str(), "0.25");
}
