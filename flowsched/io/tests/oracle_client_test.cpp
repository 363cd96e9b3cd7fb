#include <flowsched/io/oracle_client.hpp>

#include <flowsched/algo/error.hpp>

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace flowsched::io;
using flowsched::algo::DecisionContext;
using flowsched::algo::OracleUnavailableError;
using flowsched::core::time_from_seconds;

namespace {

// Records outgoing lines and answers from a fixed script.
class ScriptedChannel : public OracleChannel {
public:
    explicit ScriptedChannel(std::deque<std::string> replies) : replies_(std::move(replies)) {}

    void send_line(std::string_view line) override { sent.emplace_back(line); }

    std::string receive_line() override {
        if (replies_.empty()) {
            throw OracleUnavailableError("oracle closed the connection");
        }
        std::string reply = std::move(replies_.front());
        replies_.pop_front();
        return reply;
    }

    std::vector<std::string> sent;

private:
    std::deque<std::string> replies_;
};

rapidjson::Document parse(const std::string& line) {
    rapidjson::Document doc;
    doc.Parse(line.c_str());
    return doc;
}

} // anonymous namespace

// ============================================================================
// Endpoint parsing
// ============================================================================

TEST(OracleEndpointTest, ParsesHostAndPort) {
    auto endpoint = parse_endpoint("localhost:5555");

    EXPECT_EQ(endpoint.host, "localhost");
    EXPECT_EQ(endpoint.port, 5555);
}

TEST(OracleEndpointTest, SplitsOnLastColon) {
    auto endpoint = parse_endpoint("::1:7000");

    EXPECT_EQ(endpoint.host, "::1");
    EXPECT_EQ(endpoint.port, 7000);
}

TEST(OracleEndpointTest, RejectsMalformed) {
    EXPECT_THROW((void)parse_endpoint("localhost"), std::invalid_argument);
    EXPECT_THROW((void)parse_endpoint(":5555"), std::invalid_argument);
    EXPECT_THROW((void)parse_endpoint("host:"), std::invalid_argument);
    EXPECT_THROW((void)parse_endpoint("host:0"), std::invalid_argument);
    EXPECT_THROW((void)parse_endpoint("host:70000"), std::invalid_argument);
    EXPECT_THROW((void)parse_endpoint("host:12ab"), std::invalid_argument);
}

// ============================================================================
// JsonLineOracle
// ============================================================================

class JsonLineOracleTest : public ::testing::Test {
protected:
    DecisionContext context{time_from_seconds(1.5), 3, 2};
    std::vector<int64_t> state{3, 1, 7, -4};
};

TEST_F(JsonLineOracleTest, DecideSendsRequestAndReturnsAction) {
    ScriptedChannel channel({R"({"action": 2})"});
    JsonLineOracle oracle(channel);

    EXPECT_EQ(oracle.decide(context, state), 2);

    ASSERT_EQ(channel.sent.size(), 1U);
    auto request = parse(channel.sent[0]);
    ASSERT_TRUE(request.IsObject());
    EXPECT_STREQ(request["op"].GetString(), "decide");
    EXPECT_DOUBLE_EQ(request["time"].GetDouble(), 1.5);
    EXPECT_EQ(request["ready"].GetUint64(), 3U);
    EXPECT_EQ(request["idle"].GetUint64(), 2U);
    ASSERT_TRUE(request["state"].IsArray());
    ASSERT_EQ(request["state"].Size(), 4U);
    EXPECT_EQ(request["state"][3].GetInt64(), -4);
}

TEST_F(JsonLineOracleTest, DecideDeclineIsPassedThrough) {
    ScriptedChannel channel({R"({"action": -1})"});
    JsonLineOracle oracle(channel);

    EXPECT_EQ(oracle.decide(context, state), -1);
}

TEST_F(JsonLineOracleTest, RewardAndRetrainExpectAcknowledgement) {
    ScriptedChannel channel({R"({"ok": true})", R"({"ok": true})"});
    JsonLineOracle oracle(channel);

    oracle.report_reward(4, -2.5);
    oracle.retrain(3, state);

    ASSERT_EQ(channel.sent.size(), 2U);
    auto reward = parse(channel.sent[0]);
    EXPECT_STREQ(reward["op"].GetString(), "reward");
    EXPECT_EQ(reward["task"].GetUint64(), 4U);
    EXPECT_DOUBLE_EQ(reward["reward"].GetDouble(), -2.5);

    auto retrain = parse(channel.sent[1]);
    EXPECT_STREQ(retrain["op"].GetString(), "retrain");
    EXPECT_EQ(retrain["task"].GetUint64(), 3U);
    EXPECT_EQ(retrain["state"].Size(), 4U);
}

TEST_F(JsonLineOracleTest, ErrorReplyThrows) {
    ScriptedChannel channel({R"({"error": "model not loaded"})"});
    JsonLineOracle oracle(channel);

    try {
        (void)oracle.decide(context, state);
        FAIL() << "expected OracleUnavailableError";
    } catch (const OracleUnavailableError& e) {
        EXPECT_NE(std::string(e.what()).find("model not loaded"), std::string::npos);
    }
}

TEST_F(JsonLineOracleTest, MalformedReplyThrows) {
    ScriptedChannel channel({"{not json", "[1, 2]"});
    JsonLineOracle oracle(channel);

    EXPECT_THROW((void)oracle.decide(context, state), OracleUnavailableError);
    EXPECT_THROW((void)oracle.decide(context, state), OracleUnavailableError);
}

TEST_F(JsonLineOracleTest, MissingOrNonIntegerActionThrows) {
    ScriptedChannel channel({R"({"ok": true})", R"({"action": 1.5})", R"({"action": "0"})"});
    JsonLineOracle oracle(channel);

    EXPECT_THROW((void)oracle.decide(context, state), OracleUnavailableError);
    EXPECT_THROW((void)oracle.decide(context, state), OracleUnavailableError);
    EXPECT_THROW((void)oracle.decide(context, state), OracleUnavailableError);
}

TEST_F(JsonLineOracleTest, NegativeAcknowledgementThrows) {
    ScriptedChannel channel({R"({"ok": false})", R"({"status": "fine"})"});
    JsonLineOracle oracle(channel);

    EXPECT_THROW(oracle.report_reward(1, 0.0), OracleUnavailableError);
    EXPECT_THROW(oracle.retrain(1, state), OracleUnavailableError);
}

TEST_F(JsonLineOracleTest, ClosedChannelPropagates) {
    ScriptedChannel channel({});
    JsonLineOracle oracle(channel);

    EXPECT_THROW((void)oracle.decide(context, state), OracleUnavailableError);
    EXPECT_EQ(channel.sent.size(), 1U);
}

// ============================================================================
// TcpChannel
// ============================================================================

TEST(TcpChannelTest, UnresolvableHostThrows) {
    EXPECT_THROW((TcpChannel(OracleEndpoint{"no-such-host.invalid", 5555}, std::chrono::milliseconds(200))),
                 OracleUnavailableError);
}
