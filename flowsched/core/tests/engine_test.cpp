#include <flowsched/core/engine.hpp>
#include <flowsched/core/error.hpp>
#include <flowsched/core/platform.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace flowsched::core;

class EngineTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    Engine engine;
};

// Records type names only.
class TypeRecorder : public TraceWriter {
public:
    void begin(TimePoint time) override { times.push_back(time); }
    void type(std::string_view name) override { types.emplace_back(name); }
    void field(std::string_view /*key*/, double /*value*/) override {}
    void field(std::string_view /*key*/, uint64_t /*value*/) override {}
    void field(std::string_view /*key*/, std::string_view /*value*/) override {}
    void end() override { ++ended; }

    std::vector<TimePoint> times;
    std::vector<std::string> types;
    int ended{0};
};

TEST_F(EngineTest, InitialState) {
    EXPECT_EQ(engine.time(), time(0.0));
    EXPECT_FALSE(engine.is_finalized());
    EXPECT_FALSE(engine.has_pending_events());
}

TEST_F(EngineTest, RunEmptyQueue) {
    engine.run();

    EXPECT_EQ(engine.time(), time(0.0));
}

TEST_F(EngineTest, TimersFireInTimeThenPriorityOrder) {
    std::vector<int> order;
    engine.add_timer(time(2.0), [&]() { order.push_back(3); });
    engine.add_timer(time(1.0), EventPriority::TIMER_DEFAULT, [&]() { order.push_back(2); });
    engine.add_timer(time(1.0), EventPriority::TASK_COMPLETION, [&]() { order.push_back(1); });

    engine.run();

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(engine.time(), time(2.0));
}

TEST_F(EngineTest, SameKeyTimersFireInInsertionOrder) {
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        engine.add_timer(time(1.0), [&order, i]() { order.push_back(i); });
    }

    engine.run();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(EngineTest, TimerInThePastThrows) {
    engine.add_timer(time(5.0), []() {});
    engine.run();

    EXPECT_EQ(engine.time(), time(5.0));
    EXPECT_THROW(engine.add_timer(time(4.0), []() {}), InvalidStateError);
}

TEST_F(EngineTest, TimerAtCurrentInstantFiresInSameInstant) {
    std::vector<int> order;
    engine.add_timer(time(1.0), [&]() {
        order.push_back(1);
        engine.add_timer(engine.time(), [&]() { order.push_back(2); });
    });
    engine.add_timer(time(2.0), [&]() { order.push_back(3); });

    engine.run();

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_FALSE(engine.has_pending_events());
}

TEST_F(EngineTest, DefaultDeferredIdIsIgnored) {
    DeferredId none;
    EXPECT_FALSE(none);

    engine.request_deferred(none);
    engine.run();

    EXPECT_EQ(engine.time(), time(0.0));
}

TEST_F(EngineTest, DeferredFiresOnceAfterTimestepEvents) {
    std::vector<std::string> log;
    auto deferred = engine.register_deferred([&]() { log.emplace_back("pass"); });

    engine.add_timer(time(1.0), [&]() {
        log.emplace_back("a");
        engine.request_deferred(deferred);
    });
    engine.add_timer(time(1.0), [&]() {
        log.emplace_back("b");
        engine.request_deferred(deferred);
    });

    engine.run();

    EXPECT_EQ(log, (std::vector<std::string>{"a", "b", "pass"}));
}

TEST_F(EngineTest, DeferredRequestedBeforeRunFiresAtStart) {
    int passes = 0;
    auto deferred = engine.register_deferred([&]() { ++passes; });
    engine.request_deferred(deferred);

    engine.run();

    EXPECT_EQ(passes, 1);
}

TEST_F(EngineTest, DeferredCanScheduleTimers) {
    int passes = 0;
    DeferredId deferred;
    deferred = engine.register_deferred([&]() {
        ++passes;
        if (passes < 3) {
            engine.add_timer(engine.time() + duration_from_seconds(1.0),
                             [&]() { engine.request_deferred(deferred); });
        }
    });
    engine.request_deferred(deferred);

    engine.run();

    EXPECT_EQ(passes, 3);
    EXPECT_EQ(engine.time(), time(2.0));
}

TEST_F(EngineTest, TraceOnlyWithWriter) {
    int calls = 0;
    engine.trace([&](TraceWriter& w) {
        ++calls;
        w.type("ignored");
    });
    EXPECT_EQ(calls, 0);

    TypeRecorder recorder;
    engine.set_trace_writer(&recorder);
    engine.add_timer(time(2.0), [&]() {
        engine.trace([&](TraceWriter& w) {
            ++calls;
            w.type("tick");
        });
    });
    engine.run();

    EXPECT_EQ(calls, 1);
    ASSERT_EQ(recorder.types.size(), 1u);
    EXPECT_EQ(recorder.types[0], "tick");
    EXPECT_EQ(recorder.times[0], time(2.0));
    EXPECT_EQ(recorder.ended, 1);
}

TEST_F(EngineTest, FinalizeLocksPlatform) {
    engine.platform().add_resource(0, 1000.0, 1, 0);
    engine.finalize();

    EXPECT_TRUE(engine.is_finalized());
    EXPECT_TRUE(engine.platform().is_finalized());
    EXPECT_THROW(engine.platform().add_resource(1, 1000.0, 1, 0), AlreadyFinalizedError);
}
