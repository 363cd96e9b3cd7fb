#include <flowsched/algo/error.hpp>
#include <flowsched/algo/resource_placer.hpp>

#include <flowsched/core/error.hpp>
#include <flowsched/core/resource.hpp>
#include <flowsched/core/task.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

using namespace flowsched::algo;
using namespace flowsched::core;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class ResourcePlacerTest : public ::testing::Test {
protected:
    Resource r0{0, 1000.0, 1, 512};
    Resource r1{1, 2000.0, 2, 1024};
    ResourcePlacer placer{{&r0, &r1}};

    Task t1{1, 1, 1, TimePoint{}, 100.0};
    Task t2{2, 1, 2, TimePoint{}, 100.0};
    Task t3{3, 1, 3, TimePoint{}, 100.0};
};

TEST_F(ResourcePlacerTest, PlacesOnFirstIdleInOrder) {
    EXPECT_EQ(&placer.place(t1), &r0);
    EXPECT_EQ(&placer.place(t2), &r1);

    EXPECT_EQ(t1.resource(), &r0);
    EXPECT_EQ(t2.resource(), &r1);
    EXPECT_EQ(placer.idle_count(), 0U);
}

TEST_F(ResourcePlacerTest, PlaceFirstIdleReturnsNullWhenFull) {
    (void)placer.place(t1);
    (void)placer.place(t2);

    EXPECT_EQ(placer.place_first_idle(t3), nullptr);
    EXPECT_EQ(t3.resource(), nullptr);
    EXPECT_THAT(placer.scheduled(), ElementsAre(&t1, &t2));
}

TEST_F(ResourcePlacerTest, PlaceThrowsWhenFull) {
    (void)placer.place(t1);
    (void)placer.place(t2);

    try {
        (void)placer.place(t3);
        FAIL() << "expected PlacementInvariantViolation";
    } catch (const PlacementInvariantViolation& e) {
        EXPECT_EQ(e.task_id(), 3U);
    }
}

TEST_F(ResourcePlacerTest, ReleaseFreesResource) {
    (void)placer.place(t1);
    placer.release(t1);

    EXPECT_TRUE(r0.idle());
    EXPECT_EQ(placer.idle_count(), 2U);
    EXPECT_EQ(&placer.place(t2), &r0);
}

TEST_F(ResourcePlacerTest, ReleaseUnboundTaskThrows) {
    EXPECT_THROW(placer.release(t1), InvalidStateError);

    (void)placer.place(t1);
    placer.release(t1);
    EXPECT_THROW(placer.release(t1), InvalidStateError);
}

TEST_F(ResourcePlacerTest, TakeScheduledDrains) {
    (void)placer.place(t1);

    EXPECT_THAT(placer.take_scheduled(), ElementsAre(&t1));
    EXPECT_THAT(placer.scheduled(), IsEmpty());
    EXPECT_THAT(placer.take_scheduled(), IsEmpty());
}

TEST_F(ResourcePlacerTest, EmptyPlacer) {
    ResourcePlacer empty{std::vector<Resource*>{}};

    EXPECT_EQ(empty.idle_count(), 0U);
    EXPECT_THROW((void)empty.place(t1), PlacementInvariantViolation);
}
