#include <flowsched/core/error.hpp>
#include <flowsched/core/platform.hpp>

#include <gtest/gtest.h>

using namespace flowsched::core;

class PlatformTest : public ::testing::Test {
protected:
    Platform platform;
};

TEST_F(PlatformTest, EmptyPlatform) {
    EXPECT_EQ(platform.resource_count(), 0u);
    EXPECT_EQ(platform.task_count(), 0u);
    EXPECT_FALSE(platform.is_finalized());
    EXPECT_TRUE(platform.placeable_resources().empty());
}

TEST_F(PlatformTest, AddAndLookUp) {
    auto& r = platform.add_resource(10, 1000.0, 2, 1024);
    auto& t = platform.add_task(5, 1, 1, TimePoint{}, 100.0);

    EXPECT_EQ(&platform.resource(0), &r);
    EXPECT_EQ(&platform.task(0), &t);
    EXPECT_EQ(&platform.resource_by_id(10), &r);
    EXPECT_EQ(&platform.task_by_id(5), &t);
}

TEST_F(PlatformTest, ReferencesStayStable) {
    auto& first = platform.add_task(1, 1, 1, TimePoint{}, 100.0);
    for (TaskId id = 2; id < 100; ++id) {
        platform.add_task(id, 1, static_cast<int64_t>(id), TimePoint{}, 100.0);
    }

    EXPECT_EQ(&platform.task_by_id(1), &first);
    EXPECT_EQ(first.id(), 1u);
}

TEST_F(PlatformTest, UnknownIdsThrow) {
    EXPECT_THROW((void)platform.task_by_id(99), OutOfRangeError);
    EXPECT_THROW((void)platform.resource_by_id(99), OutOfRangeError);
}

TEST_F(PlatformTest, DuplicateIdsThrow) {
    platform.add_resource(1, 1000.0, 1, 0);
    platform.add_task(1, 1, 1, TimePoint{}, 100.0);

    EXPECT_THROW(platform.add_resource(1, 500.0, 1, 0), InvalidStateError);
    EXPECT_THROW(platform.add_task(1, 2, 1, TimePoint{}, 100.0), InvalidStateError);
    EXPECT_EQ(platform.resource_count(), 1u);
    EXPECT_EQ(platform.task_count(), 1u);
}

TEST_F(PlatformTest, PlaceableResourcesSkipMobileAndKeepOrder) {
    platform.add_resource(3, 1000.0, 1, 0);
    platform.add_resource(1, 1000.0, 1, 0, true);
    platform.add_resource(2, 1000.0, 1, 0);

    auto placeable = platform.placeable_resources();

    ASSERT_EQ(placeable.size(), 2u);
    EXPECT_EQ(placeable[0]->id(), 3u);
    EXPECT_EQ(placeable[1]->id(), 2u);
}

TEST_F(PlatformTest, FinalizeLocksCollections) {
    platform.finalize();

    EXPECT_TRUE(platform.is_finalized());
    EXPECT_THROW(platform.add_resource(1, 1000.0, 1, 0), AlreadyFinalizedError);
    EXPECT_THROW(platform.add_task(1, 1, 1, TimePoint{}, 100.0), AlreadyFinalizedError);
}
