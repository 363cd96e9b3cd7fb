#include <flowsched/core/error.hpp>
#include <flowsched/core/resource.hpp>
#include <flowsched/core/task.hpp>

#include <gtest/gtest.h>

using namespace flowsched::core;

class TaskResourceTest : public ::testing::Test {
protected:
    Task make_task(TaskId id = 1) {
        return Task(id, 7, 2, time_from_seconds(1.0), 4000.0, 2);
    }
};

TEST_F(TaskResourceTest, TaskConstruction) {
    Task task = make_task(42);

    EXPECT_EQ(task.id(), 42u);
    EXPECT_EQ(task.job_id(), 7u);
    EXPECT_EQ(task.index(), 2);
    EXPECT_EQ(task.submission_time(), time_from_seconds(1.0));
    EXPECT_DOUBLE_EQ(task.length_mi(), 4000.0);
    EXPECT_EQ(task.cores(), 2u);
    EXPECT_EQ(task.state(), TaskState::Pending);
    EXPECT_FALSE(task.start_time().has_value());
    EXPECT_FALSE(task.finish_time().has_value());
    EXPECT_EQ(task.resource(), nullptr);
    EXPECT_TRUE(task.parents().empty());
}

TEST_F(TaskResourceTest, TaskRejectsInvalidParameters) {
    EXPECT_THROW(Task(1, 1, 1, TimePoint{}, 0.0), InvalidStateError);
    EXPECT_THROW(Task(1, 1, 1, TimePoint{}, -5.0), InvalidStateError);
    EXPECT_THROW(Task(1, 1, 1, TimePoint{}, 10.0, 0), InvalidStateError);
}

TEST_F(TaskResourceTest, TaskTimesAndParents) {
    Task task = make_task();
    task.set_start_time(time_from_seconds(2.0));
    task.set_finish_time(time_from_seconds(5.0));
    task.add_parent(3);
    task.add_parent(4);

    EXPECT_EQ(task.start_time(), time_from_seconds(2.0));
    EXPECT_EQ(task.finish_time(), time_from_seconds(5.0));
    ASSERT_EQ(task.parents().size(), 2u);
    EXPECT_EQ(task.parents()[1], 4u);
}

TEST_F(TaskResourceTest, ResourceConstruction) {
    Resource resource(3, 1000.0, 4, 2048, true);

    EXPECT_EQ(resource.id(), 3u);
    EXPECT_DOUBLE_EQ(resource.mips(), 1000.0);
    EXPECT_EQ(resource.cores(), 4u);
    EXPECT_EQ(resource.ram_mb(), 2048u);
    EXPECT_TRUE(resource.mobile());
    EXPECT_TRUE(resource.idle());
    EXPECT_EQ(resource.task(), nullptr);
}

TEST_F(TaskResourceTest, ResourceRejectsInvalidParameters) {
    EXPECT_THROW(Resource(1, 0.0, 1, 0), InvalidStateError);
    EXPECT_THROW(Resource(1, 100.0, 0, 0), InvalidStateError);
}

TEST_F(TaskResourceTest, AssignBindsBothSides) {
    Resource resource(0, 500.0, 1, 512);
    Task task = make_task();

    resource.assign(task);

    EXPECT_EQ(resource.state(), ResourceState::Busy);
    EXPECT_EQ(resource.task(), &task);
    EXPECT_EQ(task.resource(), &resource);
}

TEST_F(TaskResourceTest, AssignToBusyResourceThrows) {
    Resource resource(0, 500.0, 1, 512);
    Task first = make_task(1);
    Task second = make_task(2);

    resource.assign(first);
    EXPECT_THROW(resource.assign(second), InvalidStateError);
    EXPECT_EQ(resource.task(), &first);
    EXPECT_EQ(second.resource(), nullptr);
}

TEST_F(TaskResourceTest, ReleaseReturnsToIdle) {
    Resource resource(0, 500.0, 1, 512);
    Task task = make_task();

    resource.assign(task);
    resource.release();

    EXPECT_TRUE(resource.idle());
    EXPECT_EQ(resource.task(), nullptr);
    EXPECT_THROW(resource.release(), InvalidStateError);
}
