/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace async_executor;

TEST(TaskStateTest, ToString) {
    EXPECT_EQ(to_string(TaskState::Pending), "pending");
    EXPECT_EQ(to_string(TaskState::Running), "running");
    EXPECT_EQ(to_string(TaskState::Completed), "completed");
    EXPECT_EQ(to_string(TaskState::Failed), "failed");
    EXPECT_EQ(to_string(TaskState::Cancelled), "cancelled");
}

TEST(TaskStateTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(TaskState::Pending));
    EXPECT_FALSE(is_terminal(TaskState::Running));
    EXPECT_TRUE(is_terminal(TaskState::Completed));
    EXPECT_TRUE(is_terminal(TaskState::Failed));
    EXPECT_TRUE(is_terminal(TaskState::Cancelled));
}

TEST(PoolInfoTest, DefaultsToEmpty) {
    PoolInfo info;
    EXPECT_EQ(info.active_count, 0u);
    EXPECT_EQ(info.tracked_count, 0u);
    EXPECT_EQ(info.completed_total, 0u);
}

TEST(HealthStatusTest, ToString) {
    EXPECT_EQ(to_string(HealthStatus::Healthy), "Healthy");
    EXPECT_EQ(to_string(HealthStatus::Busy), "Busy");
    EXPECT_EQ(to_string(HealthStatus::Overloaded), "Overloaded");
}
