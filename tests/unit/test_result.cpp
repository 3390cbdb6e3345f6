/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace async_executor;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorCode::SubmissionRejected, "executor is shut down"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::SubmissionRejected);
    EXPECT_EQ(r.error().message, "executor is shut down");
}

TEST(ResultTest, MessageOnlyErrorDefaultsToTaskFailed) {
    Result<int> r = Error{"boom"};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TaskFailed);
}

TEST(ResultTest, StringValueIsNotMistakenForError) {
    Result<std::string> r = std::string("task_1");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, "task_1");
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, AndThenChainsOnSuccess) {
    auto positive = [](const int& v) -> Result<int> {
        if (v <= 0) return Error{ErrorCode::ConfigError, "not positive"};
        return v;
    };
    Result<int> ok = 3;
    Result<int> zero = 0;
    Result<int> failed = Error{ErrorCode::TaskNotFound, "task_7"};

    EXPECT_EQ(*ok.and_then(positive), 3);
    EXPECT_EQ(zero.and_then(positive).error().code, ErrorCode::ConfigError);
    // An earlier error short-circuits the chain.
    EXPECT_EQ(failed.and_then(positive).error().code, ErrorCode::TaskNotFound);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorCode::TaskNotFound, "task_9");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().what(), "task_9");
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(ErrorCode::SubmissionRejected), "submission_rejected");
    EXPECT_EQ(to_string(ErrorCode::RegistryInconsistency), "registry_inconsistency");
}
