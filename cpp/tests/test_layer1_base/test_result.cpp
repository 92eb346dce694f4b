/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> type
 */
#include "utils/result.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <string>

using comphub::utils::Result;

// Simple test error enum
enum class TestError
{
    Unknown,
    NotFound,
    Timeout
};

// ============================================================================
// Construction Tests
// ============================================================================

TEST(ResultTest, ConstructionOk)
{
    auto result = Result<int, TestError>::ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.content(), 42);
}

TEST(ResultTest, ConstructionError)
{
    auto result = Result<int, TestError>::error(TestError::NotFound, 123);
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), TestError::NotFound);
    EXPECT_EQ(result.error_code(), 123);
}

TEST(ResultTest, ConstructionErrorDefaultCode)
{
    auto result = Result<int, TestError>::error(TestError::Timeout);
    EXPECT_EQ(result.error(), TestError::Timeout);
    EXPECT_EQ(result.error_code(), 0);
}

TEST(ResultTest, DefaultConstructedIsError)
{
    Result<int, TestError> result;
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), TestError::Unknown);
}

// ============================================================================
// Access Tests
// ============================================================================

TEST(ResultTest, MutableContent)
{
    auto result = Result<std::string, TestError>::ok("hello");
    result.content() = "world";
    EXPECT_EQ(result.content(), "world");
}

TEST(ResultTest, WrongStateAccessThrows)
{
    auto failed = Result<int, TestError>::error(TestError::NotFound);
    EXPECT_THROW({ (void)failed.content(); }, std::logic_error);

    auto good = Result<int, TestError>::ok(1);
    EXPECT_THROW({ (void)good.error(); }, std::logic_error);
    EXPECT_THROW({ (void)good.error_code(); }, std::logic_error);
}

TEST(ResultTest, ValueOr)
{
    EXPECT_EQ((Result<int, TestError>::ok(7).value_or(-1)), 7);
    EXPECT_EQ((Result<int, TestError>::error(TestError::Timeout).value_or(-1)), -1);
}

// ============================================================================
// Move semantics
// ============================================================================

TEST(ResultTest, MoveOnlyPayload)
{
    auto result = Result<std::unique_ptr<int>, TestError>::ok(std::make_unique<int>(5));
    auto moved = std::move(result);
    ASSERT_TRUE(moved.is_ok());

    std::unique_ptr<int> owned = std::move(moved).content();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 5);
}
