/**
 * @file test_registry_errors.cpp
 * @brief Unit tests for the registry error taxonomy and RegistryFailure.
 */
#include "cph_registry.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

using namespace comphub::registry;
using ::testing::HasSubstr;

TEST(RegistryErrorTest, KindsAndNames)
{
    EXPECT_STREQ(to_string(ErrorKind::Cycle), "Cycle");
    EXPECT_STREQ(to_string(ErrorKind::ConstructionFailed), "ConstructionFailed");
    EXPECT_STREQ(to_string(ErrorKind::NotAllowed), "NotAllowed");
    EXPECT_STREQ(to_string(ErrorKind::Consistency), "Consistency");

    EXPECT_EQ(UnresolvableCycleError("a").kind(), ErrorKind::Cycle);
    EXPECT_EQ(ConstructionNotAllowedError("a").kind(), ErrorKind::NotAllowed);
    EXPECT_EQ(ConsistencyError("a", "detail").kind(), ErrorKind::Consistency);
    EXPECT_EQ(ConstructionFailedError("a", nullptr).kind(), ErrorKind::ConstructionFailed);
}

TEST(RegistryErrorTest, MessagesNameTheComponent)
{
    UnresolvableCycleError cycle("cache", "extra detail");
    EXPECT_EQ(cycle.component(), "cache");
    EXPECT_THAT(cycle.what(), HasSubstr("Error creating component 'cache'"));
    EXPECT_THAT(cycle.what(), HasSubstr("extra detail"));

    ConstructionNotAllowedError not_allowed("late");
    EXPECT_THAT(not_allowed.what(), HasSubstr("'late'"));
    EXPECT_THAT(not_allowed.what(), HasSubstr("torn down"));

    ConsistencyError consistency("svc", "bad state");
    EXPECT_THAT(consistency.what(), HasSubstr("'svc': bad state"));
}

TEST(RegistryErrorTest, ConstructionFailedKeepsTheCause)
{
    auto cause = std::make_exception_ptr(std::runtime_error("disk full"));
    ConstructionFailedError e("db", cause);
    EXPECT_EQ(e.cause(), cause);
    EXPECT_THAT(e.what(), HasSubstr("disk full"));
    // All registry errors are std::runtime_errors.
    const std::runtime_error &base = e;
    EXPECT_THAT(base.what(), HasSubstr("'db'"));
}

TEST(RegistryErrorTest, DescribeException)
{
    EXPECT_EQ(describe_exception(std::make_exception_ptr(std::logic_error("oops"))), "oops");
    EXPECT_EQ(describe_exception(std::make_exception_ptr(42)), "unknown (non-std::exception) error");
    EXPECT_EQ(describe_exception(nullptr), "<no error>");
}

TEST(RegistryErrorTest, RelatedCausesAreCapped)
{
    ConsistencyError e("svc", "detail");
    EXPECT_FALSE(e.add_related_cause(nullptr));
    for (size_t i = 0; i < MAX_RELATED_CAUSES; ++i)
    {
        EXPECT_TRUE(e.add_related_cause(std::make_exception_ptr(std::runtime_error("r"))));
    }
    EXPECT_FALSE(e.add_related_cause(std::make_exception_ptr(std::runtime_error("overflow"))));
    e.note_dropped_related_causes(4);

    EXPECT_EQ(e.related_causes().size(), MAX_RELATED_CAUSES);
    EXPECT_EQ(e.dropped_related_causes(), 5u);

    // Copies keep the related causes.
    ConsistencyError copy = e;
    EXPECT_EQ(copy.related_causes().size(), MAX_RELATED_CAUSES);
}

// ============================================================================
// RegistryFailure
// ============================================================================

TEST(RegistryFailureTest, FromRegistryError)
{
    UnresolvableCycleError cycle("a");
    cycle.add_related_cause(std::make_exception_ptr(std::runtime_error("side effect")));
    auto failure = RegistryFailure::from_exception(std::make_exception_ptr(cycle), "requested");

    EXPECT_EQ(failure.kind, ErrorKind::Cycle);
    EXPECT_EQ(failure.component, "a");
    EXPECT_THAT(failure.message, HasSubstr("'a'"));
    ASSERT_EQ(failure.related.size(), 1u);
    EXPECT_THROW(failure.rethrow(), UnresolvableCycleError);
}

TEST(RegistryFailureTest, FromOtherExceptions)
{
    auto argument = RegistryFailure::from_exception(std::make_exception_ptr(std::invalid_argument("empty")), "x");
    EXPECT_EQ(argument.kind, ErrorKind::Consistency);
    EXPECT_EQ(argument.component, "x");
    EXPECT_EQ(argument.message, "empty");
    EXPECT_THROW(argument.rethrow(), std::invalid_argument);

    auto foreign = RegistryFailure::from_exception(std::make_exception_ptr(3.5), "y");
    EXPECT_EQ(foreign.kind, ErrorKind::ConstructionFailed);
    EXPECT_EQ(foreign.message, "unknown (non-std::exception) error");
}

TEST(RegistryFailureTest, RethrowWithoutCapturedError)
{
    RegistryFailure failure;
    failure.component = "orphan";
    try
    {
        failure.rethrow();
    }
    catch (const ConsistencyError &e)
    {
        EXPECT_EQ(e.component(), "orphan");
        EXPECT_THAT(e.what(), HasSubstr("failure without a captured error"));
    }
}
