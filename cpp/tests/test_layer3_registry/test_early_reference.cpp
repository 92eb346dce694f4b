/**
 * @file test_early_reference.cpp
 * @brief Tests for early factories and resolve_early.
 */
#include "cph_registry.hpp"
#include "test_registry_types.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace comphub::registry;
using namespace comphub::tests::registry_types;
using ::testing::HasSubstr;

namespace
{

// Builds "B", which holds an early reference to "A" as its peer.
Instance build_b_against_early_a(ComponentRegistry &registry)
{
    return registry.get_or_create("B",
                                  [&]
                                  {
                                      auto early = registry.resolve_early("A");
                                      EXPECT_TRUE(early.has_value());
                                      auto node = std::make_shared<Node>("B");
                                      if (early)
                                      {
                                          EXPECT_FALSE(early->is_complete());
                                          node->peer = early->as<Node>();
                                      }
                                      return Instance(node);
                                  });
}

} // namespace

// ============================================================================
// Property cycles
// ============================================================================

TEST(EarlyReferenceTest, PropertyCycleResolvesThroughEarlyFactory)
{
    ComponentRegistry registry;
    Instance a = make_node("A");
    int early_calls = 0;

    Instance built = registry.get_or_create(
        "A",
        [&]
        {
            EXPECT_TRUE(registry.register_early_factory("A",
                                                        [&]
                                                        {
                                                            ++early_calls;
                                                            return a;
                                                        }));
            Instance b = build_b_against_early_a(registry);
            instance_cast<Node>(a)->peer = instance_cast<Node>(b);
            return a;
        });

    EXPECT_EQ(built, a);
    EXPECT_EQ(early_calls, 1);

    auto node_a = instance_cast<Node>(built);
    auto node_b = instance_cast<Node>(registry.get_if_built("B"));
    ASSERT_NE(node_b, nullptr);
    EXPECT_EQ(node_a->peer.lock(), node_b);
    EXPECT_EQ(node_b->peer.lock(), node_a);

    auto resolved = registry.resolve_early("A");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_TRUE(resolved->is_complete());
    EXPECT_EQ(resolved->get(), built);
}

TEST(EarlyReferenceTest, EarlyObjectIsSharedWithinOneConstruction)
{
    ComponentRegistry registry;
    int early_calls = 0;
    registry.get_or_create("service",
                           [&]
                           {
                               Instance object = make_node("service");
                               registry.register_early_factory("service",
                                                               [&, object]
                                                               {
                                                                   ++early_calls;
                                                                   return object;
                                                               });
                               auto first = registry.resolve_early("service");
                               auto second = registry.resolve_early("service");
                               EXPECT_TRUE(first && second);
                               if (first && second)
                               {
                                   EXPECT_EQ(first->get(), second->get());
                               }
                               return object;
                           });
    EXPECT_EQ(early_calls, 1);
}

TEST(EarlyReferenceTest, UnregisteredFactoryReplacedBeforeUse)
{
    ComponentRegistry registry;
    registry.get_or_create("svc",
                           [&]
                           {
                               Instance second = make_node("second");
                               registry.register_early_factory("svc", [] { return make_node("first"); });
                               registry.register_early_factory("svc", [second] { return second; });
                               auto early = registry.resolve_early("svc");
                               EXPECT_TRUE(early.has_value());
                               if (early)
                               {
                                   EXPECT_EQ(early->as<Node>()->name, "second");
                               }
                               // Once exposed, the factory can no longer change.
                               EXPECT_THROW(registry.register_early_factory("svc", [] { return make_node("late"); }),
                                            ConsistencyError);
                               return second;
                           });
}

// ============================================================================
// Resolution outside a construction
// ============================================================================

TEST(EarlyReferenceTest, NothingToResolveOutsideCreation)
{
    ComponentRegistry registry;
    EXPECT_FALSE(registry.resolve_early("absent").has_value());

    registry.get_or_create("plain",
                           [&]
                           {
                               // In creation, but without an early factory.
                               EXPECT_FALSE(registry.resolve_early("plain").has_value());
                               return make_node("plain");
                           });
    EXPECT_THROW((void)registry.resolve_early(""), std::invalid_argument);
}

TEST(EarlyReferenceTest, RegisteringOutsideCreationIsAnError)
{
    ComponentRegistry registry;
    try
    {
        registry.register_early_factory("idle", [] { return make_node("idle"); });
        FAIL() << "Expected ConsistencyError";
    }
    catch (const ConsistencyError &e)
    {
        EXPECT_EQ(e.component(), "idle");
        EXPECT_THAT(e.what(), HasSubstr("in creation"));
    }
    EXPECT_THROW(registry.register_early_factory("idle", EarlyFactory{}), std::invalid_argument);
}

TEST(EarlyReferenceTest, DisabledCircularReferencesDeclineRegistration)
{
    RegistryOptions options;
    options.allow_circular_references = false;
    ComponentRegistry registry(options);

    Builder build_a;
    build_a = [&]
    {
        EXPECT_FALSE(registry.register_early_factory("A", [] { return make_node("early"); }));
        EXPECT_FALSE(registry.resolve_early("A").has_value());
        // Without an early reference the property cycle cannot be broken.
        registry.get_or_create("B", [&] { return registry.get_or_create("A", build_a); });
        return make_node("A");
    };
    EXPECT_THROW(registry.get_or_create("A", build_a), UnresolvableCycleError);
    EXPECT_EQ(registry.built_count(), 0u);
}

// ============================================================================
// Early object versus final object
// ============================================================================

TEST(EarlyReferenceTest, RetainEarlyKeepsTheExposedObject)
{
    ComponentRegistry registry;
    Instance early_object = make_node("early");
    Instance built = registry.get_or_create("svc",
                                            [&]
                                            {
                                                registry.register_early_factory("svc", [&] { return early_object; });
                                                (void)registry.resolve_early("svc");
                                                return make_node("replacement");
                                            });
    EXPECT_EQ(built, early_object);
    EXPECT_EQ(registry.get_if_built("svc"), early_object);
}

TEST(EarlyReferenceTest, UnusedEarlyFactoryDoesNotAffectResult)
{
    ComponentRegistry registry;
    Instance final_object = make_node("final");
    Instance built = registry.get_or_create("svc",
                                            [&]
                                            {
                                                registry.register_early_factory("svc", [] { return make_node("early"); });
                                                return final_object;
                                            });
    EXPECT_EQ(built, final_object);
}

TEST(EarlyReferenceTest, RejectMismatchFailsConstruction)
{
    RegistryOptions options;
    options.early_reference_policy = EarlyReferencePolicy::RejectMismatch;
    ComponentRegistry registry(options);

    try
    {
        registry.get_or_create("svc",
                               [&]
                               {
                                   registry.register_early_factory("svc", [] { return make_node("early"); });
                                   (void)registry.resolve_early("svc");
                                   return make_node("replacement");
                               });
        FAIL() << "Expected UnresolvableCycleError";
    }
    catch (const UnresolvableCycleError &e)
    {
        EXPECT_EQ(e.component(), "svc");
        EXPECT_THAT(e.what(), HasSubstr("different instance"));
    }
    EXPECT_FALSE(registry.contains_built("svc"));
    EXPECT_EQ(registry.built_count(), 0u);
}

// ============================================================================
// Failures
// ============================================================================

TEST(EarlyReferenceTest, FailedEarlyFactoryIsRecordedAndRetried)
{
    ComponentRegistry registry;
    int attempts = 0;
    Instance object = make_node("svc");

    Instance built = registry.get_or_create(
        "svc",
        [&]
        {
            registry.register_early_factory("svc",
                                            [&]
                                            {
                                                if (++attempts == 1)
                                                {
                                                    throw std::runtime_error("early boom");
                                                }
                                                return object;
                                            });
            EXPECT_THROW((void)registry.resolve_early("svc"), std::runtime_error);
            auto retry = registry.resolve_early("svc");
            EXPECT_TRUE(retry.has_value());
            return object;
        });
    EXPECT_EQ(built, object);
    EXPECT_EQ(attempts, 2);
}

TEST(EarlyReferenceTest, EarlyFailureTravelsWithFinalError)
{
    ComponentRegistry registry;
    try
    {
        registry.get_or_create("svc",
                               [&]() -> Instance
                               {
                                   registry.register_early_factory(
                                       "svc", []() -> Instance { throw std::runtime_error("early boom"); });
                                   try
                                   {
                                       (void)registry.resolve_early("svc");
                                   }
                                   catch (const std::runtime_error &)
                                   {
                                       throw std::runtime_error("gave up");
                                   }
                                   return make_node("unreachable");
                               });
        FAIL() << "Expected ConstructionFailedError";
    }
    catch (const ConstructionFailedError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("gave up"));
        ASSERT_EQ(e.related_causes().size(), 1u);
        EXPECT_EQ(describe_exception(e.related_causes()[0]), "early boom");
    }

    // The construction window closed; nothing early remains.
    EXPECT_FALSE(registry.resolve_early("svc").has_value());
    EXPECT_THROW(registry.register_early_factory("svc", [] { return make_node("x"); }), ConsistencyError);
}

TEST(EarlyReferenceTest, EmptyEarlyObjectIsRejected)
{
    ComponentRegistry registry;
    registry.get_or_create("svc",
                           [&]
                           {
                               registry.register_early_factory("svc", [] { return Instance{}; });
                               EXPECT_THROW((void)registry.resolve_early("svc"), ConsistencyError);
                               return make_node("svc");
                           });
    EXPECT_TRUE(registry.contains_built("svc"));
}

TEST(EarlyReferenceTest, ReentrantResolveFromEarlyFactoryIsACycle)
{
    ComponentRegistry registry;
    registry.get_or_create("svc",
                           [&]
                           {
                               registry.register_early_factory("svc",
                                                               [&]
                                                               {
                                                                   (void)registry.resolve_early("svc");
                                                                   return make_node("never");
                                                               });
                               EXPECT_THROW((void)registry.resolve_early("svc"), UnresolvableCycleError);
                               return make_node("svc");
                           });
    EXPECT_EQ(instance_cast<Node>(registry.get_if_built("svc"))->name, "svc");
}
