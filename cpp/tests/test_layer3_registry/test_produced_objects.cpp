/**
 * @file test_produced_objects.cpp
 * @brief Tests for objects produced by factory components.
 *
 * A factory component is first built through get_or_create under its own
 * name; get_produced_object then caches what it produces.
 */
#include "cph_registry.hpp"
#include "test_registry_types.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

using namespace comphub::registry;
using namespace comphub::tests::registry_types;
using ::testing::HasSubstr;

namespace
{

class ProducedObjectTest : public ::testing::Test
{
  protected:
    ComponentRegistry registry;
    CountingFactory factory;
    int post_processed = 0;

    // Wraps the product in a ProcessedProduct and counts the calls.
    PostProcessor wrap()
    {
        return [this](Instance object, std::string_view name) -> Instance
        {
            EXPECT_EQ(name, "factory");
            ++post_processed;
            auto product = instance_cast<Product>(object);
            product->processed = true;
            return make_instance<ProcessedProduct>(product);
        };
    }

    void build_factory_component()
    {
        registry.get_or_create("factory", [] { return make_node("factory"); });
    }
};

// Asks the registry for its own product from inside produce().
class SelfRequestingFactory : public ComponentFactory
{
  public:
    explicit SelfRequestingFactory(ComponentRegistry &registry) : m_registry(registry) {}

    Instance produce() override { return m_registry.get_produced_object("loop", *this); }

  private:
    ComponentRegistry &m_registry;
};

} // namespace

// ============================================================================
// Caching
// ============================================================================

TEST_F(ProducedObjectTest, SingletonProductIsCachedAndProcessedOnce)
{
    build_factory_component();
    Instance first = registry.get_produced_object("factory", factory, wrap());
    Instance second = registry.get_produced_object("factory", factory, wrap());

    EXPECT_EQ(first, second);
    EXPECT_EQ(factory.produced(), 1);
    EXPECT_EQ(post_processed, 1);
    EXPECT_EQ(registry.get_cached_produced_object("factory"), first);

    auto processed = instance_cast<ProcessedProduct>(first);
    EXPECT_EQ(processed->target->serial, 1);
    EXPECT_TRUE(processed->target->processed);
}

TEST_F(ProducedObjectTest, WithoutPostProcessorTheRawProductIsCached)
{
    build_factory_component();
    Instance first = registry.get_produced_object("factory", factory);
    EXPECT_EQ(instance_cast<Product>(first)->serial, 1);
    EXPECT_EQ(registry.get_produced_object("factory", factory), first);
    EXPECT_EQ(factory.produced(), 1);
}

TEST_F(ProducedObjectTest, NonSingletonFactoryIsNeverCached)
{
    CountingFactory prototype(false);
    build_factory_component();

    Instance first = registry.get_produced_object("factory", prototype, wrap());
    Instance second = registry.get_produced_object("factory", prototype, wrap());

    EXPECT_NE(first, second);
    EXPECT_EQ(prototype.produced(), 2);
    EXPECT_EQ(post_processed, 2);
    EXPECT_EQ(registry.get_cached_produced_object("factory"), nullptr);
}

TEST_F(ProducedObjectTest, UnbuiltSingletonFactoryIsNotCached)
{
    Instance first = registry.get_produced_object("factory", factory, wrap());
    Instance second = registry.get_produced_object("factory", factory, wrap());

    EXPECT_NE(first, second);
    EXPECT_EQ(factory.produced(), 2);
    EXPECT_EQ(post_processed, 2);
    EXPECT_EQ(registry.get_cached_produced_object("factory"), nullptr);
}

TEST_F(ProducedObjectTest, EmptyProductBecomesNullComponent)
{
    build_factory_component();
    factory.set_mode(CountingFactory::Mode::ProduceNull);
    Instance result = registry.get_produced_object("factory", factory);
    EXPECT_TRUE(is_null_component(result));
    EXPECT_TRUE(is_null_component(registry.get_cached_produced_object("factory")));
}

TEST_F(ProducedObjectTest, DestroyInvalidatesTheCache)
{
    build_factory_component();
    Instance before = registry.get_produced_object("factory", factory);
    registry.destroy("factory");
    EXPECT_EQ(registry.get_cached_produced_object("factory"), nullptr);

    build_factory_component();
    Instance after = registry.get_produced_object("factory", factory);
    EXPECT_NE(before, after);
    EXPECT_EQ(factory.produced(), 2);
}

// ============================================================================
// Products requested during the factory's own construction
// ============================================================================

TEST_F(ProducedObjectTest, EmptyProductDuringConstructionIsACycle)
{
    factory.set_mode(CountingFactory::Mode::ProduceNull);
    registry.get_or_create("factory",
                           [&]
                           {
                               EXPECT_THROW(registry.get_produced_object("factory", factory),
                                            UnresolvableCycleError);
                               return make_node("factory");
                           });

    CountingFactory prototype(false);
    prototype.set_mode(CountingFactory::Mode::ProduceNull);
    registry.get_or_create("prototype",
                           [&]
                           {
                               EXPECT_THROW(registry.get_produced_object("prototype", prototype),
                                            UnresolvableCycleError);
                               return make_node("prototype");
                           });
    EXPECT_TRUE(is_null_component(registry.get_produced_object("prototype", prototype)));
}

TEST_F(ProducedObjectTest, PostProcessingIsDeferredUntilBuilt)
{
    Instance raw;
    registry.get_or_create("factory",
                           [&]
                           {
                               raw = registry.get_produced_object("factory", factory, wrap());
                               return make_node("factory");
                           });
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(post_processed, 0);
    EXPECT_FALSE(instance_cast<Product>(raw)->processed);
    EXPECT_EQ(registry.get_cached_produced_object("factory"), nullptr);

    // The first request after completion processes the stashed product.
    Instance processed = registry.get_produced_object("factory", factory, wrap());
    EXPECT_EQ(post_processed, 1);
    EXPECT_EQ(factory.produced(), 1);
    EXPECT_EQ(instance_cast<ProcessedProduct>(processed)->target, instance_cast<Product>(raw));
    EXPECT_EQ(registry.get_cached_produced_object("factory"), processed);
}

TEST_F(ProducedObjectTest, FailedConstructionDiscardsTheStash)
{
    EXPECT_THROW(registry.get_or_create("factory",
                                        [&]() -> Instance
                                        {
                                            registry.get_produced_object("factory", factory, wrap());
                                            throw std::runtime_error("factory component failed");
                                        }),
                 ConstructionFailedError);

    build_factory_component();
    Instance processed = registry.get_produced_object("factory", factory, wrap());
    EXPECT_EQ(factory.produced(), 2);
    EXPECT_EQ(instance_cast<ProcessedProduct>(processed)->target->serial, 2);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ProducedObjectTest, NotReadyFactoryReportsACycle)
{
    build_factory_component();
    factory.set_mode(CountingFactory::Mode::NotReady);
    try
    {
        registry.get_produced_object("factory", factory);
        FAIL() << "Expected UnresolvableCycleError";
    }
    catch (const UnresolvableCycleError &e)
    {
        EXPECT_EQ(e.component(), "factory");
        EXPECT_THAT(e.what(), HasSubstr("still in creation"));
    }
}

TEST_F(ProducedObjectTest, ThrowingFactoryIsWrapped)
{
    build_factory_component();
    factory.set_mode(CountingFactory::Mode::Throw);
    try
    {
        registry.get_produced_object("factory", factory);
        FAIL() << "Expected ConstructionFailedError";
    }
    catch (const ConstructionFailedError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("factory exploded"));
    }
    EXPECT_EQ(registry.get_cached_produced_object("factory"), nullptr);

    factory.set_mode(CountingFactory::Mode::Produce);
    EXPECT_NE(registry.get_produced_object("factory", factory), nullptr);
}

TEST_F(ProducedObjectTest, FailedPostProcessingIsNotCached)
{
    build_factory_component();
    PostProcessor failing = [](Instance, std::string_view) -> Instance
    { throw std::runtime_error("proxy generation failed"); };

    EXPECT_THROW(registry.get_produced_object("factory", factory, failing), ConstructionFailedError);
    EXPECT_EQ(registry.get_cached_produced_object("factory"), nullptr);

    Instance processed = registry.get_produced_object("factory", factory, wrap());
    EXPECT_EQ(factory.produced(), 2);
    EXPECT_EQ(post_processed, 1);
    EXPECT_EQ(registry.get_cached_produced_object("factory"), processed);
}

TEST_F(ProducedObjectTest, TryGetProducedObjectReportsFailure)
{
    build_factory_component();
    factory.set_mode(CountingFactory::Mode::Throw);
    auto result = registry.try_get_produced_object("factory", factory);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), static_cast<int>(ErrorKind::ConstructionFailed));
    EXPECT_EQ(result.error().component, "factory");

    factory.set_mode(CountingFactory::Mode::Produce);
    auto ok = registry.try_get_produced_object("factory", factory);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.content(), registry.get_cached_produced_object("factory"));
}

TEST_F(ProducedObjectTest, InvalidNameIsRejected)
{
    EXPECT_THROW(registry.get_produced_object("", factory), std::invalid_argument);
}

// ============================================================================
// Re-entry
// ============================================================================

TEST_F(ProducedObjectTest, PostProcessorReentryGetsARawProduct)
{
    build_factory_component();
    Instance inner;
    PostProcessor reentrant = [&](Instance object, std::string_view) -> Instance
    {
        inner = registry.get_produced_object("factory", factory, wrap());
        return object;
    };

    Instance outer = registry.get_produced_object("factory", factory, reentrant);
    ASSERT_NE(inner, nullptr);
    EXPECT_NE(inner, outer);
    EXPECT_EQ(instance_cast<Product>(inner)->serial, 2);
    EXPECT_EQ(instance_cast<Product>(outer)->serial, 1);
    EXPECT_EQ(post_processed, 0);
    EXPECT_EQ(registry.get_cached_produced_object("factory"), outer);
}

TEST_F(ProducedObjectTest, FactoryRequestingItsOwnProductIsACycle)
{
    registry.get_or_create("loop", [] { return make_node("loop"); });
    SelfRequestingFactory looping(registry);
    EXPECT_THROW(registry.get_produced_object("loop", looping), UnresolvableCycleError);
    // The producing mark is released on the failure path.
    CountingFactory healthy;
    EXPECT_NE(registry.get_produced_object("loop", healthy), nullptr);
}
