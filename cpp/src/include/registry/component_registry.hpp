/*******************************************************************************
 * @file component_registry.hpp
 * @brief Singleton component registry with early references, dependency
 *        tracking and ordered teardown.
 *
 * **Overview**
 * A `ComponentRegistry` produces at most one instance per component name. The
 * wiring layer calls `get_or_create(name, builder)`; on a cache miss the
 * registry marks the name "in creation", runs the builder without holding its
 * lock, and commits the result.
 *
 * **Cycles**
 * A builder may call back into the registry. Re-requesting a name that is
 * still in creation on the same path is an `UnresolvableCycleError`. A builder
 * that can hand out its object before it is complete registers an early
 * factory; dependents then use `resolve_early(name)` to obtain a shared early
 * reference instead of re-entering construction.
 *
 * **Concurrency**
 * One mutex guards all state. Builders, early factories, component factories,
 * post-processors and teardown callbacks always run outside it. A second
 * thread asking for a name that is being built waits for the first one and
 * receives the same instance. A wait that would close a cycle between threads
 * fails with `UnresolvableCycleError` instead of blocking.
 *
 * **Teardown**
 * `destroy_all()` destroys teardown-capable names in reverse registration
 * order, dependents and contained names first. Callback failures are logged
 * and reported in the returned `TeardownSummary`; they never stop teardown.
 *
 * **Usage**
 * ```cpp
 * comphub::registry::ComponentRegistry registry;
 * auto logger = registry.get_or_create("logger", [] { return make_instance<Log>(); });
 * auto cache = registry.get_or_create("cache", [&] {
 *     registry.register_dependency("cache", "logger");
 *     return make_instance<Cache>(instance_cast<Log>(registry.get_if_built("logger")));
 * });
 * registry.register_teardown("cache", [] { ... });
 * registry.register_teardown("logger", [] { ... });
 * registry.destroy_all(); // cache's teardown runs before logger's
 * ```
 ******************************************************************************/
#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "comphub_utils_export.h"
#include "registry/alias_registry.hpp"
#include "registry/component_factory.hpp"
#include "registry/early_reference.hpp"
#include "registry/instance.hpp"
#include "registry/registry_errors.hpp"
#include "utils/result.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace comphub::registry
{

/**
 * @brief Which object stays cached when an early reference was handed out and
 *        the builder then returned a different object.
 */
enum class EarlyReferencePolicy
{
    RetainEarly,    ///< keep the early object; everyone keeps seeing one identity
    RejectMismatch, ///< fail the construction with UnresolvableCycleError
};

COMPHUB_UTILS_EXPORT const char *to_string(EarlyReferencePolicy policy) noexcept;

struct RegistryOptions
{
    EarlyReferencePolicy early_reference_policy{EarlyReferencePolicy::RetainEarly};
    /// When false, `register_early_factory` declines every registration.
    bool allow_circular_references{true};
};

enum class RegistryLogLevel
{
    Debug,
    Info,
    Warn,
    Error,
};

/// Receives the registry's diagnostic messages in place of the global logger.
using RegistryLogSink = std::function<void(RegistryLogLevel, const std::string &)>;

struct TeardownFailure
{
    std::string component;
    std::string message;
};

/// Outcome of `destroy` / `destroy_all`.
struct TeardownSummary
{
    /// Names whose teardown callback ran, in call order.
    std::vector<std::string> destroyed;
    /// Callbacks that threw. Their names also appear in `destroyed`.
    std::vector<TeardownFailure> failures;

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

using CreateResult = comphub::utils::Result<Instance, RegistryFailure>;

class COMPHUB_UTILS_EXPORT ComponentRegistry
{
  public:
    explicit ComponentRegistry(RegistryOptions options = {});
    ~ComponentRegistry();

    ComponentRegistry(const ComponentRegistry &) = delete;
    ComponentRegistry &operator=(const ComponentRegistry &) = delete;
    ComponentRegistry(ComponentRegistry &&) = delete;
    ComponentRegistry &operator=(ComponentRegistry &&) = delete;

    [[nodiscard]] const RegistryOptions &options() const noexcept;

    /**
     * @brief Routes diagnostics to `sink`; an empty sink restores the default (LOGGER_*).
     * The sink runs after the registry lock is released, so it may call back
     * into the registry. Lines are delivered when the call that logged them returns.
     */
    void set_log_sink(RegistryLogSink sink);

    // ========================================================================
    // Creation
    // ========================================================================

    /**
     * @brief Returns the instance for `name`, building it with `builder` on first use.
     *
     * On a cache hit `builder` is not called. Otherwise `builder` runs exactly
     * once across all threads; concurrent callers wait for it and receive the
     * same instance. An empty result is cached as `null_component()`.
     *
     * @throws UnresolvableCycleError if `name` is already in creation on this path.
     * @throws ConstructionNotAllowedError during `destroy_all()`.
     * @throws ConstructionFailedError wrapping anything else `builder` throws.
     * @throws std::invalid_argument / std::length_error for an empty or overlong name.
     * A RegistryError thrown inside `builder` propagates as is, with this
     * construction's suppressed errors appended as related causes.
     */
    Instance get_or_create(std::string_view name, const Builder &builder);

    /// Non-throwing form of `get_or_create`.
    [[nodiscard]] CreateResult try_get_or_create(std::string_view name, const Builder &builder) noexcept;

    /**
     * @brief Adds an externally built instance.
     * @throws ConsistencyError if `name` is already built.
     */
    void register_singleton(std::string_view name, Instance instance);

    /// @return the built instance, or an empty Instance if `name` is not built.
    [[nodiscard]] Instance get_if_built(std::string_view name) const;

    [[nodiscard]] bool contains_built(std::string_view name) const;

    /// Built names in the order they were committed.
    [[nodiscard]] std::vector<std::string> built_names() const;
    [[nodiscard]] size_t built_count() const;

    /**
     * @brief Excludes (`false`) or re-includes (`true`) `name` from in-creation tracking.
     *
     * Other threads still wait for an excluded name's single construction, but a
     * same-thread re-entry runs the builder again instead of failing as a cycle.
     */
    void set_currently_in_creation(std::string_view name, bool in_creation);

    /// True while `name` is being constructed and is not excluded.
    [[nodiscard]] bool is_currently_in_creation(std::string_view name) const;

    /**
     * @brief Adds an incidental error to the suppressed-error bag of a running construction.
     * @return false if no construction of `name` is active.
     */
    bool record_suppressed_error(std::string_view name, std::exception_ptr error);

    // ========================================================================
    // Early references
    // ========================================================================

    /**
     * @brief Registers the single-use factory for `name`'s early object.
     *
     * Valid only while `name` is in creation. Replaces a factory that has not
     * been invoked yet.
     * @return false if circular references are disabled for this registry.
     * @throws ConsistencyError if `name` is not in creation or its early object
     *         already exists.
     */
    bool register_early_factory(std::string_view name, EarlyFactory factory);

    /**
     * @brief Resolves a reference to `name` without triggering construction.
     *
     * - built: the final instance, `is_complete() == true`;
     * - in creation with an early object: that object;
     * - in creation with a registered factory: invokes it once and caches the result;
     * - otherwise: `std::nullopt`.
     */
    [[nodiscard]] std::optional<EarlyReference> resolve_early(std::string_view name);

    // ========================================================================
    // Dependency graph
    // ========================================================================

    /// Records that `name` depends on `depends_on`. Aliases resolve first. Idempotent.
    void register_dependency(std::string_view name, std::string_view depends_on);

    /// Records that `inner` is contained in `outer`; also makes `outer` depend on `inner`.
    void register_containment(std::string_view inner, std::string_view outer);

    [[nodiscard]] std::vector<std::string> dependents_of(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> dependencies_of(std::string_view name) const;
    [[nodiscard]] bool has_dependents(std::string_view name) const;

    /// True if `candidate` depends on `name` directly or transitively.
    [[nodiscard]] bool is_transitively_dependent(std::string_view name, std::string_view candidate) const;

    [[nodiscard]] AliasRegistry &aliases() noexcept;
    [[nodiscard]] const AliasRegistry &aliases() const noexcept;

    // ========================================================================
    // Teardown
    // ========================================================================

    /// Registers (or replaces) the teardown callback of `name`.
    void register_teardown(std::string_view name, TeardownCallback callback);

    /**
     * @brief Destroys `name` after its dependents and contained names.
     * Removes it from every cache first; callback failures are logged and reported.
     */
    TeardownSummary destroy(std::string_view name);

    /**
     * @brief Destroys every teardown-capable name, then clears all state.
     * Construction requests made meanwhile fail with ConstructionNotAllowedError.
     *
     * A call made while another thread's sweep is running blocks until that
     * sweep finishes and returns an empty summary; the failures belong to the
     * running call. A call from inside a teardown callback returns an empty
     * summary at once.
     */
    TeardownSummary destroy_all();

    [[nodiscard]] bool is_in_destruction() const;

    // ========================================================================
    // Produced objects (factory components)
    // ========================================================================

    /**
     * @brief Returns the object produced by `factory`, registered as `factory_name`.
     *
     * For a singleton factory whose component is built, the product is cached
     * and `post_process` runs once. While the factory's own construction is in
     * progress, post-processing is deferred until the next request after it completes.
     *
     * @throws UnresolvableCycleError if the factory yields nothing while its own
     *         construction is in progress, or throws FactoryNotReadyError.
     * @throws ConstructionFailedError wrapping other factory or post-processor errors.
     */
    Instance get_produced_object(std::string_view factory_name, ComponentFactory &factory,
                                 const PostProcessor &post_process = {});

    [[nodiscard]] CreateResult try_get_produced_object(std::string_view factory_name, ComponentFactory &factory,
                                                       const PostProcessor &post_process = {}) noexcept;

    /// @return the cached product, or an empty Instance.
    [[nodiscard]] Instance get_cached_produced_object(std::string_view factory_name) const;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace comphub::registry

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
