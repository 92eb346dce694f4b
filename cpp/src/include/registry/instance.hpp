/**
 * @file instance.hpp
 * @brief Type-erased handle for objects held by the component registry.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>

#include "comphub_utils_export.h"

namespace comphub::registry
{

/// Longest accepted component name, in bytes.
inline constexpr size_t MAX_COMPONENT_NAME_LEN = 256;

/**
 * @brief An opaque, shared handle to a registry-managed object.
 *
 * The registry never looks inside an Instance; identity is pointer identity.
 * Use `make_instance<T>()` to create one and `instance_cast<T>()` to get the
 * typed pointer back.
 */
using Instance = std::shared_ptr<void>;

/// Builds the full instance for a name. May call back into the registry.
using Builder = std::function<Instance()>;

/// Produces the early (possibly partial or proxied) object for a name in creation.
using EarlyFactory = std::function<Instance()>;

/// Releases whatever the registered component holds. Must not call back into teardown.
using TeardownCallback = std::function<void()>;

template <typename T, typename... Args> Instance make_instance(Args &&...args)
{
    return std::static_pointer_cast<void>(std::make_shared<T>(std::forward<Args>(args)...));
}

/**
 * @brief Recovers the typed pointer from an Instance.
 * @warning No runtime type check is performed; `T` must be the type the
 *          instance was created with.
 */
template <typename T> std::shared_ptr<T> instance_cast(const Instance &instance) noexcept
{
    return std::static_pointer_cast<T>(instance);
}

/**
 * @brief The shared placeholder cached for builders and factories that yield nothing.
 *
 * A registry never caches an empty Instance; an empty result outside a cycle
 * is replaced by this sentinel so that "built, but null" and "not built" stay
 * distinguishable.
 */
COMPHUB_UTILS_EXPORT const Instance &null_component() noexcept;

COMPHUB_UTILS_EXPORT bool is_null_component(const Instance &instance) noexcept;

} // namespace comphub::registry
