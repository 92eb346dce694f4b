/**
 * @file component_factory.hpp
 * @brief Capability interface for components that produce the exposed object.
 */
#pragma once

#include <functional>
#include <string_view>

#include "registry/instance.hpp"

namespace comphub::registry
{

/**
 * @brief A registered component whose job is to produce another object.
 *
 * The wiring layer decides whether a component is a factory and passes it to
 * `ComponentRegistry::get_produced_object`. A factory that cannot produce yet
 * (because its own dependencies are still in creation) throws
 * `FactoryNotReadyError`.
 */
class ComponentFactory
{
  public:
    virtual ~ComponentFactory() = default;

    /// @return The produced object; may be empty.
    virtual Instance produce() = 0;

    /// Singleton factories have their product cached by the registry.
    virtual bool is_singleton() const { return true; }
};

/**
 * @brief Transform applied once to a freshly produced object (for example a
 *        proxy wrapper). Receives the object and the factory's component name.
 */
using PostProcessor = std::function<Instance(Instance, std::string_view)>;

} // namespace comphub::registry
