#pragma once
/**
 * @file cph_registry.hpp
 * @brief Layer 3: The component registry built on cph_service.
 *
 * Provides ComponentRegistry (singleton cache, creation coordination, early references,
 * dependency graph, teardown and the produced-object cache), AliasRegistry, the
 * registry error taxonomy and the layered RegistryConfig.
 */
#include "cph_service.hpp"

#include "registry/instance.hpp"
#include "registry/registry_errors.hpp"
#include "registry/early_reference.hpp"
#include "registry/component_factory.hpp"
#include "registry/alias_registry.hpp"
#include "registry/component_registry.hpp"
#include "registry/registry_config.hpp"
