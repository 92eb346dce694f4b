/**
 * @file alias_registry.hpp
 * @brief Name-to-alias mapping shared by the component registry.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "comphub_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace comphub::registry
{

/**
 * @class AliasRegistry
 * @brief Thread-safe map from alias to the name it stands for.
 *
 * Aliases may chain (`c -> b -> a`); `canonical_name` follows the chain to the
 * end. Alias cycles are rejected when registered.
 */
class COMPHUB_UTILS_EXPORT AliasRegistry
{
  public:
    /// @param allow_overriding Whether an existing alias may be re-pointed to another name.
    explicit AliasRegistry(bool allow_overriding = true);
    ~AliasRegistry();

    AliasRegistry(const AliasRegistry &) = delete;
    AliasRegistry &operator=(const AliasRegistry &) = delete;

    /**
     * @brief Registers `alias` for `name`.
     *
     * An alias equal to `name` removes any existing alias of that spelling.
     * @throws std::invalid_argument if either argument is empty.
     * @throws ConsistencyError if `alias` already points elsewhere and overriding
     *         is disabled, or if the registration would create an alias cycle.
     */
    void register_alias(std::string_view name, std::string_view alias);

    /// @throws ConsistencyError if `alias` is not registered.
    void remove_alias(std::string_view alias);

    [[nodiscard]] bool is_alias(std::string_view name) const;

    /// True if `alias` resolves, directly or through a chain, to `name`.
    [[nodiscard]] bool has_alias(std::string_view name, std::string_view alias) const;

    /// All aliases that resolve to `name`, directly or transitively.
    [[nodiscard]] std::vector<std::string> aliases_of(std::string_view name) const;

    /// Follows the alias chain; returns `name` itself when it is not an alias.
    [[nodiscard]] std::string canonical_name(std::string_view name) const;

    void set_allow_overriding(bool allow) noexcept;
    [[nodiscard]] bool allow_overriding() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace comphub::registry

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
