#include "cph_registry.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace comphub::registry
{

struct AliasRegistry::Impl
{
    explicit Impl(bool allow) : m_allow_overriding(allow) {}

    // alias -> name; ordered so that aliases_of() is deterministic
    std::map<std::string, std::string, std::less<>> m_aliases;
    mutable std::shared_mutex m_mutex;
    std::atomic<bool> m_allow_overriding;

    bool has_alias_locked(std::string_view name, std::string_view alias) const
    {
        for (const auto &[registered_alias, registered_name] : m_aliases)
        {
            if (registered_name == name)
            {
                if (registered_alias == alias || has_alias_locked(registered_alias, alias))
                {
                    return true;
                }
            }
        }
        return false;
    }

    void collect_aliases_locked(std::string_view name, std::vector<std::string> &out) const
    {
        for (const auto &[registered_alias, registered_name] : m_aliases)
        {
            if (registered_name == name)
            {
                out.push_back(registered_alias);
                collect_aliases_locked(registered_alias, out);
            }
        }
    }
};

AliasRegistry::AliasRegistry(bool allow_overriding)
    : pImpl(std::make_unique<Impl>(allow_overriding))
{
}

AliasRegistry::~AliasRegistry() = default;

void AliasRegistry::register_alias(std::string_view name, std::string_view alias)
{
    if (name.empty() || alias.empty())
    {
        throw std::invalid_argument("AliasRegistry: name and alias must not be empty.");
    }

    std::unique_lock lock(pImpl->m_mutex);
    if (alias == name)
    {
        if (auto it = pImpl->m_aliases.find(alias); it != pImpl->m_aliases.end())
        {
            pImpl->m_aliases.erase(it);
            CPH_DEBUG("Alias definition '{}' ignored since it points to same name", alias);
        }
        return;
    }

    if (auto it = pImpl->m_aliases.find(alias); it != pImpl->m_aliases.end())
    {
        if (it->second == name)
        {
            return; // already registered
        }
        if (!pImpl->m_allow_overriding.load(std::memory_order_relaxed))
        {
            throw ConsistencyError(std::string(alias),
                                   fmt::format("cannot register alias '{}' for name '{}': it is "
                                               "already registered for name '{}'",
                                               alias, name, it->second));
        }
    }

    if (pImpl->has_alias_locked(alias, name))
    {
        throw ConsistencyError(std::string(alias),
                               fmt::format("cannot register alias '{}' for name '{}': circular "
                                           "reference - '{}' is a direct or indirect alias for "
                                           "'{}' already",
                                           alias, name, name, alias));
    }
    pImpl->m_aliases.insert_or_assign(std::string(alias), std::string(name));
}

void AliasRegistry::remove_alias(std::string_view alias)
{
    std::unique_lock lock(pImpl->m_mutex);
    auto it = pImpl->m_aliases.find(alias);
    if (it == pImpl->m_aliases.end())
    {
        throw ConsistencyError(std::string(alias), "no alias registered under this name");
    }
    pImpl->m_aliases.erase(it);
}

bool AliasRegistry::is_alias(std::string_view name) const
{
    std::shared_lock lock(pImpl->m_mutex);
    return pImpl->m_aliases.find(name) != pImpl->m_aliases.end();
}

bool AliasRegistry::has_alias(std::string_view name, std::string_view alias) const
{
    std::shared_lock lock(pImpl->m_mutex);
    return pImpl->has_alias_locked(name, alias);
}

std::vector<std::string> AliasRegistry::aliases_of(std::string_view name) const
{
    std::vector<std::string> out;
    std::shared_lock lock(pImpl->m_mutex);
    pImpl->collect_aliases_locked(name, out);
    return out;
}

std::string AliasRegistry::canonical_name(std::string_view name) const
{
    std::shared_lock lock(pImpl->m_mutex);
    std::string canonical(name);
    // Registration rejects cycles, so this terminates.
    for (auto it = pImpl->m_aliases.find(canonical); it != pImpl->m_aliases.end();
         it = pImpl->m_aliases.find(canonical))
    {
        canonical = it->second;
    }
    return canonical;
}

void AliasRegistry::set_allow_overriding(bool allow) noexcept
{
    pImpl->m_allow_overriding.store(allow, std::memory_order_relaxed);
}

bool AliasRegistry::allow_overriding() const noexcept
{
    return pImpl->m_allow_overriding.load(std::memory_order_relaxed);
}

} // namespace comphub::registry
