/*******************************************************************************
 * @file dependency_graph.cpp
 * @brief Dependency and containment edges, and dependency-ordered teardown.
 *
 * Edges are kept as inverse indices:
 *   m_dependents[b]   = { a, ... }   a depends on b
 *   m_dependencies[a] = { b, ... }
 *   m_contains[outer] = { inner, ... }
 * Destroying a name destroys its dependents first, then runs its own teardown
 * callback, then destroys the names it contains.
 ******************************************************************************/
#include "component_registry_impl.hpp"

#include <algorithm>

namespace comphub::registry
{

// ============================================================================
// Edges
// ============================================================================

void ComponentRegistry::register_dependency(std::string_view name, std::string_view depends_on)
{
    validate_component_name(name, "component name");
    validate_component_name(depends_on, "dependency name");
    const std::string canonical = pImpl->m_aliases.canonical_name(name);
    const std::string canonical_dep = pImpl->m_aliases.canonical_name(depends_on);

    std::lock_guard lock(pImpl->m_mutex);
    if (pImpl->m_dependents[canonical_dep].insert(canonical))
    {
        pImpl->m_dependencies[canonical].insert(canonical_dep);
    }
}

void ComponentRegistry::register_containment(std::string_view inner, std::string_view outer)
{
    validate_component_name(inner, "inner component name");
    validate_component_name(outer, "outer component name");
    const std::string canonical_inner = pImpl->m_aliases.canonical_name(inner);
    const std::string canonical_outer = pImpl->m_aliases.canonical_name(outer);
    {
        std::lock_guard lock(pImpl->m_mutex);
        if (!pImpl->m_contains[canonical_outer].insert(canonical_inner))
        {
            return;
        }
    }
    // The outer component must go before the one it contains.
    register_dependency(canonical_outer, canonical_inner);
}

std::vector<std::string> ComponentRegistry::dependents_of(std::string_view name) const
{
    const std::string canonical = pImpl->m_aliases.canonical_name(name);
    std::lock_guard lock(pImpl->m_mutex);
    auto it = pImpl->m_dependents.find(canonical);
    return it != pImpl->m_dependents.end() ? it->second.items() : std::vector<std::string>{};
}

std::vector<std::string> ComponentRegistry::dependencies_of(std::string_view name) const
{
    const std::string canonical = pImpl->m_aliases.canonical_name(name);
    std::lock_guard lock(pImpl->m_mutex);
    auto it = pImpl->m_dependencies.find(canonical);
    return it != pImpl->m_dependencies.end() ? it->second.items() : std::vector<std::string>{};
}

bool ComponentRegistry::has_dependents(std::string_view name) const
{
    const std::string canonical = pImpl->m_aliases.canonical_name(name);
    std::lock_guard lock(pImpl->m_mutex);
    auto it = pImpl->m_dependents.find(canonical);
    return it != pImpl->m_dependents.end() && !it->second.empty();
}

bool ComponentRegistry::is_transitively_dependent(std::string_view name, std::string_view candidate) const
{
    const std::string start = pImpl->m_aliases.canonical_name(name);
    const std::string target = pImpl->m_aliases.canonical_name(candidate);

    std::lock_guard lock(pImpl->m_mutex);
    std::unordered_set<std::string> visited;
    std::vector<std::string> pending{start};
    while (!pending.empty())
    {
        const std::string current = std::move(pending.back());
        pending.pop_back();
        if (!visited.insert(current).second)
        {
            continue;
        }
        auto it = pImpl->m_dependents.find(current);
        if (it == pImpl->m_dependents.end())
        {
            continue;
        }
        for (const auto &dependent : it->second.items())
        {
            if (dependent == target)
            {
                return true;
            }
            pending.push_back(dependent);
        }
    }
    return false;
}

// ============================================================================
// Teardown
// ============================================================================

void ComponentRegistry::register_teardown(std::string_view name_view, TeardownCallback callback)
{
    validate_component_name(name_view, "component name");
    if (!callback)
    {
        throw std::invalid_argument("ComponentRegistry: teardown callback must not be empty.");
    }
    const std::string name(name_view);
    std::lock_guard lock(pImpl->m_mutex);
    if (pImpl->m_teardowns.insert_or_assign(name, std::move(callback)).second)
    {
        pImpl->m_teardown_order.push_back(name);
    }
}

void ComponentRegistry::Impl::destroy_locked(std::unique_lock<std::mutex> &lock, const std::string &name,
                                             TeardownSummary &summary)
{
    // Out of every cache first, so nobody can obtain it while it is torn down.
    if (m_built.erase(name) != 0)
    {
        m_registered_order.erase(std::remove(m_registered_order.begin(), m_registered_order.end(), name),
                                 m_registered_order.end());
    }
    m_produced.erase(name);
    m_deferred.erase(name);
    m_early_objects.erase(name);

    TeardownCallback callback;
    if (auto it = m_teardowns.find(name); it != m_teardowns.end())
    {
        callback = std::move(it->second);
        m_teardowns.erase(it);
        auto pos = std::find(m_teardown_order.begin(), m_teardown_order.end(), name);
        if (pos == m_teardown_order.end())
        {
            CPH_PANIC("Teardown callback of '{}' is missing from the teardown order", name);
        }
        m_teardown_order.erase(pos);
    }

    std::vector<std::string> dependents;
    if (auto it = m_dependents.find(name); it != m_dependents.end())
    {
        dependents = it->second.items();
        m_dependents.erase(it);
    }
    for (const auto &dependent : dependents)
    {
        destroy_locked(lock, dependent, summary);
    }

    if (callback)
    {
        std::string error_message;
        lock.unlock();
        try
        {
            callback();
        }
        catch (const std::exception &e)
        {
            error_message = e.what();
        }
        catch (...)
        {
            error_message = "unknown (non-std::exception) error";
        }
        lock.lock();
        summary.destroyed.push_back(name);
        if (!error_message.empty())
        {
            logf(RegistryLogLevel::Warn, "Destruction of component '{}' threw an exception: {}", name,
                 error_message);
            summary.failures.push_back(TeardownFailure{name, std::move(error_message)});
        }
    }

    std::vector<std::string> contained;
    if (auto it = m_contains.find(name); it != m_contains.end())
    {
        contained = it->second.items();
        m_contains.erase(it);
    }
    for (const auto &inner : contained)
    {
        destroy_locked(lock, inner, summary);
    }

    for (auto it = m_dependents.begin(); it != m_dependents.end();)
    {
        it->second.erase(name);
        it = it->second.empty() ? m_dependents.erase(it) : std::next(it);
    }
    m_dependencies.erase(name);
}

TeardownSummary ComponentRegistry::destroy(std::string_view name)
{
    validate_component_name(name, "component name");
    TeardownSummary summary;
    auto deliver = pImpl->deliver_logs_on_exit();
    std::unique_lock lock(pImpl->m_mutex);
    pImpl->destroy_locked(lock, std::string(name), summary);
    pImpl->m_cv.notify_all();
    return summary;
}

TeardownSummary ComponentRegistry::destroy_all()
{
    auto &d = *pImpl;
    TeardownSummary summary;

    auto deliver = d.deliver_logs_on_exit();
    std::unique_lock lock(d.m_mutex);
    if (d.m_in_destruction)
    {
        if (d.m_destruction_owner == std::this_thread::get_id())
        {
            d.log(RegistryLogLevel::Warn, "destroy_all() called from a teardown callback; ignored.");
            return summary;
        }
        // The running sweep reports its own failures; this caller only waits for it.
        d.log(RegistryLogLevel::Debug, "destroy_all() is already running on another thread; waiting.");
        d.m_cv.wait(lock, [&] { return !d.m_in_destruction; });
        return summary;
    }
    d.m_in_destruction = true;
    d.m_destruction_owner = std::this_thread::get_id();
    auto finish = comphub::basics::make_scope_guard(
        [&]
        {
            d.m_in_destruction = false;
            d.m_destruction_owner = std::thread::id();
            d.m_cv.notify_all();
        });

    d.logf(RegistryLogLevel::Info, "Destroying {} component(s) with teardown callbacks",
           d.m_teardown_order.size());

    const std::vector<std::string> names = d.m_teardown_order;
    for (auto it = names.rbegin(); it != names.rend(); ++it)
    {
        d.destroy_locked(lock, *it, summary);
    }

    d.m_contains.clear();
    d.m_dependents.clear();
    d.m_dependencies.clear();
    d.m_built.clear();
    d.m_registered_order.clear();
    d.m_produced.clear();
    d.m_deferred.clear();
    d.m_early_objects.clear();
    d.m_teardowns.clear();
    d.m_teardown_order.clear();

    d.logf(RegistryLogLevel::Info, "destroy_all() finished: {} teardown callback(s) run, {} failed",
           summary.destroyed.size(), summary.failures.size());
    if (!summary.failures.empty())
    {
        std::vector<std::string> failed;
        failed.reserve(summary.failures.size());
        for (const auto &failure : summary.failures)
        {
            failed.push_back(failure.component);
        }
        d.logf(RegistryLogLevel::Warn, "Teardown callbacks failed for: {}",
               comphub::format_tools::quoted_list(failed));
    }
    return summary;
}

bool ComponentRegistry::is_in_destruction() const
{
    std::lock_guard lock(pImpl->m_mutex);
    return pImpl->m_in_destruction;
}

} // namespace comphub::registry
