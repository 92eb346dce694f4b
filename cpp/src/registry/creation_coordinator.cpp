/*******************************************************************************
 * @file creation_coordinator.cpp
 * @brief get_or_create: at most one builder per name, cycle detection and
 *        suppressed-error aggregation.
 *
 * Protocol for one construction of `name`, all bookkeeping under m_mutex:
 *   1. cache hit                      -> return it
 *   2. teardown in progress           -> ConstructionNotAllowedError
 *   3. in creation by this thread     -> UnresolvableCycleError (nested build if excluded)
 *   4. in creation by another thread  -> wait for it, then start over
 *   5. mark in creation, open an empty suppressed-error bag, unlock, run the builder
 *   6. relock, commit or fail; the mark, early state and bag are cleared on every path
 ******************************************************************************/
#include "component_registry_impl.hpp"

namespace comphub::registry
{

// ============================================================================
// Impl helpers
// ============================================================================

bool ComponentRegistry::Impl::is_tracked_in_creation_locked(const std::string &name) const
{
    return m_in_creation.count(name) != 0 && m_excluded.count(name) == 0;
}

void ComponentRegistry::Impl::commit_locked(const std::string &name, Instance instance)
{
    m_built.insert_or_assign(name, std::move(instance));
    m_registered_order.push_back(name);
}

void ComponentRegistry::Impl::clear_creation_state_locked(const std::string &name, bool failed)
{
    m_in_creation.erase(name);
    m_early_factories.erase(name);
    m_early_objects.erase(name);
    m_suppressed.erase(name);
    if (failed)
    {
        m_deferred.erase(name);
    }
}

bool ComponentRegistry::Impl::add_suppressed_locked(const std::string &name, std::exception_ptr error)
{
    auto it = m_suppressed.find(name);
    if (it == m_suppressed.end() || !error)
    {
        return false;
    }
    auto &bag = it->second;
    if (bag.errors.size() < MAX_RELATED_CAUSES)
    {
        bag.errors.push_back(std::move(error));
    }
    else if (bag.dropped++ == 0)
    {
        logf(RegistryLogLevel::Warn,
             "More than {} suppressed errors while creating '{}'; further ones are only counted.",
             MAX_RELATED_CAUSES, name);
    }
    return true;
}

void ComponentRegistry::Impl::attach_suppressed(RegistryError &error, const SuppressedBag &bag)
{
    for (const auto &ep : bag.errors)
    {
        error.add_related_cause(ep);
    }
    error.note_dropped_related_causes(bag.dropped);
}

bool ComponentRegistry::Impl::would_deadlock_locked(std::thread::id self, std::thread::id owner) const
{
    std::unordered_set<std::thread::id> visited;
    auto current = owner;
    while (visited.insert(current).second)
    {
        auto it = m_waiting_for.find(current);
        if (it == m_waiting_for.end())
        {
            return false;
        }
        current = it->second;
        if (current == self)
        {
            return true;
        }
    }
    return false;
}

// ============================================================================
// ComponentRegistry: creation
// ============================================================================

Instance ComponentRegistry::get_or_create(std::string_view name_view, const Builder &builder)
{
    validate_component_name(name_view, "component name");
    if (!builder)
    {
        throw std::invalid_argument("ComponentRegistry: builder must not be empty.");
    }
    const std::string name(name_view);
    const auto self = std::this_thread::get_id();
    auto &d = *pImpl;

    auto deliver = d.deliver_logs_on_exit();
    std::unique_lock lock(d.m_mutex);
    bool nested = false;
    for (;;)
    {
        if (auto it = d.m_built.find(name); it != d.m_built.end())
        {
            return it->second;
        }
        if (d.m_in_destruction)
        {
            throw ConstructionNotAllowedError(
                name, "singleton creation is not allowed while destroy_all() is in progress");
        }
        auto mark = d.m_in_creation.find(name);
        if (mark == d.m_in_creation.end())
        {
            break;
        }
        if (mark->second.owner == self)
        {
            if (d.m_excluded.count(name) == 0)
            {
                throw UnresolvableCycleError(name);
            }
            nested = true; // excluded from tracking: re-entry builds again
            break;
        }
        const auto owner = mark->second.owner;
        d.wait_for_owner(lock, name, owner,
                         [&]
                         {
                             auto m = d.m_in_creation.find(name);
                             return m == d.m_in_creation.end() || m->second.owner != owner;
                         });
    }

    if (!nested)
    {
        d.m_in_creation.emplace(name, Impl::CreationMark{self});
        d.m_suppressed[name] = Impl::SuppressedBag{};
    }

    bool committed = false;
    auto cleanup = comphub::basics::make_scope_guard(
        [&]
        {
            if (!nested)
            {
                d.clear_creation_state_locked(name, !committed);
            }
            d.m_cv.notify_all();
        });

    lock.unlock();
    Instance result;
    std::exception_ptr failure;
    try
    {
        result = builder();
    }
    catch (...)
    {
        failure = std::current_exception(); // handled below, under the lock
    }
    lock.lock();

    if (failure)
    {
        // Someone else finished this name meanwhile: prefer the cached value.
        if (auto it = d.m_built.find(name); it != d.m_built.end())
        {
            d.logf(RegistryLogLevel::Debug,
                   "Construction of '{}' failed but another path completed it: {}", name,
                   describe_exception(failure));
            committed = true;
            return it->second;
        }
        Impl::SuppressedBag bag;
        if (!nested)
        {
            if (auto it = d.m_suppressed.find(name); it != d.m_suppressed.end())
            {
                bag = std::move(it->second);
            }
        }
        try
        {
            std::rethrow_exception(failure);
        }
        catch (RegistryError &e)
        {
            Impl::attach_suppressed(e, bag);
            d.logf(RegistryLogLevel::Debug, "Construction of '{}' aborted: {}", name, e.what());
            throw;
        }
        catch (...)
        {
            ConstructionFailedError wrapped(name, failure);
            Impl::attach_suppressed(wrapped, bag);
            d.logf(RegistryLogLevel::Debug, "{}", wrapped.what());
            throw wrapped;
        }
    }

    if (d.m_in_destruction)
    {
        throw ConstructionNotAllowedError(name, "destroy_all() started while it was being built");
    }
    if (auto it = d.m_built.find(name); it != d.m_built.end())
    {
        committed = true;
        return it->second;
    }

    if (!nested)
    {
        d.await_early_production(lock, name);
    }

    Instance final_instance = result ? std::move(result) : null_component();
    if (auto early = d.m_early_objects.find(name);
        early != d.m_early_objects.end() && early->second != final_instance)
    {
        if (d.m_options.early_reference_policy == EarlyReferencePolicy::RejectMismatch)
        {
            throw UnresolvableCycleError(
                name, "An early reference was handed to dependents, but the finished object is a "
                      "different instance.");
        }
        d.logf(RegistryLogLevel::Info,
               "Component '{}' finished as a different instance than its early reference; "
               "keeping the early reference.",
               name);
        final_instance = early->second;
    }

    d.commit_locked(name, final_instance);
    committed = true;
    d.logf(RegistryLogLevel::Debug, "Created component '{}'", name);
    return final_instance;
}

CreateResult ComponentRegistry::try_get_or_create(std::string_view name, const Builder &builder) noexcept
{
    try
    {
        return CreateResult::ok(get_or_create(name, builder));
    }
    catch (...)
    {
        auto failure = RegistryFailure::from_exception(std::current_exception(), std::string(name));
        const int code = static_cast<int>(failure.kind);
        return CreateResult::error(std::move(failure), code);
    }
}

void ComponentRegistry::set_currently_in_creation(std::string_view name_view, bool in_creation)
{
    validate_component_name(name_view, "component name");
    std::lock_guard lock(pImpl->m_mutex);
    if (in_creation)
    {
        pImpl->m_excluded.erase(std::string(name_view));
    }
    else
    {
        pImpl->m_excluded.insert(std::string(name_view));
    }
}

bool ComponentRegistry::is_currently_in_creation(std::string_view name) const
{
    std::lock_guard lock(pImpl->m_mutex);
    return pImpl->is_tracked_in_creation_locked(std::string(name));
}

bool ComponentRegistry::record_suppressed_error(std::string_view name, std::exception_ptr error)
{
    auto deliver = pImpl->deliver_logs_on_exit();
    std::lock_guard lock(pImpl->m_mutex);
    return pImpl->add_suppressed_locked(std::string(name), std::move(error));
}

} // namespace comphub::registry
