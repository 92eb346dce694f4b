/*******************************************************************************
 * @file early_references.cpp
 * @brief Early-reference factories and resolution for names in creation.
 *
 * One early object per construction window: the registered factory runs at
 * most once, outside the lock, and its result is shared by every later
 * resolve_early call until the window closes.
 ******************************************************************************/
#include "component_registry_impl.hpp"

namespace comphub::registry
{

void ComponentRegistry::Impl::await_early_production(std::unique_lock<std::mutex> &lock,
                                                     const std::string &name)
{
    const auto self = std::this_thread::get_id();
    for (;;)
    {
        auto slot = m_early_factories.find(name);
        if (slot == m_early_factories.end() || !slot->second.producing || slot->second.producer == self)
        {
            return;
        }
        const auto producer = slot->second.producer;
        if (would_deadlock_locked(self, producer))
        {
            logf(RegistryLogLevel::Warn,
                 "Committing '{}' while its early factory is still running on another thread.", name);
            return;
        }
        wait_for_owner(lock, name, producer,
                       [&]
                       {
                           auto s = m_early_factories.find(name);
                           return s == m_early_factories.end() || !s->second.producing ||
                                  s->second.producer != producer;
                       });
    }
}

bool ComponentRegistry::register_early_factory(std::string_view name_view, EarlyFactory factory)
{
    validate_component_name(name_view, "component name");
    if (!factory)
    {
        throw std::invalid_argument("ComponentRegistry: early factory must not be empty.");
    }
    const std::string name(name_view);
    auto &d = *pImpl;

    auto deliver = d.deliver_logs_on_exit();
    if (!d.m_options.allow_circular_references)
    {
        d.logf(RegistryLogLevel::Debug,
               "Circular references are disabled; early factory for '{}' not registered.", name);
        return false;
    }

    std::lock_guard lock(d.m_mutex);
    if (d.m_in_creation.count(name) == 0)
    {
        throw ConsistencyError(name, "an early factory can only be registered while the component "
                                     "is in creation");
    }
    if (d.m_early_objects.count(name) != 0)
    {
        throw ConsistencyError(name, "the early reference has already been exposed");
    }
    auto &slot = d.m_early_factories[name];
    if (slot.producing)
    {
        throw ConsistencyError(name, "the early factory is running");
    }
    slot.factory = std::move(factory);
    return true;
}

std::optional<EarlyReference> ComponentRegistry::resolve_early(std::string_view name_view)
{
    validate_component_name(name_view, "component name");
    const std::string name(name_view);
    const auto self = std::this_thread::get_id();
    auto &d = *pImpl;

    auto deliver = d.deliver_logs_on_exit();
    std::unique_lock lock(d.m_mutex);
    EarlyFactory factory;
    for (;;)
    {
        if (auto it = d.m_built.find(name); it != d.m_built.end())
        {
            return EarlyReference(it->second, true);
        }
        if (auto it = d.m_early_objects.find(name); it != d.m_early_objects.end())
        {
            return EarlyReference(it->second, false);
        }
        if (!d.is_tracked_in_creation_locked(name))
        {
            return std::nullopt;
        }
        auto slot = d.m_early_factories.find(name);
        if (slot == d.m_early_factories.end())
        {
            return std::nullopt;
        }
        if (!slot->second.producing)
        {
            slot->second.producing = true;
            slot->second.producer = self;
            factory = slot->second.factory;
            break;
        }
        if (slot->second.producer == self)
        {
            throw UnresolvableCycleError(name, "Its early reference was requested again while the "
                                               "early factory was running.");
        }
        const auto producer = slot->second.producer;
        d.wait_for_owner(lock, name, producer,
                         [&]
                         {
                             auto s = d.m_early_factories.find(name);
                             return s == d.m_early_factories.end() || !s->second.producing ||
                                    s->second.producer != producer;
                         });
    }

    lock.unlock();
    Instance early;
    std::exception_ptr failure;
    try
    {
        early = factory();
        if (!early)
        {
            throw ConsistencyError(name, "the early factory returned an empty instance");
        }
    }
    catch (...)
    {
        failure = std::current_exception(); // recorded below, under the lock
    }
    lock.lock();

    auto notify = comphub::basics::make_scope_guard([&] { d.m_cv.notify_all(); });
    auto slot = d.m_early_factories.find(name);
    const bool window_open =
        slot != d.m_early_factories.end() && slot->second.producing && slot->second.producer == self;

    if (failure)
    {
        if (window_open)
        {
            slot->second.producing = false; // another resolver may retry the factory
            d.add_suppressed_locked(name, failure);
        }
        std::rethrow_exception(failure);
    }

    if (!window_open)
    {
        // The construction ended while the factory ran.
        if (auto it = d.m_built.find(name); it != d.m_built.end())
        {
            return EarlyReference(it->second, true);
        }
        return EarlyReference(early, false);
    }

    d.m_early_factories.erase(slot);
    d.m_early_objects.emplace(name, early);
    d.logf(RegistryLogLevel::Debug, "Exposed early reference for component '{}'", name);
    return EarlyReference(std::move(early), false);
}

} // namespace comphub::registry
