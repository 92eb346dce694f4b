/*******************************************************************************
 * @file produced_objects.cpp
 * @brief Objects produced by factory components, cached apart from the factory.
 *
 * A singleton factory whose component is built gets its product cached in
 * m_produced after `post_process` ran once. While the factory's own
 * construction is still running, the product is handed out unprocessed and,
 * when a post-processor was given, stashed in m_deferred so the first request
 * after the construction completes post-processes that same object instead of
 * producing a new one.
 ******************************************************************************/
#include "component_registry_impl.hpp"

namespace comphub::registry
{

namespace
{

// Runs the factory without the registry lock and maps its failures.
Instance invoke_factory(const std::string &name, ComponentFactory &factory)
{
    try
    {
        return factory.produce();
    }
    catch (const FactoryNotReadyError &e)
    {
        throw UnresolvableCycleError(name, e.what());
    }
    catch (const RegistryError &)
    {
        throw;
    }
    catch (...)
    {
        throw ConstructionFailedError(name, std::current_exception());
    }
}

Instance run_post_processor(const std::string &name, const PostProcessor &post_process, Instance object)
{
    if (!post_process)
    {
        return object;
    }
    Instance processed;
    try
    {
        processed = post_process(std::move(object), name);
    }
    catch (const RegistryError &)
    {
        throw;
    }
    catch (...)
    {
        throw ConstructionFailedError(name, std::current_exception());
    }
    return processed ? processed : null_component();
}

} // namespace

Instance ComponentRegistry::get_produced_object(std::string_view name_view, ComponentFactory &factory,
                                                const PostProcessor &post_process)
{
    validate_component_name(name_view, "factory name");
    const std::string name(name_view);
    auto &d = *pImpl;

    auto deliver = d.deliver_logs_on_exit();
    if (!factory.is_singleton())
    {
        Instance object = invoke_factory(name, factory);
        std::unique_lock lock(d.m_mutex);
        if (!object)
        {
            if (d.is_tracked_in_creation_locked(name))
            {
                throw UnresolvableCycleError(name, "The factory produced nothing while its own "
                                                   "construction is in progress.");
            }
            return null_component();
        }
        if (d.is_tracked_in_creation_locked(name))
        {
            return object;
        }
        lock.unlock();
        return run_post_processor(name, post_process, std::move(object));
    }

    const auto self = std::this_thread::get_id();
    std::unique_lock lock(d.m_mutex);
    for (;;)
    {
        if (auto it = d.m_produced.find(name); it != d.m_produced.end())
        {
            return it->second;
        }
        auto mark = d.m_producing.find(name);
        if (mark == d.m_producing.end())
        {
            break;
        }
        if (mark->second.owner != self)
        {
            const auto owner = mark->second.owner;
            d.wait_for_owner(lock, name, owner,
                             [&]
                             {
                                 auto m = d.m_producing.find(name);
                                 return m == d.m_producing.end() || m->second.owner != owner;
                             });
            continue;
        }
        if (mark->second.phase == Impl::ProducePhase::Producing)
        {
            throw UnresolvableCycleError(name, "Its factory was asked for the object while producing it.");
        }
        // Re-entered from our own post-processor: hand out a raw product.
        lock.unlock();
        Instance raw = invoke_factory(name, factory);
        return raw ? raw : null_component();
    }

    Instance object;
    bool from_stash = false;
    const bool built_at_start = d.m_built.count(name) != 0;
    if (built_at_start && !d.is_tracked_in_creation_locked(name))
    {
        if (auto it = d.m_deferred.find(name); it != d.m_deferred.end())
        {
            object = std::move(it->second);
            d.m_deferred.erase(it);
            from_stash = true;
        }
    }

    d.m_producing[name] = Impl::ProduceMark{self, Impl::ProducePhase::Producing};
    auto release = comphub::basics::make_scope_guard(
        [&]
        {
            if (!lock.owns_lock())
            {
                lock.lock();
            }
            d.m_producing.erase(name);
            d.m_cv.notify_all();
        });

    if (!from_stash)
    {
        lock.unlock();
        object = invoke_factory(name, factory);
        lock.lock();

        if (!object)
        {
            if (d.is_tracked_in_creation_locked(name))
            {
                throw UnresolvableCycleError(name, "The factory produced nothing while its own "
                                                   "construction is in progress.");
            }
            object = null_component();
        }
        if (auto it = d.m_produced.find(name); it != d.m_produced.end())
        {
            return it->second;
        }
    }

    if (d.is_tracked_in_creation_locked(name))
    {
        if (post_process)
        {
            d.m_deferred.insert_or_assign(name, object);
            d.logf(RegistryLogLevel::Debug,
                   "Post-processing of the object produced by '{}' deferred until it is built", name);
        }
        return object;
    }
    if (d.m_built.count(name) == 0)
    {
        // Not a cached singleton: process it for this caller only.
        lock.unlock();
        return run_post_processor(name, post_process, std::move(object));
    }

    d.m_producing[name].phase = Impl::ProducePhase::PostProcessing;
    lock.unlock();
    Instance processed = run_post_processor(name, post_process, std::move(object));
    lock.lock();

    if (d.m_built.count(name) != 0)
    {
        return d.m_produced.try_emplace(name, std::move(processed)).first->second;
    }
    return processed;
}

CreateResult ComponentRegistry::try_get_produced_object(std::string_view name, ComponentFactory &factory,
                                                        const PostProcessor &post_process) noexcept
{
    try
    {
        return CreateResult::ok(get_produced_object(name, factory, post_process));
    }
    catch (...)
    {
        auto failure = RegistryFailure::from_exception(std::current_exception(), std::string(name));
        const int code = static_cast<int>(failure.kind);
        return CreateResult::error(std::move(failure), code);
    }
}

Instance ComponentRegistry::get_cached_produced_object(std::string_view name) const
{
    std::lock_guard lock(pImpl->m_mutex);
    auto it = pImpl->m_produced.find(std::string(name));
    return it != pImpl->m_produced.end() ? it->second : Instance{};
}

} // namespace comphub::registry
