/*******************************************************************************
 * @file component_registry.cpp
 * @brief ComponentRegistry construction, logging and singleton-cache queries.
 *
 * The remaining operations live beside this file:
 * - creation_coordinator.cpp : get_or_create and in-creation tracking
 * - early_references.cpp     : early factories and resolve_early
 * - dependency_graph.cpp     : dependency/containment edges and teardown
 * - produced_objects.cpp     : factory components and their produced objects
 ******************************************************************************/
#include "component_registry_impl.hpp"

namespace comphub::registry
{

void validate_component_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("ComponentRegistry: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > MAX_COMPONENT_NAME_LEN)
    {
        throw std::length_error(std::string("ComponentRegistry: ") + param_name +
                                " exceeds maximum of " + std::to_string(MAX_COMPONENT_NAME_LEN) +
                                " characters.");
    }
}

// ============================================================================
// Null component sentinel
// ============================================================================

namespace
{
struct NullComponent
{
};
} // namespace

const Instance &null_component() noexcept
{
    static const Instance sentinel = std::make_shared<NullComponent>();
    return sentinel;
}

bool is_null_component(const Instance &instance) noexcept
{
    return instance != nullptr && instance == null_component();
}

const char *to_string(EarlyReferencePolicy policy) noexcept
{
    switch (policy)
    {
    case EarlyReferencePolicy::RetainEarly:
        return "retain_early";
    case EarlyReferencePolicy::RejectMismatch:
        return "reject_mismatch";
    }
    return "unknown";
}

// ============================================================================
// Log sink
// ============================================================================

void ComponentRegistry::Impl::log(RegistryLogLevel level, std::string msg) const
{
    std::lock_guard lock(m_log_mutex);
    m_pending_logs.push_back(PendingLog{level, std::move(msg)});
}

void ComponentRegistry::Impl::deliver_logs() const
{
    std::vector<PendingLog> lines;
    {
        std::lock_guard lock(m_log_mutex);
        lines.swap(m_pending_logs);
    }
    if (lines.empty())
    {
        return;
    }

    auto sink_ptr = m_log_sink.load(std::memory_order_acquire);
    for (const auto &line : lines)
    {
        if (sink_ptr && *sink_ptr)
        {
            try
            {
                (*sink_ptr)(line.level, line.message);
            }
            catch (const std::exception &e)
            {
                LOGGER_WARN("[Registry] Log sink threw ({}) for: {}", e.what(), line.message);
            }
            continue;
        }
        switch (line.level)
        {
        case RegistryLogLevel::Debug:
            LOGGER_DEBUG("[Registry] {}", line.message);
            break;
        case RegistryLogLevel::Info:
            LOGGER_INFO("[Registry] {}", line.message);
            break;
        case RegistryLogLevel::Warn:
            LOGGER_WARN("[Registry] {}", line.message);
            break;
        case RegistryLogLevel::Error:
            LOGGER_ERROR("[Registry] {}", line.message);
            break;
        }
    }
}

// ============================================================================
// ComponentRegistry public API
// ============================================================================

ComponentRegistry::ComponentRegistry(RegistryOptions options)
    : pImpl(std::make_unique<Impl>(options))
{
}

ComponentRegistry::~ComponentRegistry()
{
    auto deliver = pImpl->deliver_logs_on_exit();
    std::lock_guard lock(pImpl->m_mutex);
    if (!pImpl->m_teardowns.empty())
    {
        pImpl->logf(RegistryLogLevel::Warn,
                    "Registry released with {} teardown callback(s) never run; call destroy_all() "
                    "first.",
                    pImpl->m_teardowns.size());
    }
}

const RegistryOptions &ComponentRegistry::options() const noexcept
{
    return pImpl->m_options;
}

void ComponentRegistry::set_log_sink(RegistryLogSink sink)
{
    if (sink)
    {
        pImpl->m_log_sink.store(std::make_shared<RegistryLogSink>(std::move(sink)),
                                std::memory_order_release);
    }
    else
    {
        pImpl->m_log_sink.store(nullptr, std::memory_order_release);
    }
}

void ComponentRegistry::register_singleton(std::string_view name_view, Instance instance)
{
    validate_component_name(name_view, "component name");
    const std::string name(name_view);

    auto deliver = pImpl->deliver_logs_on_exit();
    std::lock_guard lock(pImpl->m_mutex);
    if (auto it = pImpl->m_built.find(name); it != pImpl->m_built.end())
    {
        throw ConsistencyError(name, "Could not register object: there is already an object bound "
                                     "under this name.");
    }
    pImpl->commit_locked(name, instance ? std::move(instance) : null_component());
    pImpl->m_cv.notify_all();
    pImpl->logf(RegistryLogLevel::Debug, "Registered externally built component '{}'", name);
}

Instance ComponentRegistry::get_if_built(std::string_view name) const
{
    std::lock_guard lock(pImpl->m_mutex);
    auto it = pImpl->m_built.find(std::string(name));
    return it != pImpl->m_built.end() ? it->second : Instance{};
}

bool ComponentRegistry::contains_built(std::string_view name) const
{
    std::lock_guard lock(pImpl->m_mutex);
    return pImpl->m_built.count(std::string(name)) != 0;
}

std::vector<std::string> ComponentRegistry::built_names() const
{
    std::lock_guard lock(pImpl->m_mutex);
    return pImpl->m_registered_order;
}

size_t ComponentRegistry::built_count() const
{
    std::lock_guard lock(pImpl->m_mutex);
    return pImpl->m_built.size();
}

AliasRegistry &ComponentRegistry::aliases() noexcept
{
    return pImpl->m_aliases;
}

const AliasRegistry &ComponentRegistry::aliases() const noexcept
{
    return pImpl->m_aliases;
}

} // namespace comphub::registry
