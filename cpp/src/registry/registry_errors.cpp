#include "cph_registry.hpp"

#include <fmt/format.h>

namespace comphub::registry
{

const char *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::Cycle:
        return "Cycle";
    case ErrorKind::ConstructionFailed:
        return "ConstructionFailed";
    case ErrorKind::NotAllowed:
        return "NotAllowed";
    case ErrorKind::Consistency:
        return "Consistency";
    }
    return "Unknown";
}

std::string describe_exception(const std::exception_ptr &error)
{
    if (!error)
    {
        return "<no error>";
    }
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown (non-std::exception) error";
    }
}

// ============================================================================
// RegistryError
// ============================================================================

RegistryError::RegistryError(ErrorKind kind, std::string component, const std::string &message,
                             std::exception_ptr cause)
    : std::runtime_error(message), m_kind(kind), m_component(std::move(component)),
      m_cause(std::move(cause))
{
}

RegistryError::~RegistryError() = default;

bool RegistryError::add_related_cause(std::exception_ptr error)
{
    if (!error)
    {
        return false;
    }
    if (m_related.size() >= MAX_RELATED_CAUSES)
    {
        ++m_dropped_related;
        return false;
    }
    m_related.push_back(std::move(error));
    return true;
}

UnresolvableCycleError::UnresolvableCycleError(std::string component, const std::string &detail)
    : RegistryError(ErrorKind::Cycle, component,
                    fmt::format("Error creating component '{}': Requested component is currently "
                                "in creation: Is there an unresolvable circular reference?{}{}",
                                component, detail.empty() ? "" : " ", detail))
{
}

UnresolvableCycleError::~UnresolvableCycleError() = default;

ConstructionFailedError::ConstructionFailedError(std::string component, std::exception_ptr cause)
    : RegistryError(ErrorKind::ConstructionFailed, component,
                    fmt::format("Error creating component '{}': {}", component,
                                describe_exception(cause)),
                    cause)
{
}

ConstructionFailedError::~ConstructionFailedError() = default;

ConstructionNotAllowedError::ConstructionNotAllowedError(std::string component,
                                                         const std::string &detail)
    : RegistryError(ErrorKind::NotAllowed, component,
                    fmt::format("Component '{}' cannot be created while the registry is being "
                                "torn down{}{}",
                                component, detail.empty() ? "" : ": ", detail))
{
}

ConstructionNotAllowedError::~ConstructionNotAllowedError() = default;

ConsistencyError::ConsistencyError(std::string component, const std::string &detail)
    : RegistryError(ErrorKind::Consistency, component,
                    fmt::format("Registry consistency error for '{}': {}", component, detail))
{
}

ConsistencyError::~ConsistencyError() = default;

FactoryNotReadyError::FactoryNotReadyError(const std::string &what) : std::runtime_error(what) {}

FactoryNotReadyError::~FactoryNotReadyError() = default;

// ============================================================================
// RegistryFailure
// ============================================================================

RegistryFailure RegistryFailure::from_exception(std::exception_ptr error, std::string component)
{
    RegistryFailure failure;
    failure.component = std::move(component);
    failure.error = error;
    try
    {
        std::rethrow_exception(error);
    }
    catch (const RegistryError &e)
    {
        failure.kind = e.kind();
        failure.component = e.component();
        failure.message = e.what();
        failure.related = e.related_causes();
    }
    catch (const std::exception &e)
    {
        // Argument errors and the like: not a construction failure of the registry.
        failure.kind = ErrorKind::Consistency;
        failure.message = e.what();
    }
    catch (...)
    {
        failure.kind = ErrorKind::ConstructionFailed;
        failure.message = describe_exception(error);
    }
    return failure;
}

void RegistryFailure::rethrow() const
{
    if (error)
    {
        std::rethrow_exception(error);
    }
    throw ConsistencyError(component, message.empty() ? "failure without a captured error" : message);
}

} // namespace comphub::registry
