/**
 * @file registry_errors.hpp
 * @brief Error taxonomy of the component registry.
 *
 * Every failure the registry raises derives from `RegistryError` and is tagged
 * with an `ErrorKind`. Errors observed incidentally while one construction was
 * running (for example an early factory that failed and was retried) travel
 * with the final error as "related causes", capped at `MAX_RELATED_CAUSES`.
 *
 * The no-throw entry points convert the same information into a
 * `RegistryFailure` value instead.
 */
#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "comphub_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251 4275)
#endif

namespace comphub::registry
{

/// Upper bound on related causes carried by one error.
inline constexpr size_t MAX_RELATED_CAUSES = 100;

enum class ErrorKind : int
{
    Cycle = 1,              ///< name requested while already in creation on the same path
    ConstructionFailed = 2, ///< builder or factory threw
    NotAllowed = 3,         ///< construction attempted during teardown
    Consistency = 4,        ///< misuse or violated internal invariant
};

COMPHUB_UTILS_EXPORT const char *to_string(ErrorKind kind) noexcept;

/**
 * @brief Renders the message of a captured exception.
 * @return `what()` for std::exception, otherwise a fixed placeholder.
 */
COMPHUB_UTILS_EXPORT std::string describe_exception(const std::exception_ptr &error);

class COMPHUB_UTILS_EXPORT RegistryError : public std::runtime_error
{
  public:
    RegistryError(ErrorKind kind, std::string component, const std::string &message,
                  std::exception_ptr cause = nullptr);
    ~RegistryError() override;

    RegistryError(const RegistryError &) = default;
    RegistryError &operator=(const RegistryError &) = default;

    [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }
    [[nodiscard]] const std::string &component() const noexcept { return m_component; }

    /// The wrapped original error, or null.
    [[nodiscard]] std::exception_ptr cause() const noexcept { return m_cause; }

    [[nodiscard]] const std::vector<std::exception_ptr> &related_causes() const noexcept
    {
        return m_related;
    }

    /**
     * @brief Appends a related cause.
     * @return false if the list was already full; the cause is then only counted.
     */
    bool add_related_cause(std::exception_ptr error);

    /// Counts causes that were discarded before they reached this error.
    void note_dropped_related_causes(size_t count) noexcept { m_dropped_related += count; }

    /// Related causes discarded because the list was full.
    [[nodiscard]] size_t dropped_related_causes() const noexcept { return m_dropped_related; }

  private:
    ErrorKind m_kind;
    std::string m_component;
    std::exception_ptr m_cause;
    std::vector<std::exception_ptr> m_related;
    size_t m_dropped_related{0};
};

/**
 * @brief A name was requested for full construction while it was already being
 *        constructed on the same call path (or the wait for it would deadlock).
 */
class COMPHUB_UTILS_EXPORT UnresolvableCycleError : public RegistryError
{
  public:
    explicit UnresolvableCycleError(std::string component, const std::string &detail = {});
    ~UnresolvableCycleError() override;
};

/// A builder or factory failed; `cause()` holds the original exception.
class COMPHUB_UTILS_EXPORT ConstructionFailedError : public RegistryError
{
  public:
    ConstructionFailedError(std::string component, std::exception_ptr cause);
    ~ConstructionFailedError() override;
};

/// Construction was requested while the registry is tearing down.
class COMPHUB_UTILS_EXPORT ConstructionNotAllowedError : public RegistryError
{
  public:
    explicit ConstructionNotAllowedError(std::string component, const std::string &detail = {});
    ~ConstructionNotAllowedError() override;
};

/// The caller broke a registry invariant.
class COMPHUB_UTILS_EXPORT ConsistencyError : public RegistryError
{
  public:
    ConsistencyError(std::string component, const std::string &detail);
    ~ConsistencyError() override;
};

/**
 * @brief Thrown by a ComponentFactory that cannot produce its object yet.
 * The registry reports it to callers as an UnresolvableCycleError.
 */
class COMPHUB_UTILS_EXPORT FactoryNotReadyError : public std::runtime_error
{
  public:
    explicit FactoryNotReadyError(const std::string &what);
    ~FactoryNotReadyError() override;
};

/**
 * @brief Value form of a registry failure, returned by the `try_*` operations.
 */
struct COMPHUB_UTILS_EXPORT RegistryFailure
{
    ErrorKind kind{ErrorKind::Consistency};
    std::string component;
    std::string message;
    std::vector<std::exception_ptr> related;
    std::exception_ptr error; ///< the exception the throwing API would have raised

    /// Builds a failure from any captured exception.
    static RegistryFailure from_exception(std::exception_ptr error, std::string component);

    /// Throws the original exception again.
    [[noreturn]] void rethrow() const;
};

} // namespace comphub::registry

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
