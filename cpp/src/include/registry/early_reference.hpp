#pragma once

#include <utility>

#include "registry/instance.hpp"

namespace comphub::registry
{

/**
 * @brief What `ComponentRegistry::resolve_early` hands out.
 *
 * Kept distinct from a plain Instance so that call sites must opt in to a
 * reference that may point at a not yet fully initialized object.
 * `is_complete()` is true only when the name had already finished construction.
 */
class EarlyReference
{
  public:
    EarlyReference(Instance object, bool complete) : m_object(std::move(object)), m_complete(complete) {}

    [[nodiscard]] const Instance &get() const noexcept { return m_object; }
    [[nodiscard]] bool is_complete() const noexcept { return m_complete; }

    template <typename T> [[nodiscard]] std::shared_ptr<T> as() const noexcept
    {
        return instance_cast<T>(m_object);
    }

  private:
    Instance m_object;
    bool m_complete;
};

} // namespace comphub::registry
