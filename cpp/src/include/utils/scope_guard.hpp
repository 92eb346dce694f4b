#pragma once
/**
 * @file scope_guard.hpp
 * @brief RAII guard that runs a cleanup callable when the enclosing scope exits.
 *
 * The registry leans on this for its transient bookkeeping: whatever way a
 * builder call ends, the "currently in creation" mark, the early factory slot
 * and the suppressed-error bag for that name must be cleared and waiters woken.
 *
 * @code
 *  std::unique_lock lock(m_mutex);
 *  m_in_creation.emplace(name, CreationMark{std::this_thread::get_id(), true});
 *  auto clear = comphub::basics::make_scope_guard([&] {
 *      m_in_creation.erase(name);
 *      m_cv.notify_all();
 *  });
 *  // ... unlock, build, relock, commit ...
 * @endcode
 *
 * ### Exceptions from the callable
 *
 * The destructor is `noexcept`. An exception escaping the callable during scope
 * exit is caught and reported through `comphub::debug::debug_msg` so that a
 * failing cleanup still leaves a trace on stderr; it is not propagated. Use
 * `invoke_and_rethrow()` when the caller needs to see the failure.
 *
 * The guard is movable, not copyable, and not thread-safe.
 */

#include <concepts>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include "utils/debug_info.hpp"

namespace comphub::basics
{

// `std::invocable<Callable&>`: the callable is stored as a member and invoked
// as an lvalue, so rvalue-only call operators are rejected at make_scope_guard.
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_move_constructible_v<Callable> || std::is_copy_constructible_v<Callable>,
                  "ScopeGuard's callable must be move- or copy-constructible.");

    /// @return `true` while the guard will still run on scope exit.
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    /// Moves the cleanup action; the source guard becomes inactive.
    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept { run_reporting("~ScopeGuard"); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// Cancels the cleanup action.
    constexpr void dismiss() noexcept { m_active = false; }

    /// Alias for `dismiss()`.
    constexpr void release() noexcept { dismiss(); }

    /**
     * @brief Runs the callable now (if still active) and dismisses the guard.
     * Exceptions from the callable are reported to stderr, not propagated.
     */
    void invoke() noexcept { run_reporting("ScopeGuard::invoke"); }

    /**
     * @brief Runs the callable now (if still active) and dismisses the guard.
     * Exceptions from the callable propagate to the caller.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false; // dismiss first so a throwing callable never runs twice
            std::invoke(m_func);
        }
    }

  private:
    void run_reporting(const char *where) noexcept
    {
        if (!m_active)
        {
            return;
        }
        m_active = false;
        try
        {
            std::invoke(m_func);
        }
        catch (const std::exception &e)
        {
            comphub::debug::debug_msg("{}: cleanup callable threw: {}", where, e.what());
        }
        catch (...)
        {
            comphub::debug::debug_msg("{}: cleanup callable threw a non-standard exception", where);
        }
    }

    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard holding a decayed copy of `f`.
 * @note References captured by `f` must outlive the guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace comphub::basics
