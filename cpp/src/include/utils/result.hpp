/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that fail in expected ways.
 *
 * The registry's non-throwing entry points (`try_get_or_create`,
 * `try_get_produced_object`) report failure through this type instead of an
 * exception. `E` carries the failure description; `error_code()` is an optional
 * integer detail supplied by the producer.
 *
 * - No implicit conversion to bool.
 * - `[[nodiscard]]` factories so a failure cannot be dropped silently.
 * - Move-only, so large payloads are never copied by accident.
 */

#pragma once

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace comphub::utils
{

/**
 * @class Result
 * @tparam T Success value type.
 * @tparam E Error payload type. Must be default constructible.
 *
 * @code
 * auto r = registry.try_get_or_create("cache", build_cache);
 * if (r.is_ok()) {
 *     use(r.content());
 * } else {
 *     LOGGER_WARN("cache unavailable: {}", r.error().message);
 * }
 * @endcode
 */
template <typename T, typename E>
class Result
{
    static_assert(std::is_default_constructible_v<E>, "Result error type must be default constructible");

  public:
    using value_type = T;
    using error_type = E;

    // ====================================================================
    // Construction
    // ====================================================================

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Creates a failed Result.
     * @param err The error payload.
     * @param code Optional detail code (default 0).
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{std::move(err), code};
        return result;
    }

    /// Default constructed Results are in the error state with `E{}`.
    Result() : m_data(ErrorData{E{}, 0}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    // ====================================================================
    // State Queries
    // ====================================================================

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /// @throws std::logic_error if the Result holds an error.
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    // ====================================================================
    // Error Access
    // ====================================================================

    /// @throws std::logic_error if the Result holds a value.
    [[nodiscard]] const E &error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).payload;
    }

    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E payload;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

} // namespace comphub::utils
