/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for error handling without exceptions.
 *
 * Design:
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool (prevents accidental misuse)
 * - [[nodiscard]] factories prevent ignoring errors
 */

#pragma once

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace docgate
{

/**
 * @brief Empty success value, used where an operation has nothing to return (e.g. delete).
 */
struct Unit
{
    friend constexpr bool operator==(Unit, Unit) noexcept { return true; }
};

/**
 * @class Result
 * @brief Tagged union holding either a success value or an error value.
 *
 * @tparam T Success value type
 * @tparam E Error type (an enum or a structured error record)
 *
 * @code
 * Result<int, ErrorItem> compute() {
 *     if (condition) {
 *         return Result<int, ErrorItem>::ok(42);
 *     }
 *     return Result<int, ErrorItem>::error(DatabaseErrorItems::timeout());
 * }
 *
 * auto result = compute();
 * if (result.is_ok()) {
 *     int value = result.content();
 * } else {
 *     const ErrorItem &err = result.error();
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe. Use separate Result
 * instances per thread or external synchronization.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    // ====================================================================
    // Construction - Use static factory methods for clarity
    // ====================================================================

    /**
     * @brief Create a successful Result containing a value
     * @param value The success value (moved into Result)
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data.template emplace<0>(std::move(value));
        return result;
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error value (moved into Result)
     */
    [[nodiscard]] static Result error(E err)
    {
        Result result;
        result.m_data.template emplace<1>(ErrorData{std::move(err)});
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(std::in_place_index<1>, ErrorData{E{}}) {}

    // Movable but not copyable (to avoid accidental copies of large values)
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;

    // If copying is needed, use explicit .clone()
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    /**
     * @brief Explicit deep copy. Used where one outcome fans out to several receivers.
     */
    [[nodiscard]] Result clone() const
    {
        static_assert(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>,
                      "Result::clone() requires copyable T and E");
        Result copy;
        copy.m_data = m_data;
        return copy;
    }

    // ====================================================================
    // State Queries
    // ====================================================================

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }

    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /**
     * @brief Get the success content (mutable reference)
     * @throws std::logic_error if Result is in error state
     *
     * Always check is_ok() before calling content().
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     *
     * After this call, Result is left in a valid but unspecified state.
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(std::move(m_data));
    }

    /**
     * @brief Get the success value or a default if error
     */
    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<0>(m_data) : std::move(default_value);
    }

    // ====================================================================
    // Error Access
    // ====================================================================

    /**
     * @brief Get the error value
     * @throws std::logic_error if Result is in success state
     *
     * Always check is_error() before calling error().
     */
    [[nodiscard]] const E &error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<1>(m_data).value;
    }

  private:
    // Wrapped so that T and E may be the same type without making the variant ambiguous.
    struct ErrorData
    {
        E value;
    };

    std::variant<T, ErrorData> m_data;
};

} // namespace docgate
