#pragma once
/**
 * @file scope_guard.hpp
 * @brief RAII guard that runs a callable on scope exit unless dismissed.
 */

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace docgate::basics
{

/**
 * @class ScopeGuard
 * @brief Executes a cleanup callable when the enclosing scope is left, whether by
 *        normal flow or by an exception.
 *
 * Movable but not copyable. A moved-from guard is inactive.
 *
 * The destructor is `noexcept`; a `std::exception` escaping the callable during
 * destruction is reported on stderr and not rethrown. Cleanup callables should
 * therefore not throw. Use `invoke_and_rethrow()` where the caller must observe
 * a cleanup failure.
 *
 * @code
 *  auto guard = docgate::basics::make_scope_guard([&] { queue.pop_front(); });
 *  run_action();     // may throw
 *  // guard pops the queue either way
 * @endcode
 *
 * Not thread-safe.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            try
            {
                std::invoke(m_func);
            }
            catch (const std::exception &e)
            {
                // Destructor must not throw; report and continue unwinding.
                std::fprintf(stderr, "[ScopeGuard] cleanup threw: %s\n", e.what());
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// @brief True while the guard will still run on scope exit.
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /// @brief Cancels the pending cleanup.
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the cleanup now (if still active) and dismisses the guard.
     *        Exceptions from the callable propagate.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false; // dismiss first so a throwing callable is not re-run
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Factory for ScopeGuard. The callable is stored by value; references it
 *        captures must outlive the guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace docgate::basics
