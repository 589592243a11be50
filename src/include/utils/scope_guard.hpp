#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace pgtemp::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a callable when the enclosing scope exits, normally or by exception.
 *
 * Movable, not copyable. A moved-from guard is inactive.
 *
 * @code
 *  sigset_t saved;
 *  ::pthread_sigmask(SIG_SETMASK, &all, &saved);
 *  auto restore = pgtemp::basics::make_scope_guard(
 *      [&saved]() noexcept { ::pthread_sigmask(SIG_SETMASK, &saved, nullptr); });
 *  // ... critical section; the mask is restored on every exit path.
 * @endcode
 *
 * The callable must be `noexcept`: it runs from a destructor, possibly during
 * stack unwinding. Cleanup that can fail belongs in a RollbackStack, which
 * reports failures through the logger.
 */
template <typename Callable>
requires std::is_nothrow_invocable_v<Callable &>
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

    ~ScopeGuard() noexcept { invoke(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /// Cancels the pending action.
    constexpr void dismiss() noexcept { m_active = false; }

    /// Runs the action now. Runs at most once.
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // Must dismiss before invoke to prevent double execution.
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace pgtemp::basics
