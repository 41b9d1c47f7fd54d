#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace dirlock::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII guard that executes a callable on scope exit.
 *
 * The cleanup action runs whether the scope is left by normal execution or by an
 * exception. The guard is movable but not copyable, so exactly one owner is responsible
 * for the action.
 *
 * @code
 *  auto promise = std::make_shared<std::promise<void>>();
 *  std::thread worker([promise]() {
 *      // Fulfil the completion signal on every exit path of the worker.
 *      auto done = dirlock::basics::make_scope_guard([&]() { promise->set_value(); });
 *      run_until_cancelled();
 *  });
 * @endcode
 *
 * ### Exceptions
 *
 * The destructor is `noexcept` and swallows anything the callable throws, because a
 * throwing destructor during unwinding calls `std::terminate`. Cleanup that can fail
 * should handle (and log) its own errors, or be run through `invoke_and_rethrow()`.
 *
 * ### Thread Safety
 *
 * Not thread-safe. A single guard must not be used from several threads.
 *
 * @tparam Callable A decayed callable type invocable as an lvalue with no arguments.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>,
                  "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_move_constructible_v<Callable> || std::is_copy_constructible_v<Callable>,
                  "ScopeGuard's callable must be move- or copy-constructible.");

    /**
     * @brief Checks if the guard is active and will execute on scope exit.
     */
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    /**
     * @brief Move constructor. The source guard is dismissed.
     */
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
            catch (...)
            {
                // Destructors must not throw; see class docs.
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /**
     * @brief Deactivates the guard, preventing the callable from being executed.
     */
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the callable now if active, then dismisses the guard.
     *
     * Exceptions thrown by the callable are swallowed.
     */
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // dismiss first so the destructor cannot run it twice
            try
            {
                std::invoke(m_func);
            }
            catch (...)
            {
            }
        }
    }

    /**
     * @brief Runs the callable now if active, then dismisses the guard.
     *
     * Exceptions thrown by the callable propagate to the caller.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard, deducing and decaying the callable type.
 *
 * @note The callable is stored by value. References it captures must outlive the guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace dirlock::basics
