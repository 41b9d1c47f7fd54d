#pragma once
/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Dependency-aware application startup and shutdown.
 *
 * Services with process-wide state (the Logger worker thread, the DirLock
 * registry) are modules. Each module publishes a `ModuleDef` naming its
 * dependencies and its startup/shutdown callbacks. The `LifecycleManager`
 * sorts the modules topologically, starts them in order, and shuts them down
 * in reverse order with a per-module timeout.
 *
 * Applications establish the lifecycle with the `LifecycleGuard` RAII helper:
 *
 * ```cpp
 * #include "dlk_service.hpp"
 *
 * int main()
 * {
 *     dirlock::utils::LifecycleGuard app_lifecycle(dirlock::utils::MakeModDefList(
 *         dirlock::utils::Logger::GetLifecycleModule(),
 *         dirlock::utils::DirLock::GetLifecycleModule()));
 *
 *     dirlock::utils::DirLock lock("/tmp/myjob.lock");
 *     lock.with_lock([] { do_exclusive_work(); });
 *     return 0;
 * } // guard destructor finalizes all modules
 * ```
 ******************************************************************************/
#include "dlk_base.hpp"

#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

namespace dirlock::utils
{

class LifecycleManagerImpl;

/**
 * @class LifecycleManager
 * @brief Process-wide singleton that owns registered modules and drives their lifecycle.
 */
class DIRLOCK_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;
    LifecycleManager(LifecycleManager &&) = delete;
    LifecycleManager &operator=(LifecycleManager &&) = delete;

    /**
     * @brief Registers a module. Must happen before `initialize()`; registering later is
     *        a fatal error.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Builds the dependency graph and runs every startup callback in order.
     *        Idempotent. Dependency errors (unknown name, cycle, duplicate) are fatal.
     */
    void initialize(std::source_location loc = std::source_location::current());

    /**
     * @brief Runs every shutdown callback in reverse startup order, honouring each
     *        module's timeout. Idempotent; a no-op before `initialize()`.
     */
    void finalize(std::source_location loc = std::source_location::current());

    bool is_initialized() const noexcept;
    bool is_finalized() const noexcept;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

// Convenience wrappers around the singleton.
inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}
inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}
inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}
inline bool IsAppInitialized() noexcept
{
    return LifecycleManager::instance().is_initialized();
}

// Call-site: MakeModDefList(Logger::GetLifecycleModule(), DirLock::GetLifecycleModule())
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the application lifecycle.
 *
 * The first guard constructed in a process registers its modules and initializes the
 * application; its destructor finalizes it. Later guards are no-ops and their modules are
 * ignored.
 *
 * @warning Do not rely on destructors of static objects to use lifecycle services; they
 *          may run after the owning guard has shut those services down.
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        DLK_DEBUG("[DLK_Lifecycle] LifecycleGuard constructed in {} ({}:{})",
                  m_loc.function_name(), format_tools::filename_only(m_loc.file_name()),
                  m_loc.line());
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            FinalizeApp(m_loc);
        }
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                RegisterModule(std::move(m));
            }
            InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            fmt::print(stderr,
                       "[dirlock-lifecycle] [{}:{}] WARNING: LifecycleGuard in {} ({}:{}) is a "
                       "no-op; an owner already exists and its modules were ignored.\n",
                       platform::get_executable_name(), platform::get_pid(),
                       m_loc.function_name(), format_tools::filename_only(m_loc.file_name()),
                       m_loc.line());
        }
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace dirlock::utils
