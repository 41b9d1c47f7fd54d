#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "dirlock_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

namespace dirlock::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief Function pointer type for module startup and shutdown callbacks.
 *
 * A C-style function pointer keeps the definition usable across shared-library
 * boundaries. `arg` is the string given to `set_startup`/`set_shutdown`, or `nullptr`.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for a lifecycle module definition.
 *
 * Hides its `std::string` and `std::vector` members behind a pImpl. Movable but not
 * copyable; ownership passes to the `LifecycleManager` on registration.
 */
class DIRLOCK_UTILS_EXPORT ModuleDef
{
  public:
    /// Maximum number of characters allowed in a module or dependency name.
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;

    /**
     * @brief Constructs a module definition with a given name.
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);

    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief Declares a dependency on another module, which is started first and shut
     *        down last. An empty name is ignored.
     * @throws std::length_error if `dependency_name.size() > MAX_MODULE_NAME_LEN`.
     */
    void add_dependency(std::string_view dependency_name);

    /// @brief Sets the startup callback.
    void set_startup(LifecycleCallback startup_func);

    /**
     * @brief Sets the shutdown callback.
     * @param timeout Maximum time allowed for the callback; `0ms` waits indefinitely.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace dirlock::utils
