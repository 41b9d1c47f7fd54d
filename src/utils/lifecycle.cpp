/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * 1.  **Two-phase initialization**: modules are collected by `register_module`
 *     (thread-safe, rejected once initialization has begun). The first call to
 *     `initialize()` builds the dependency graph and sorts it.
 *
 * 2.  **Topological sort (Kahn's algorithm)**: nodes with in-degree zero are
 *     queued; processing a node decrements the in-degree of its dependents.
 *     If fewer nodes are emitted than exist, the graph has a cycle and the
 *     process aborts.
 *
 * 3.  **Timed shutdown**: each shutdown callback runs through `std::async`
 *     and is waited on with the module's timeout. A hung module produces a
 *     warning instead of blocking termination; exceptions are reported and do
 *     not stop the remaining modules from shutting down.
 ******************************************************************************/
#include "dlk_base.hpp"
#include "utils/lifecycle.hpp"

#include <algorithm>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace dirlock::utils
{

namespace
{
struct InternalModuleShutdownDef
{
    LifecycleCallback func = nullptr;
    std::chrono::milliseconds timeout{0};
};

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    LifecycleCallback startup = nullptr;
    InternalModuleShutdownDef shutdown;
};
} // namespace

// ============================================================================
// ModuleDef (pImpl forwarding)
// ============================================================================

class ModuleDefImpl
{
  public:
    InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    if (name.empty())
    {
        throw std::invalid_argument("ModuleDef: module name must not be empty");
    }
    if (name.size() > MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(fmt::format("ModuleDef: module name '{}...' exceeds {} chars",
                                            name.substr(0, 32), MAX_MODULE_NAME_LEN));
    }
    pImpl->def.name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (!pImpl || dependency_name.empty())
        return;
    if (dependency_name.size() > MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(fmt::format("ModuleDef: dependency name exceeds {} chars",
                                            MAX_MODULE_NAME_LEN));
    }
    pImpl->def.dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl)
        pImpl->def.startup = startup_func;
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl)
    {
        pImpl->def.shutdown.func = shutdown_func;
        pImpl->def.shutdown.timeout = timeout;
    }
}

// ============================================================================
// LifecycleManager
// ============================================================================

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl() : m_pid(platform::get_pid()), m_app_name(platform::get_executable_name())
    {
    }

    struct InternalGraphNode
    {
        std::string name;
        LifecycleCallback startup = nullptr;
        InternalModuleShutdownDef shutdown;

        size_t in_degree = 0;
        std::vector<InternalGraphNode *> dependents;
    };

    void registerModule(InternalModuleDef module_def)
    {
        if (m_is_initialized.load(std::memory_order_acquire))
        {
            DLK_PANIC("[dirlock-lifecycle] [{}:{}] Attempted to register module '{}' after "
                      "initialization has started.",
                      m_app_name, m_pid, module_def.name);
        }
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        m_registered_modules.push_back(std::move(module_def));
    }

    void initialize(std::source_location loc)
    {
        if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }

        DLK_DEBUG("[dirlock-lifecycle] [{}:{}] Initializing application (from {}:{})...",
                  m_app_name, m_pid, format_tools::filename_only(loc.file_name()), loc.line());
        (void)loc;

        try
        {
            buildGraph();
            m_startup_order = topologicalSort();
        }
        catch (const std::runtime_error &e)
        {
            DLK_PANIC("[dirlock-lifecycle] [{}:{}] Lifecycle dependency error: {}", m_app_name,
                      m_pid, e.what());
        }

        m_shutdown_order = m_startup_order;
        std::reverse(m_shutdown_order.begin(), m_shutdown_order.end());

        for (const auto *module : m_startup_order)
        {
            try
            {
                DLK_DEBUG("[dirlock-lifecycle] -> Starting module: '{}'", module->name);
                if (module->startup)
                    module->startup(nullptr);
            }
            catch (const std::exception &e)
            {
                DLK_PANIC("[dirlock-lifecycle] [{}:{}] Module '{}' threw during startup: {}",
                          m_app_name, m_pid, module->name, e.what());
            }
        }
        DLK_DEBUG("[dirlock-lifecycle] [{}:{}] Application initialization complete ({} modules).",
                  m_app_name, m_pid, m_startup_order.size());
    }

    void finalize(std::source_location loc)
    {
        if (!m_is_initialized.load(std::memory_order_acquire) ||
            m_is_finalized.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }
        DLK_DEBUG("[dirlock-lifecycle] [{}:{}] Finalizing application (from {}:{})...",
                  m_app_name, m_pid, format_tools::filename_only(loc.file_name()), loc.line());
        (void)loc;

        for (const auto *module : m_shutdown_order)
        {
            if (!module->shutdown.func)
                continue;
            try
            {
                DLK_DEBUG("[dirlock-lifecycle] <- Shutting down module: '{}'", module->name);
                std::future<void> future =
                    std::async(std::launch::async, module->shutdown.func, nullptr);
                if (module->shutdown.timeout.count() > 0 &&
                    future.wait_for(module->shutdown.timeout) == std::future_status::timeout)
                {
                    fmt::print(stderr,
                               "[dirlock-lifecycle] [{}:{}] WARNING: Shutdown for module '{}' "
                               "timed out after {}ms.\n",
                               m_app_name, m_pid, module->name, module->shutdown.timeout.count());
                    // The future's destructor would block on the hung callback.
                    m_abandoned_shutdowns.push_back(std::move(future));
                    continue;
                }
                future.get();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr,
                           "[dirlock-lifecycle] [{}:{}] Module '{}' threw during shutdown: {}\n",
                           m_app_name, m_pid, module->name, e.what());
            }
        }
        DLK_DEBUG("[dirlock-lifecycle] [{}:{}] Application finalization complete.", m_app_name,
                  m_pid);
    }

    bool is_initialized() const noexcept { return m_is_initialized.load(std::memory_order_acquire); }
    bool is_finalized() const noexcept { return m_is_finalized.load(std::memory_order_acquire); }

  private:
    void buildGraph()
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);

        for (const auto &mod_def : m_registered_modules)
        {
            if (m_module_graph.count(mod_def.name))
            {
                throw std::runtime_error("Duplicate module name detected: '" + mod_def.name +
                                         "'.");
            }
            m_module_graph[mod_def.name] = {mod_def.name, mod_def.startup, mod_def.shutdown, 0, {}};
        }

        for (const auto &mod_def : m_registered_modules)
        {
            InternalGraphNode &module_node = m_module_graph.at(mod_def.name);
            module_node.in_degree = mod_def.dependencies.size();

            for (const auto &dep_name : mod_def.dependencies)
            {
                auto it = m_module_graph.find(dep_name);
                if (it == m_module_graph.end())
                {
                    throw std::runtime_error("Module '" + mod_def.name +
                                             "' has an undefined dependency: '" + dep_name + "'.");
                }
                it->second.dependents.push_back(&module_node);
            }
        }
        m_registered_modules.clear();
    }

    std::vector<InternalGraphNode *> topologicalSort()
    {
        std::vector<InternalGraphNode *> sorted_order;
        sorted_order.reserve(m_module_graph.size());
        std::vector<InternalGraphNode *> queue;

        for (auto &pair : m_module_graph)
        {
            if (pair.second.in_degree == 0)
            {
                queue.push_back(&pair.second);
            }
        }

        size_t head = 0;
        while (head < queue.size())
        {
            InternalGraphNode *u = queue[head++];
            sorted_order.push_back(u);
            for (InternalGraphNode *v : u->dependents)
            {
                if (--(v->in_degree) == 0)
                {
                    queue.push_back(v);
                }
            }
        }

        if (sorted_order.size() != m_module_graph.size())
        {
            std::string cycle_node_name;
            for (const auto &pair : m_module_graph)
            {
                if (pair.second.in_degree > 0)
                {
                    cycle_node_name = pair.first;
                    break;
                }
            }
            throw std::runtime_error("Circular dependency detected in modules. Module '" +
                                     cycle_node_name + "' is part of a cycle.");
        }
        return sorted_order;
    }

    const uint64_t m_pid;
    const std::string m_app_name;

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};

    std::mutex m_registry_mutex;

    std::vector<InternalModuleDef> m_registered_modules;
    std::map<std::string, InternalGraphNode> m_module_graph;
    std::vector<InternalGraphNode *> m_startup_order;
    std::vector<InternalGraphNode *> m_shutdown_order;
    std::vector<std::future<void>> m_abandoned_shutdowns;
};

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    if (!module_def.pImpl)
        return;
    pImpl->registerModule(std::move(module_def.pImpl->def));
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized() const noexcept
{
    return pImpl->is_initialized();
}

bool LifecycleManager::is_finalized() const noexcept
{
    return pImpl->is_finalized();
}

} // namespace dirlock::utils
