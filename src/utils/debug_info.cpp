/**
 * @file debug_info.cpp
 * @brief Stack trace printing for `DLK_PANIC` and test-worker failure reports.
 */
#include "dlk_base.hpp"

#include <cstdlib>
#include <string>
#include <vector>

#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols

namespace dirlock::debug
{

namespace
{
// Formatting straight to stderr must never throw out of the stack trace printer.
template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (...)
    {
        std::fputs("[stack trace: formatting failed]\n", stderr);
    }
}

std::string demangle(const char *symbol)
{
    int status = 0;
    char *dem = abi::__cxa_demangle(symbol, nullptr, nullptr, &status);
    if (status == 0 && dem)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    return symbol;
}
} // namespace

void print_stack_trace() noexcept
{
    try
    {
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        int nframes = backtrace(callstack, kMaxFrames);
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }

        char **symbols = backtrace_symbols(callstack, nframes);
        auto free_symbols = basics::make_scope_guard([&symbols]() { std::free(symbols); });

        safe_format_to_stderr("Stack Trace (most recent call first):\n");
        // Frame 0 is this function.
        for (int i = 1; i < nframes; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

            Dl_info dlinfo;
            if (dladdr(callstack[i], &dlinfo) && dlinfo.dli_sname)
            {
                const auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                safe_format_to_stderr("{} + {:#x}", demangle(dlinfo.dli_sname),
                                      static_cast<unsigned long long>(addr - saddr));
            }
            else if (symbols && symbols[i])
            {
                safe_format_to_stderr("{}", symbols[i]);
            }
            else if (dladdr(callstack[i], &dlinfo) && dlinfo.dli_fname)
            {
                const auto base = reinterpret_cast<uintptr_t>(dlinfo.dli_fbase);
                safe_format_to_stderr("({}) + {:#x}", dlinfo.dli_fname,
                                      static_cast<unsigned long long>(addr - base));
            }
            else
            {
                safe_format_to_stderr("[unknown]");
            }
            safe_format_to_stderr("\n");
        }
        std::fflush(stderr);
    }
    catch (const std::bad_alloc &)
    {
        std::fputs("Stack trace generation failed with std::bad_alloc.\n", stderr);
        std::fflush(stderr);
    }
    catch (...)
    {
        std::fputs("Stack trace generation failed with unknown error.\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace dirlock::debug
