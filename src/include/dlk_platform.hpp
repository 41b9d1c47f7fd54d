#pragma once
/**
 * @file dlk_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (DIRLOCK_PLATFORM_LINUX, DIRLOCK_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_APPLE)
#define DIRLOCK_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define DIRLOCK_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define DIRLOCK_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define DIRLOCK_PLATFORM_UNKNOWN 1
#else
// Fallback detection
#if defined(__APPLE__) && defined(__MACH__)
#define DIRLOCK_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define DIRLOCK_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define DIRLOCK_PLATFORM_LINUX 1
#else
#define DIRLOCK_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(DIRLOCK_PLATFORM_APPLE) || defined(DIRLOCK_PLATFORM_FREEBSD) ||                        \
    defined(DIRLOCK_PLATFORM_LINUX)
#define DIRLOCK_IS_POSIX 1
#else
#define DIRLOCK_IS_POSIX 0
#endif

#if !DIRLOCK_IS_POSIX
#error "dirlock relies on POSIX mkdir/stat/utimensat semantics and supports POSIX platforms only."
#endif

// --- Require C++20 or later --------------------------------------------------
// std::source_location, concepts and designated initializers are used throughout.
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif

#include "dirlock_utils_export.h"

namespace dirlock::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
DIRLOCK_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
DIRLOCK_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The executable name, or "unknown" on failure.
 */
DIRLOCK_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

} // namespace dirlock::platform
