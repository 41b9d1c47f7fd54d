#pragma once
/**
 * @file dlk_base.hpp
 * @brief Layer 1: Basic modules built on dlk_platform.
 *
 * Provides format_tools, debug_info and scope_guard, plus module_def for lifecycle module
 * registration. Include this when you need formatting, panic/debug helpers, or RAII guards.
 */
#include "dlk_platform.hpp"

// Standard library support required by format_tools, debug_info, and guards
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
