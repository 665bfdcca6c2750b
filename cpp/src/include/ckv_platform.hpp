#pragma once
/**
 * @file ckv_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (CHECKEDVAL_PLATFORM_LINUX, CHECKEDVAL_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Build-system macros (PLATFORM_LINUX, etc.) win; otherwise compiler predefined macros are used.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define CHECKEDVAL_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define CHECKEDVAL_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define CHECKEDVAL_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define CHECKEDVAL_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define CHECKEDVAL_PLATFORM_UNKNOWN 1
#else
// Fallback detection
#if defined(_WIN64)
#define CHECKEDVAL_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define CHECKEDVAL_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define CHECKEDVAL_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define CHECKEDVAL_PLATFORM_LINUX 1
#else
#define CHECKEDVAL_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(CHECKEDVAL_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(CHECKEDVAL_PLATFORM_WIN64)
#define CHECKEDVAL_IS_WINDOWS 1
#undef CHECKEDVAL_IS_POSIX
#elif defined(CHECKEDVAL_PLATFORM_APPLE) || defined(CHECKEDVAL_PLATFORM_FREEBSD) ||                \
    defined(CHECKEDVAL_PLATFORM_LINUX)
#undef CHECKEDVAL_IS_WINDOWS
#define CHECKEDVAL_IS_POSIX 1
#else
#undef CHECKEDVAL_IS_WINDOWS
#undef CHECKEDVAL_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// Concepts, std::source_location and __VA_OPT__ are used throughout.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "checkedval requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "checkedval requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

// The bounded arithmetic engine widens every operation to a 128-bit intermediate.
#if !defined(__SIZEOF_INT128__)
#error "checkedval requires a compiler with 128-bit integer support (GCC or Clang)."
#endif

#include "checkedval_utils_export.h"

namespace checkedval::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
CHECKEDVAL_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
CHECKEDVAL_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The name of the executable, or "unknown" on failure.
 */
CHECKEDVAL_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

} // namespace checkedval::platform
