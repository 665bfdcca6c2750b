/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        and debug messaging.
 *
 * Everything here writes straight to `stderr` and never goes through the Logger, so it
 * stays usable while the Logger itself is failing. Format strings are checked at compile
 * time through `fmt::format_string`, and `std::source_location` supplies call sites.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "checkedval_utils_export.h"
#include "utils/format_tools.hpp"

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", checkedval::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace checkedval::debug
{

/**
 * @brief Prints the current call stack (most recent call first) to `stderr`.
 *
 * On POSIX systems the frames come from `backtrace` and are symbolized with `dladdr`
 * and the C++ demangler. Other platforms print a placeholder line.
 *
 * @warning Not async-signal-safe; it allocates and formats.
 */
CHECKEDVAL_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and a stack trace.
 *
 * Prints "[PANIC] file:line:function -- message" to `stderr`, then the stack trace,
 * then calls `std::abort()`. Formatting failures are reported instead of the message
 * and never prevent the abort.
 *
 * @param loc Call site, normally captured by `CKV_PANIC`.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        std::fprintf(stderr, "[PANIC] FATAL FORMAT ERROR DURING PANIC: %s\n", e.what());
    }
    catch (...)
    {
        std::fputs("[PANIC] FATAL UNKNOWN EXCEPTION DURING PANIC\n", stderr);
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints "[DBG]  message" to `stderr` with a compile-time checked format string.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
        std::fflush(stderr);
    }
}

// debug_msg_rt: runtime format string, take args by const& so make_format_args binds
template <typename... Args>
inline void debug_msg_rt(std::string_view fmt_str, const Args &...args) noexcept
{
    try
    {
        const auto body = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FORMAT ERROR DURING DEBUG_MSG_RT: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace checkedval::debug

#ifndef CKV_LOC_HERE_STR
#define CKV_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `checkedval::debug::panic` with the current source location.
 * @see checkedval::debug::panic
 */
#ifndef CKV_PANIC
#define CKV_PANIC(fmt, ...)                                                                        \
    ::checkedval::debug::panic(std::source_location::current(),                                    \
                               FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Debug message to `stderr`; compiled out unless CKV_ENABLE_DEBUG_MESSAGES is defined.
 */
#ifndef CKV_DEBUG
#if defined(CKV_ENABLE_DEBUG_MESSAGES)
#define CKV_DEBUG(fmt, ...) ::checkedval::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define CKV_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

#ifndef CKV_DEBUG_RT
#if defined(CKV_ENABLE_DEBUG_MESSAGES)
#define CKV_DEBUG_RT(fmt, ...) ::checkedval::debug::debug_msg_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define CKV_DEBUG_RT(fmt, ...)                                                                     \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
