/*******************************************************************************
 * @file logger.hpp
 * @brief Thread-safe, synchronous logging utility.
 *
 * **Design**
 * 1.  **fmt-based API**: `LOGGER_INFO("value {} rejected", v)` checks the format
 *     string at compile time (`FMT_STRING`) and formats into a `fmt::memory_buffer`
 *     only when the level is enabled.
 * 2.  **Sink Abstraction**: A `Sink` base class defines writing and flushing.
 *     `ConsoleSink` (stderr, the default) and `FileSink` are provided.
 * 3.  **Synchronous writes**: Messages are written on the calling thread while a
 *     single mutex serializes access to the active sink. The library emits few
 *     messages, mostly on error paths, so no background worker is used.
 * 4.  **Robustness**: Logging never throws. Sink write failures are reported through
 *     an optional callback and otherwise dropped.
 *
 * **Configuration**
 * The initial level is read once from the environment variable
 * `CHECKEDVAL_LOG_LEVEL` (`trace`, `debug`, `info`, `warn`, `error`, `system`);
 * it defaults to `warn`. `LOGGER_COMPILE_LEVEL` removes lower levels at compile time.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_WARN("guard dropped with pending value {}", staged);
 *
 * auto &logger = checkedval::utils::Logger::instance();
 * logger.set_logfile("/tmp/checkedval.log");
 * logger.set_level(checkedval::utils::Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/

#pragma once

#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "checkedval_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace checkedval::utils
{

class CHECKEDVAL_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /**
     * @brief Parses a level name (case-insensitive; "warning" is accepted for "warn").
     * @return The level, or std::nullopt for an unknown name.
     */
    static std::optional<Level> level_from_string(std::string_view name);

    // --- Sinks ---

    /**
     * @brief Switch logging to the console (stderr).
     */
    bool set_console();

    /**
     * @brief Switch logging to a file opened in append mode.
     * @return false if the file cannot be opened; the previous sink stays active.
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Flushes the active sink.
     */
    void flush();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets a callback invoked (on the logging thread) when a sink write fails.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    // --- Runtime Path ---
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    template <typename... Args> void trace_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_TRACE, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void debug_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_DEBUG, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void info_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_INFO, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void warn_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_WARNING, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void error_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_ERROR, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void system_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_SYSTEM, fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    // Writes a formatted body to the active sink.
    void write_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            write_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer mb;
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
            write_log(lvl, std::move(mb));
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    try
    {
        fmt::memory_buffer mb;
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
        write_log(lvl, std::move(mb));
    }
    catch (const std::exception &ex)
    {
        fmt::memory_buffer mb;
        fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
        write_log(lvl, std::move(mb));
    }
}

} // namespace checkedval::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::checkedval::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::checkedval::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::checkedval::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::checkedval::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::checkedval::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::checkedval::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE_RT(fmt, ...)                                                                  \
    ::checkedval::utils::Logger::instance().trace_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG_RT(fmt, ...)                                                                  \
    ::checkedval::utils::Logger::instance().debug_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::checkedval::utils::Logger::instance().info_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...)                                                                   \
    ::checkedval::utils::Logger::instance().warn_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...)                                                                  \
    ::checkedval::utils::Logger::instance().error_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM_RT(fmt, ...)                                                                 \
    ::checkedval::utils::Logger::instance().system_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
