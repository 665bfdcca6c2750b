/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the synchronous, thread-safe logger.
 ******************************************************************************/

#include <atomic>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include "ckv_base.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace checkedval::utils
{

namespace
{
constexpr const char *kLogLevelEnvVar = "CHECKEDVAL_LOG_LEVEL";
constexpr Logger::Level kDefaultLevel = Logger::Level::L_WARNING;

Logger::Level initial_level_from_env() noexcept
{
    try
    {
        const char *raw = std::getenv(kLogLevelEnvVar);
        if (raw == nullptr)
            return kDefaultLevel;
        if (auto lvl = Logger::level_from_string(raw))
            return *lvl;
        CKV_DEBUG("ignoring unknown {} value '{}'", kLogLevelEnvVar, raw);
    }
    catch (const std::exception &)
    {
        // fall through to the default
    }
    return kDefaultLevel;
}
} // anonymous namespace

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()), level_(initial_level_from_env()) {}

    void report_write_error(const std::string &what) noexcept;

    std::mutex m_sink_mutex; // guards sink_ and error_callback_
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    std::atomic<Logger::Level> level_;
};

void Logger::Impl::report_write_error(const std::string &what) noexcept
{
    // Called with m_sink_mutex held.
    if (!error_callback_)
        return;
    try
    {
        error_callback_(what);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[CKV] write error callback threw: %s\n", e.what());
    }
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Function-local static initialization is thread-safe.
    static Logger instance;
    return instance;
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name)
{
    const auto token = format_tools::normalized_token(name);
    if (token == "trace")
        return Level::L_TRACE;
    if (token == "debug")
        return Level::L_DEBUG;
    if (token == "info")
        return Level::L_INFO;
    if (token == "warn" || token == "warning")
        return Level::L_WARNING;
    if (token == "error")
        return Level::L_ERROR;
    if (token == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::set_console()
{
    std::lock_guard<std::mutex> lock(pImpl->m_sink_mutex);
    if (pImpl->sink_)
        pImpl->sink_->flush();
    pImpl->sink_ = std::make_unique<ConsoleSink>();
    return true;
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    std::unique_ptr<Sink> next;
    try
    {
        next = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::runtime_error &e)
    {
        std::lock_guard<std::mutex> lock(pImpl->m_sink_mutex);
        pImpl->report_write_error(e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(pImpl->m_sink_mutex);
    if (pImpl->sink_)
        pImpl->sink_->flush();
    pImpl->sink_ = std::move(next);
    return true;
}

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(pImpl->m_sink_mutex);
    if (pImpl->sink_)
        pImpl->sink_->flush();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> lock(pImpl->m_sink_mutex);
    pImpl->error_callback_ = std::move(cb);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return pImpl &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::write_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        LogMessage msg{.timestamp = std::chrono::system_clock::now(),
                       .process_id = platform::get_pid(),
                       .thread_id = platform::get_native_thread_id(),
                       .level = static_cast<int>(lvl),
                       .body = std::move(body)};

        std::lock_guard<std::mutex> lock(pImpl->m_sink_mutex);
        if (!pImpl->sink_)
            return;
        try
        {
            pImpl->sink_->write(msg);
            if (lvl >= Level::L_ERROR)
                pImpl->sink_->flush();
        }
        catch (const std::exception &e)
        {
            // Cannot log here without recursing; hand it to the callback instead.
            pImpl->report_write_error(fmt::format("{} sink write failed: {}",
                                                  pImpl->sink_->description(), e.what()));
        }
    }
    catch (const std::exception &)
    {
        // Formatting the envelope failed (allocation); the message is dropped.
    }
}

} // namespace checkedval::utils
