#pragma once
/**
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logger.
 *
 * Application threads format a message and enqueue it; a single worker thread
 * owns the active sink and writes messages in enqueue order. Sink changes,
 * flushes and callback registration are commands on the same queue, so they
 * take effect in order with the messages around them.
 *
 * Lifecycle: `Logger::instance().start()` launches the worker, `shutdown()`
 * drains the queue and joins it. Messages logged while the logger is not
 * running are dropped.
 *
 * Use the LOGGER_* macros; their format strings are checked at compile time.
 */
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "docgate_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (512u)
#endif

namespace docgate::utils
{

class DOCGATE_UTILS_EXPORT Logger
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
     * @brief Starts the worker thread. The console sink is active until another is set.
     *        Calling start() on a running logger does nothing; a logger that was shut
     *        down can be started again.
     */
    void start();

    /**
     * @brief Drains every queued message, flushes the sink and joins the worker.
     *        Idempotent.
     */
    void shutdown();

    /// @brief True between start() and shutdown().
    bool is_running() const noexcept;

    // --- Sinks ---
    // Sink changes are queued and applied by the worker; the calls block until then.

    /// @brief Switch logging to the console (stderr).
    bool set_console();

    /**
     * @brief Switch logging to a file (appending; parent directories are created).
     * @return false if the logger is not running or the file cannot be opened. The
     *         failure is also reported through the write error callback.
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Blocks until every message queued before this call has been written
     *        and the sink flushed.
     */
    void flush();

    // --- Configuration ---
    void set_level(Level lvl) noexcept;
    Level level() const noexcept;

    /**
     * @brief Sets a callback invoked (from the worker thread) when a sink fails to
     *        open, write or flush.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /// @brief Parses "trace|debug|info|warn|warning|error|system" (case-sensitive).
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

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

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    bool should_log(Level lvl) const noexcept;
    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    void enqueue_log(Level lvl, std::string_view body) noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

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
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string_view(ex.what()));
        }
    }
}

} // namespace docgate::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::docgate::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::docgate::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::docgate::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::docgate::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::docgate::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::docgate::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
