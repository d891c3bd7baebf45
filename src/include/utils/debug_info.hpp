/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        development-time precondition checks and debug messaging.
 *
 * All helpers use `fmt` for compile-time format string checks and `std::source_location`
 * for automatic source code location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "docgate_utils_export.h"
#include "utils/format_tools.hpp"

namespace docgate::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * On POSIX systems, uses `backtrace` / `backtrace_symbols` and demangles C++ symbols.
 * Errors during capture are reported to `stderr`; never throws.
 */
DOCGATE_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable errors and programmer misuse. Formats the message,
 * prints it with the source location, prints a stack trace and calls `std::abort()`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    const auto where = fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()),
                                   loc.line(), loc.function_name());
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", where, body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   where, fmt::string_view(fmt_str), e.what());
    }
    catch (...)
    {
        fmt::print(stderr, "[PANIC] {} -- FATAL UNKNOWN EXCEPTION DURING PANIC: fmt_str['{}']\n",
                   where, fmt::string_view(fmt_str));
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (...)
    {
        fmt::print(stderr, "[DBG]  FATAL EXCEPTION DURING DEBUG_MSG: fmt_str['{}']\n",
                   fmt::string_view(fmt_str));
        std::fflush(stderr);
    }
}

} // namespace docgate::debug

// ---------------- thin macros for convenience --------------

/**
 * @brief Fatal error with automatic source location and a checked format string.
 * @see docgate::debug::panic
 */
#ifndef DGT_PANIC
#define DGT_PANIC(fmt, ...)                                                                        \
    ::docgate::debug::panic(std::source_location::current(),                                       \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Development-time precondition check.
 *
 * In debug builds a violated condition panics (message + stack trace + abort).
 * With NDEBUG the check compiles away; behavior after misuse is then unspecified.
 */
#ifndef DGT_PRECONDITION
#if !defined(NDEBUG)
#define DGT_PRECONDITION(cond, fmt, ...)                                                           \
    do                                                                                             \
    {                                                                                              \
        if (!(cond))                                                                               \
        {                                                                                          \
            DGT_PANIC("Precondition '" #cond "' violated: " fmt __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                                          \
    } while (0)
#else
#define DGT_PRECONDITION(cond, fmt, ...)                                                           \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

/**
 * @brief Debug message to stderr, compiled in only with DOCGATE_ENABLE_DEBUG_MESSAGES.
 * @see docgate::debug::debug_msg
 */
#ifndef DGT_DEBUG
#if defined(DOCGATE_ENABLE_DEBUG_MESSAGES)
#define DGT_DEBUG(fmt, ...) ::docgate::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define DGT_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
