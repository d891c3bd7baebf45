/**
 * @file debug_info.cpp
 * @brief In-process stack trace printing for docgate::debug::print_stack_trace().
 *
 * Only the POSIX path resolves symbols (dladdr + __cxa_demangle). Other platforms
 * print a short notice instead.
 */
#include "dgt_base.hpp"

#if defined(DOCGATE_IS_POSIX)
#include <cstdint>
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#endif

namespace docgate::debug
{

namespace
{

// Formatting helper that never throws; output goes straight to stderr.
template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[stacktrace] format error: %s\n", e.what());
    }
}

} // namespace

void print_stack_trace() noexcept
{
#if defined(DOCGATE_IS_POSIX)
    constexpr int kMaxFrames = 128;
    void *callstack[kMaxFrames];
    const int nframes = backtrace(callstack, kMaxFrames);
    if (nframes <= 0)
    {
        safe_format_to_stderr("  [No stack frames available]\n");
        return;
    }

    char **symbols = backtrace_symbols(callstack, nframes);
    auto free_symbols = basics::make_scope_guard([&symbols]() { std::free(symbols); });

    safe_format_to_stderr("Stack Trace (most recent call first):\n");
    for (int i = 0; i < nframes; ++i)
    {
        const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
        safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

        Dl_info dlinfo;
        if (dladdr(callstack[i], &dlinfo) != 0 && dlinfo.dli_sname != nullptr)
        {
            int status = 0;
            char *dem = abi::__cxa_demangle(dlinfo.dli_sname, nullptr, nullptr, &status);
            const char *name = (status == 0 && dem != nullptr) ? dem : dlinfo.dli_sname;
            const auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
            if (saddr != 0)
                safe_format_to_stderr("{} + {:#x}\n", name,
                                      static_cast<unsigned long long>(addr - saddr));
            else
                safe_format_to_stderr("{}\n", name);
            std::free(dem);
        }
        else if (symbols != nullptr && symbols[i] != nullptr)
        {
            safe_format_to_stderr("{}\n", symbols[i]);
        }
        else
        {
            safe_format_to_stderr("[unknown]\n");
        }
    }
    std::fflush(stderr);
#else
    safe_format_to_stderr("  [Stack trace not supported on this platform]\n");
#endif
}

} // namespace docgate::debug
