/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the process / thread identity helpers
 *        declared in `docgate::platform`.
 */
#include "dgt_platform.hpp"

#include <cstdlib>
#include <functional>
#include <thread>

#if defined(DOCGATE_IS_POSIX)
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(DOCGATE_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace docgate::platform
{

uint64_t get_pid()
{
#if defined(DOCGATE_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(DOCGATE_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(DOCGATE_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(DOCGATE_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other POSIX or unknown systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_env(const char *name)
{
    if (name == nullptr)
        return {};
    const char *val = std::getenv(name);
    return (val != nullptr) ? std::string(val) : std::string{};
}

} // namespace docgate::platform
