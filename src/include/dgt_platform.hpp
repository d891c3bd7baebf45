#pragma once
/**
 * @file dgt_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (DOCGATE_PLATFORM_LINUX, DOCGATE_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || defined(_WIN64)
#define DOCGATE_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define DOCGATE_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD) || defined(__FreeBSD__)
#define DOCGATE_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX) || defined(__linux__)
#define DOCGATE_PLATFORM_LINUX 1
#else
#define DOCGATE_PLATFORM_UNKNOWN 1
#endif

// Convenience booleans for source code usage:
#if defined(DOCGATE_PLATFORM_WIN64)
#define DOCGATE_IS_WINDOWS 1
#elif defined(DOCGATE_PLATFORM_APPLE) || defined(DOCGATE_PLATFORM_FREEBSD) ||                      \
    defined(DOCGATE_PLATFORM_LINUX)
#define DOCGATE_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "docgate_utils_export.h"

namespace docgate::platform
{

/**
 * @brief Gets the current process ID.
 * @return The process ID as a 64-bit unsigned integer.
 */
DOCGATE_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Gets a platform-native thread ID.
 * @details Suitable for logging and debugging. Uses the most efficient OS-specific
 *          call available (gettid on Linux, pthread_threadid_np on macOS).
 */
DOCGATE_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Reads an environment variable.
 * @return The value, or an empty string if the variable is not set.
 */
DOCGATE_UTILS_EXPORT std::string get_env(const char *name);

} // namespace docgate::platform
