#pragma once
/**
 * @file hbl_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (HUBLINK_PLATFORM_WIN64, HUBLINK_IS_POSIX, etc.) should include
 * this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_APPLE) && !defined(PLATFORM_LINUX) &&          \
                                !defined(PLATFORM_FREEBSD) && defined(_WIN64))
#define HUBLINK_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define HUBLINK_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD) || defined(__FreeBSD__)
#define HUBLINK_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX) || defined(__linux__)
#define HUBLINK_PLATFORM_LINUX 1

#else
#define HUBLINK_PLATFORM_UNKNOWN 1
#endif

// Convenience booleans for source code usage:
#if defined(HUBLINK_PLATFORM_WIN64)
#define HUBLINK_IS_WINDOWS 1
#elif defined(HUBLINK_PLATFORM_APPLE) || defined(HUBLINK_PLATFORM_FREEBSD) ||                      \
    defined(HUBLINK_PLATFORM_LINUX)
#define HUBLINK_IS_POSIX 1
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

#include "hublink_core_export.h"

namespace hublink::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
HUBLINK_CORE_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
HUBLINK_CORE_EXPORT uint64_t get_pid();

/**
 * @brief Returns the directory containing the running executable.
 * @return The absolute directory, or an empty path if it cannot be determined.
 */
HUBLINK_CORE_EXPORT std::filesystem::path get_executable_dir() noexcept;

/**
 * @brief Returns the current user's home directory ($HOME / %USERPROFILE%).
 * @return The home directory, or the system temp directory when neither is set.
 */
HUBLINK_CORE_EXPORT std::filesystem::path get_home_dir() noexcept;

} // namespace hublink::platform
