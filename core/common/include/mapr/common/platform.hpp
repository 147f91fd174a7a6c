#pragma once

/**
 * @file platform.hpp
 * @brief Compiler, OS and language feature detection for mapr
 *
 * This header provides:
 * - Compile-time compiler and platform detection
 * - Language feature detection used by the error and logging layers
 * - Portable attribute macros
 * - A handful of runtime environment queries
 */

#include <cstdint>
#include <string>
#include <string_view>

// ============================================================================
// COMPILER DETECTION
// ============================================================================

#if defined(__clang__)
    #define MAPR_COMPILER_CLANG 1
    #define MAPR_COMPILER_NAME "Clang"
#elif defined(__GNUC__) || defined(__GNUG__)
    #define MAPR_COMPILER_GCC 1
    #define MAPR_COMPILER_NAME "GCC"
#elif defined(_MSC_VER)
    #define MAPR_COMPILER_MSVC 1
    #define MAPR_COMPILER_NAME "MSVC"
#else
    #define MAPR_COMPILER_UNKNOWN 1
    #define MAPR_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// OPERATING SYSTEM DETECTION
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define MAPR_OS_WINDOWS 1
    #define MAPR_OS_NAME "Windows"
#elif defined(__APPLE__) && defined(__MACH__)
    #define MAPR_OS_MACOS 1
    #define MAPR_OS_NAME "macOS"
#elif defined(__linux__)
    #define MAPR_OS_LINUX 1
    #define MAPR_OS_NAME "Linux"
#elif defined(__FreeBSD__)
    #define MAPR_OS_FREEBSD 1
    #define MAPR_OS_NAME "FreeBSD"
#elif defined(__unix__)
    #define MAPR_OS_UNIX 1
    #define MAPR_OS_NAME "Unix"
#else
    #define MAPR_OS_UNKNOWN 1
    #define MAPR_OS_NAME "Unknown"
#endif

#if defined(MAPR_OS_LINUX) || defined(MAPR_OS_MACOS) || defined(MAPR_OS_FREEBSD) || \
    defined(MAPR_OS_UNIX)
    #define MAPR_OS_POSIX 1
#endif

// ============================================================================
// BUILD TYPE DETECTION
// ============================================================================

#if defined(NDEBUG) || defined(MAPR_RELEASE)
    #define MAPR_BUILD_RELEASE 1
    #define MAPR_BUILD_TYPE "Release"
#else
    #define MAPR_BUILD_DEBUG 1
    #define MAPR_BUILD_TYPE "Debug"
#endif

// ============================================================================
// FEATURE DETECTION
// ============================================================================

#if __cplusplus >= 202302L
    #define MAPR_CPP_VERSION 23
#elif __cplusplus >= 202002L
    #define MAPR_CPP_VERSION 20
#elif __cplusplus >= 201703L
    #define MAPR_CPP_VERSION 17
#else
    #define MAPR_CPP_VERSION 0
#endif

// Source location (C++20)
#if defined(__cpp_lib_source_location) || (MAPR_CPP_VERSION >= 20 && !defined(MAPR_COMPILER_MSVC))
    #define MAPR_HAS_SOURCE_LOCATION 1
#endif

// Itanium ABI demangling
#if defined(MAPR_COMPILER_GCC) || defined(MAPR_COMPILER_CLANG)
    #define MAPR_HAS_CXXABI_DEMANGLE 1
#endif

// ============================================================================
// COMPILER ATTRIBUTES
// ============================================================================

#if defined(MAPR_COMPILER_GCC) || defined(MAPR_COMPILER_CLANG)
    #define MAPR_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define MAPR_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define MAPR_LIKELY(x)   (x)
    #define MAPR_UNLIKELY(x) (x)
#endif

#if defined(MAPR_COMPILER_MSVC)
    #define MAPR_FUNCTION_SIGNATURE __FUNCSIG__
#elif defined(MAPR_COMPILER_GCC) || defined(MAPR_COMPILER_CLANG)
    #define MAPR_FUNCTION_SIGNATURE __PRETTY_FUNCTION__
#else
    #define MAPR_FUNCTION_SIGNATURE __func__
#endif

#define MAPR_NODISCARD [[nodiscard]]
#define MAPR_MAYBE_UNUSED [[maybe_unused]]

// Export/Import for shared libraries
#if defined(MAPR_OS_WINDOWS)
    #if defined(MAPR_BUILDING_SHARED)
        #define MAPR_API __declspec(dllexport)
    #elif defined(MAPR_USING_SHARED)
        #define MAPR_API __declspec(dllimport)
    #else
        #define MAPR_API
    #endif
#elif defined(MAPR_COMPILER_GCC) || defined(MAPR_COMPILER_CLANG)
    #if defined(MAPR_BUILDING_SHARED)
        #define MAPR_API __attribute__((visibility("default")))
    #else
        #define MAPR_API
    #endif
#else
    #define MAPR_API
#endif

namespace mapr::common::platform {

// ============================================================================
// Runtime Environment Queries
// ============================================================================

/**
 * @brief Get current process ID
 */
MAPR_API uint64_t get_process_id() noexcept;

/**
 * @brief Get current thread ID
 */
MAPR_API uint64_t get_thread_id() noexcept;

/**
 * @brief Get environment variable value
 * @return Empty string if not found
 */
MAPR_API std::string get_env(std::string_view name);

/**
 * @brief Set environment variable
 * @return true on success
 */
MAPR_API bool set_env(std::string_view name, std::string_view value);

/**
 * @brief Remove environment variable
 * @return true on success
 */
MAPR_API bool unset_env(std::string_view name);

} // namespace mapr::common::platform
