// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Feature flags for resilient_transfer
 *
 * Feature categories:
 * - RESILIENT_TRANS_HAS_* : Local feature availability
 * - KCENON_WITH_*         : System integration flags (inherited from common_system)
 */

#pragma once

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define RESILIENT_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define RESILIENT_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

/**
 * @brief Windows disk-space probing (GetDiskFreeSpaceExW) instead of statvfs
 */
#ifndef RESILIENT_TRANS_HAS_WIN32_DISK_API
    #if defined(_WIN32)
        #define RESILIENT_TRANS_HAS_WIN32_DISK_API 1
    #else
        #define RESILIENT_TRANS_HAS_WIN32_DISK_API 0
    #endif
#endif

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pools)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

#ifndef BUILD_WITH_COMMON_SYSTEM
    #if KCENON_WITH_COMMON_SYSTEM
        #define BUILD_WITH_COMMON_SYSTEM 1
    #endif
#endif

#ifndef BUILD_WITH_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM
        #define BUILD_WITH_LOGGER_SYSTEM 1
    #endif
#endif

#ifdef RESILIENT_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Resilient Transfer Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if RESILIENT_TRANS_HAS_WIN32_DISK_API
    #pragma message("  disk space query: Win32")
#else
    #pragma message("  disk space query: statvfs")
#endif

#endif // RESILIENT_TRANS_PRINT_FEATURE_SUMMARY
