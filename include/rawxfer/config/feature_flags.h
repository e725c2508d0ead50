// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Integration flags for the optional kcenon ecosystem modules
 *
 * KCENON_WITH_* flags are set from the BUILD_WITH_* compile definitions the
 * build files add when a module is found. They may also come from
 * common_system's own feature_flags.h.
 *
 * @code
 * #include <rawxfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool = std::make_unique<thread_system_transfer_adapter>(workers);
 * #endif
 * @endcode
 */

#pragma once

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define RAWXFER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define RAWXFER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for the shared-pool dispatcher)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (log sink)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief logger_system is only used together with common_system
 */
#ifndef RAWXFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define RAWXFER_USE_LOGGER_SYSTEM 1
    #else
        #define RAWXFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

#ifdef RAWXFER_PRINT_FEATURE_SUMMARY

#pragma message("=== rawxfer Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

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

#endif // RAWXFER_PRINT_FEATURE_SUMMARY
