// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for media_trans_system
 *
 * Central entry point for the system integration flags used by the media
 * transfer engine. Include this header to get access to all KCENON_WITH_*
 * and MEDIA_TRANSFER_USE_* macros.
 *
 * Usage:
 * @code
 * #include <kcenon/media_transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto lane = std::make_unique<thread_system_task_lane>("lane-0");
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define MEDIA_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define MEDIA_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (single-worker pools backing download lanes)
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

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in media_transfer
 *
 * logger_system is only usable together with common_system, which provides
 * the result types its builder returns.
 */
#ifndef MEDIA_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define MEDIA_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define MEDIA_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef MEDIA_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Media Transfer System Feature Summary ===")

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

#if MEDIA_TRANSFER_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("=============================================")

#endif // MEDIA_TRANS_PRINT_FEATURE_SUMMARY
