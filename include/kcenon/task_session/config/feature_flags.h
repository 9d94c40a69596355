// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for task_session
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - TASK_SESSION_HAS_*   : Local feature availability (HTTP transport)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/task_session/config/feature_flags.h>
 *
 * #if TASK_SESSION_HAS_HTTP_TRANSPORT
 *     auto session = http_transport_session::create(config);
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
#define TASK_SESSION_HAS_COMMON_FEATURE_FLAGS 1
#else
#define TASK_SESSION_HAS_COMMON_FEATURE_FLAGS 0
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

// thread_system integration (worker pool for operation queue and transport)
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

// network_system integration (HTTP client for the bundled transport)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Task Session Feature Flags
//==============================================================================

/**
 * @brief HTTP transport support
 *
 * When network_system is available, http_transport_session performs real
 * requests. Otherwise every task it creates completes with
 * error_code::transport_unavailable.
 */
#ifndef TASK_SESSION_HAS_HTTP_TRANSPORT
    #if KCENON_WITH_NETWORK_SYSTEM
        #define TASK_SESSION_HAS_HTTP_TRANSPORT 1
    #else
        #define TASK_SESSION_HAS_HTTP_TRANSPORT 0
    #endif
#endif

/**
 * @brief Unified flag for logger_system usage in task_session
 */
#ifndef TASK_SESSION_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define TASK_SESSION_USE_LOGGER_SYSTEM 1
    #elif defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
        #define TASK_SESSION_USE_LOGGER_SYSTEM 1
    #else
        #define TASK_SESSION_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef TASK_SESSION_PRINT_FEATURE_SUMMARY

#pragma message("=== Task Session Feature Summary ===")

#if TASK_SESSION_HAS_HTTP_TRANSPORT
    #pragma message("  HTTP transport: Enabled")
#else
    #pragma message("  HTTP transport: Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if TASK_SESSION_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("====================================")

#endif // TASK_SESSION_PRINT_FEATURE_SUMMARY
