// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Feature flags for bulk_download
 *
 * Central entry point for integration flags. Values come from CMake compile
 * definitions; this header only supplies defaults for standalone use.
 *
 * Usage:
 * @code
 * #include <kcenon/bulk_download/config/feature_flags.h>
 *
 * #if BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
 *     logger_->log(level, message);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// System Integration Flags
//==============================================================================

// logger_system integration (asynchronous structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief Unified flag for logger_system usage in bulk_download
 *
 * Set when the library is configured with BULK_DOWNLOAD_WITH_LOGGER_SYSTEM=ON.
 * Otherwise log records go to stderr.
 */
#ifndef BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM
        #define BULK_DOWNLOAD_HAS_LOGGER_SYSTEM 1
    #else
        #define BULK_DOWNLOAD_HAS_LOGGER_SYSTEM 0
    #endif
#endif

// thread_system integration (job-based thread pool for download workers)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

/**
 * @brief Unified flag for thread_system usage in bulk_download
 *
 * Set when the library is configured with BULK_DOWNLOAD_WITH_THREAD_SYSTEM=ON.
 * Otherwise download jobs run on std::async tasks.
 */
#ifndef BULK_DOWNLOAD_HAS_THREAD_SYSTEM
    #if KCENON_WITH_THREAD_SYSTEM
        #define BULK_DOWNLOAD_HAS_THREAD_SYSTEM 1
    #else
        #define BULK_DOWNLOAD_HAS_THREAD_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef BULK_DOWNLOAD_PRINT_FEATURE_SUMMARY

#pragma message("=== Bulk Download Feature Summary ===")

#if BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled (stderr logging)")
#endif

#if BULK_DOWNLOAD_HAS_THREAD_SYSTEM
    #pragma message("  thread_system: Enabled")
#else
    #pragma message("  thread_system: Disabled (std::async jobs)")
#endif

#pragma message("=====================================")

#endif // BULK_DOWNLOAD_PRINT_FEATURE_SUMMARY
