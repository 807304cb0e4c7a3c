// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Integration flags for resumable_upload
 *
 * RESUMABLE_UPLOAD_WITH_* flags select optional kcenon ecosystem backends.
 * They are normally set by CMake (options of the same name); every flag
 * defaults to 0 so the library builds with its own fallbacks.
 *
 * @code
 * #include <resumable/upload/config/feature_flags.h>
 *
 * #if RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM
 *     auto pool = thread_system_upload_adapter::create_default(4);
 * #endif
 * @endcode
 */

#pragma once

/**
 * @brief thread_system integration
 *
 * When enabled, upload workers run on kcenon::thread::thread_pool instead
 * of the built-in bounded_upload_pool.
 */
#ifndef RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM 1
    #else
        #define RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM 0
    #endif
#endif

/**
 * @brief logger_system integration
 *
 * Requires common_system as well. When enabled, upload_logger forwards to
 * an asynchronous kcenon::logger::logger instead of stderr.
 */
#ifndef RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
        #define RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM 1
    #else
        #define RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM 0
    #endif
#endif
