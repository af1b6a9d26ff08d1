// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief kcenon ecosystem integration switches for upload_pipeline
 *
 * Each KCENON_WITH_* flag follows the BUILD_WITH_* definition that the
 * matching CMake option adds, and is 0 otherwise. A flag defined on the
 * compiler command line wins.
 *
 * | Flag                       | Used by                         |
 * |----------------------------|---------------------------------|
 * | KCENON_WITH_THREAD_SYSTEM  | adapters/runner_pool            |
 * | KCENON_WITH_LOGGER_SYSTEM  | core/logging (with common)      |
 * | KCENON_WITH_NETWORK_SYSTEM | client/http_chunk_transport     |
 */

#pragma once

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
#endif

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

// logger_system sits on common_system; upload logs route to it only when
// both are present.
#ifndef UPLOAD_PIPELINE_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define UPLOAD_PIPELINE_USE_LOGGER_SYSTEM 1
    #else
        #define UPLOAD_PIPELINE_USE_LOGGER_SYSTEM 0
    #endif
#endif
