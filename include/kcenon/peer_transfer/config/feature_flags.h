// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for peer_trans_system
 *
 * Central entry point for feature detection in the peer_trans_system
 * library. Include this header to get access to the PEER_TRANS_HAS_* and
 * KCENON_WITH_* feature macros.
 *
 * Feature categories:
 * - PEER_TRANS_HAS_*     : Local feature availability (WebRTC backend)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/peer_transfer/config/feature_flags.h>
 *
 * #if PEER_TRANS_HAS_DATACHANNEL
 *     auto factory = std::make_shared<datachannel_factory>(io);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define PEER_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define PEER_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Peer Transfer System Feature Flags
//==============================================================================

/**
 * @brief WebRTC backend (libdatachannel)
 *
 * When enabled, datachannel_factory creates real peer connections.
 * Set by CMake when LibDataChannel is found and PEER_TRANS_ENABLE_DATACHANNEL
 * is ON.
 */
#ifndef PEER_TRANS_HAS_DATACHANNEL
    #if defined(PEER_TRANS_ENABLE_DATACHANNEL)
        #define PEER_TRANS_HAS_DATACHANNEL 1
    #else
        #define PEER_TRANS_HAS_DATACHANNEL 0
    #endif
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

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief Whether log output is routed to logger_system
 *
 * logger_system needs common_system; core/logging.h applies the same rule.
 */
#ifndef PEER_TRANS_HAS_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define PEER_TRANS_HAS_LOGGER_SYSTEM 1
    #else
        #define PEER_TRANS_HAS_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef PEER_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Peer Transfer System Feature Summary ===")

#if PEER_TRANS_HAS_DATACHANNEL
    #pragma message("  WebRTC backend: Enabled")
#else
    #pragma message("  WebRTC backend: Disabled (loopback only)")
#endif

#if PEER_TRANS_HAS_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled (console output)")
#endif

#endif // PEER_TRANS_PRINT_FEATURE_SUMMARY
