// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ooxml_fidelity_config.h
/// @brief Centralized configuration for ooxml_fidelity and its dependencies
///
/// Compile-time settings for the third-party libraries used by ooxml_fidelity:
///   - immer: Immutable data structures (document arena, records, profile registry)
///   - lager: Store for the tolerance profile registry
///   - zug: Transducers for filtering pipelines
///   - boost: String algorithms
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All ooxml_fidelity public headers already include this file.
///
/// Unlike a single-threaded editor setup, immer thread safety stays ENABLED here:
/// per-document analyses run on independent worker threads and their results
/// (which share structure through immer containers) are handed back to the
/// aggregating thread.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(OOXML_FIDELITY_CONFIGURED)
#error "immer headers were included before ooxml_fidelity/ooxml_fidelity_config.h. " \
       "Please include ooxml_fidelity headers before any direct immer includes."
#endif

#define OOXML_FIDELITY_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#error "ooxml_fidelity shares immer containers across worker threads; " \
       "IMMER_NO_THREAD_SAFETY must not be enabled."
#endif

/// @brief Disable tagged node assertions (smaller nodes, no assertion overhead)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

// ============================================================
// Lager Settings
// ============================================================

/// @brief The registry store has no dependencies (no effects, no context deps)
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Settings
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Boost Settings
// ============================================================

/// @brief Only header-only Boost libraries are used; disable MSVC auto-linking
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When OOXML_FIDELITY_VERBOSE_LOG is 1, parse failures, rejected profile
// records and failed aggregation inputs are reported on stderr.
// Disabled in release builds by default.
// ============================================================

#ifndef OOXML_FIDELITY_VERBOSE_LOG
#  if defined(NDEBUG)
#    define OOXML_FIDELITY_VERBOSE_LOG 0
#  else
#    define OOXML_FIDELITY_VERBOSE_LOG 1
#  endif
#endif
