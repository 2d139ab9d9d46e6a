// api.h - DLL export/import macros for ooxml_fidelity

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the ooxml_fidelity library.
///
/// - Building ooxml_fidelity as a SHARED library:
///   CMake defines OOXML_FIDELITY_EXPORTS (private) and OOXML_FIDELITY_SHARED (public),
///   so everything marked OOXML_FIDELITY_API is exported.
/// - Consuming the SHARED library: OOXML_FIDELITY_SHARED propagates from the target
///   and the same declarations become imports.
/// - STATIC library: OOXML_FIDELITY_API expands to nothing.

#if defined(_WIN32) || defined(_WIN64)
    #ifdef OOXML_FIDELITY_SHARED
        #ifdef OOXML_FIDELITY_EXPORTS
            #define OOXML_FIDELITY_API __declspec(dllexport)
        #else
            #define OOXML_FIDELITY_API __declspec(dllimport)
        #endif
    #else
        #define OOXML_FIDELITY_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(OOXML_FIDELITY_SHARED) && defined(OOXML_FIDELITY_EXPORTS)
        #define OOXML_FIDELITY_API __attribute__((visibility("default")))
    #else
        #define OOXML_FIDELITY_API
    #endif
#else
    #define OOXML_FIDELITY_API
#endif
