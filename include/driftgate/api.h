// api.h - Symbol visibility macros for driftgate

#pragma once

/// @file api.h
/// @brief Export/import decoration for the driftgate library.
///
/// - Building driftgate as a SHARED library: CMake defines DRIFTGATE_EXPORTS
///   (private) and DRIFTGATE_SHARED (public), so DRIFTGATE_API exports symbols.
/// - Consuming the shared library: DRIFTGATE_SHARED alone, symbols are imported.
/// - Static builds: DRIFTGATE_API expands to nothing.
///
/// @code
/// class DRIFTGATE_API PolicyGate { ... };
/// DRIFTGATE_API Patch make_patch(const Value&, const Value&);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DRIFTGATE_SHARED
        #ifdef DRIFTGATE_EXPORTS
            #define DRIFTGATE_API __declspec(dllexport)
        #else
            #define DRIFTGATE_API __declspec(dllimport)
        #endif
    #else
        #define DRIFTGATE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DRIFTGATE_SHARED) && defined(DRIFTGATE_EXPORTS)
        #define DRIFTGATE_API __attribute__((visibility("default")))
    #else
        #define DRIFTGATE_API
    #endif
#else
    #define DRIFTGATE_API
#endif
