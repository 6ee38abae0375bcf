/// @file driftgate_config.h
/// @brief Compile-time configuration for driftgate and the immer library.
///
/// Must be included before any immer header so that every translation unit
/// sees the same immer settings. All public driftgate headers include it
/// first; code that only includes driftgate headers needs nothing else.
///
/// driftgate trees are built and diffed from many request threads at once,
/// and immer's heap keeps a process-wide free list, so the
/// IMMER_NO_THREAD_SAFETY switch is pinned to 0.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DRIFTGATE_CONFIGURED)
#error "immer headers were included before driftgate/driftgate_config.h. " \
       "Please include driftgate headers before any direct immer includes."
#endif

#define DRIFTGATE_CONFIGURED 1

// ============================================================
// Immer settings
// ============================================================

/// Atomic refcounts and a locked free list
#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#error "driftgate requires immer's thread-safe memory policy (IMMER_NO_THREAD_SAFETY=0)"
#endif
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// No type tags in nodes
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Logging
// ============================================================

/// Diagnostic lines on std::cerr (see log.h). On in debug builds,
/// off with NDEBUG. Override with -DDRIFTGATE_VERBOSE_LOG=0/1.
#ifndef DRIFTGATE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DRIFTGATE_VERBOSE_LOG 0
#  else
#    define DRIFTGATE_VERBOSE_LOG 1
#  endif
#endif

#ifdef DRIFTGATE_CONFIG_VERBOSE
#if DRIFTGATE_VERBOSE_LOG
#pragma message("driftgate: verbose logging ENABLED")
#else
#pragma message("driftgate: verbose logging DISABLED")
#endif
#endif // DRIFTGATE_CONFIG_VERBOSE
