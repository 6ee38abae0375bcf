/// @file log.h
/// @brief Diagnostic logging helpers.
///
/// All output goes to std::cerr and is compiled out unless
/// DRIFTGATE_VERBOSE_LOG is non-zero (see driftgate_config.h). Each line is
/// tagged with the reporting function and the caller's source location:
///
///   [Value::at] key 'segments' not found or type mismatch (called from gate.cpp:42)

#pragma once

#include "driftgate_config.h"

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace driftgate {

namespace detail {

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DRIFTGATE_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DRIFTGATE_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

/// One line per terminal gate state, e.g.
///   [PolicyGate::enforce] TICK-1 -> blocked (enforcement disabled)
inline void log_decision(
    std::string_view func,
    std::string_view reference,
    std::string_view outcome,
    std::string_view reason) noexcept
{
#if DRIFTGATE_VERBOSE_LOG
    std::cerr << "[" << func << "] " << reference << " -> " << outcome;
    if (!reason.empty()) {
        std::cerr << " (" << reason << ")";
    }
    std::cerr << "\n";
#else
    (void)func;
    (void)reference;
    (void)outcome;
    (void)reason;
#endif
}

} // namespace detail

} // namespace driftgate
