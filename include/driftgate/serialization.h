/// @file serialization.h
/// @brief JSON text conversion for Value.
///
/// Desired and current state documents, patch documents and ticket
/// responses all arrive as JSON text.
///
/// @code
///   std::string error;
///   Value desired = from_json(text, &error);
///   if (!error.empty()) { ... }
///   std::cout << to_json(desired, false);
/// @endcode
///
/// Mapping keys are written in lexicographic order so that equal values
/// always serialize to identical text, whatever immer's hash order is.

#pragma once

#include "api.h"
#include "value.h"

#include <string>

namespace driftgate {

/// Convert Value to JSON text
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return JSON string representation
DRIFTGATE_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON text to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
///
/// Integers that fit in int64_t are stored as int64_t, everything else
/// numeric as double. Trailing non-whitespace input is an error.
DRIFTGATE_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace driftgate
