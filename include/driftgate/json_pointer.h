/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) style paths for patch operations.
///
///   "/apps/crm~1web/ports"  <->  ["apps", "crm/web", "ports"]
///
/// - Segments are joined with "/"
/// - Escape sequences: "~" -> "~0", "/" -> "~1"
/// - The root path encodes as "/" (not the RFC's empty string), which is
///   the form patch documents carry for whole-document replacement
/// - Numeric segments parse as sequence indices

#pragma once

#include "api.h"
#include "value.h"

#include <string>
#include <string_view>

namespace driftgate {

/// Escape a single key segment: "~" -> "~0", "/" -> "~1"
[[nodiscard]] DRIFTGATE_API std::string escape_segment(std::string_view segment);

// Convert Path to its pointer string
// Examples:
//   []                   -> "/"
//   ["a", "x"]           -> "/a/x"
//   ["users", 0, "name"] -> "/users/0/name"
//   ["a/b", "c~d"]       -> "/a~1b/c~0d"
[[nodiscard]] DRIFTGATE_API std::string path_to_pointer(const Path& path);

// Parse a pointer string into Path
// Examples:
//   "/"             -> []
//   ""              -> []
//   "/a~1b/0"       -> ["a/b", 0]
// A pointer that does not start with '/' is logged and yields an empty Path;
// use is_valid_pointer() first where that matters.
[[nodiscard]] DRIFTGATE_API Path parse_pointer(std::string_view pointer);

/// True for "" and anything starting with '/'
[[nodiscard]] DRIFTGATE_API bool is_valid_pointer(std::string_view pointer) noexcept;

// Get value by pointer
// Returns null Value if the path is not found
[[nodiscard]] DRIFTGATE_API Value get_by_pointer(const Value& data, std::string_view pointer);

} // namespace driftgate
