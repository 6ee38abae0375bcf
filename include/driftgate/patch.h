/// @file patch.h
/// @brief Patch operations and their JSON document form.
///
/// A Patch is the ordered output of make_patch(). Each operation is
/// self-contained: an op code, a path, and (for add/replace) the value to
/// put there. On the wire a patch is a JSON Patch style document:
///
///   [
///     {"op": "remove",  "path": "/b"},
///     {"op": "add",     "path": "/c", "value": {"port": 443}},
///     {"op": "replace", "path": "/a/x", "value": 2}
///   ]

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace driftgate {

enum class PatchOp : std::uint8_t { Add, Remove, Replace };

struct PatchOperation {
    PatchOp op = PatchOp::Add;
    Path path;
    std::optional<Value> value;   ///< Present for Add and Replace only

    static PatchOperation add(Path p, Value v) {
        return PatchOperation{PatchOp::Add, std::move(p), std::move(v)};
    }

    static PatchOperation remove(Path p) {
        return PatchOperation{PatchOp::Remove, std::move(p), std::nullopt};
    }

    static PatchOperation replace(Path p, Value v) {
        return PatchOperation{PatchOp::Replace, std::move(p), std::move(v)};
    }

    bool operator==(const PatchOperation& other) const {
        return op == other.op && path == other.path && value == other.value;
    }
};

using Patch = std::vector<PatchOperation>;

/// Wire name: "add", "remove", "replace"
[[nodiscard]] DRIFTGATE_API std::string_view op_name(PatchOp op) noexcept;

/// Inverse of op_name(). Case-sensitive.
/// @throws ValidationError for anything else
[[nodiscard]] DRIFTGATE_API PatchOp parse_op(std::string_view name);

// ============================================================
// Document conversion
// ============================================================

/// {"op": ..., "path": ..., ["value": ...]}
[[nodiscard]] DRIFTGATE_API Value operation_to_value(const PatchOperation& operation);

/// Sequence of operation documents, in patch order
[[nodiscard]] DRIFTGATE_API Value patch_to_value(const Patch& patch);

/// Validate and convert a patch document.
///
/// Rejected with ValidationError (nothing is returned partially):
/// - the document is not a sequence
/// - an element is not a mapping
/// - "op" is missing, not a string, or not add/remove/replace
/// - "path" is missing, not a string, or not a pointer ("/..." or "")
/// - "value" is missing on add or replace
///
/// The message names the offending element index.
[[nodiscard]] DRIFTGATE_API Patch patch_from_value(const Value& document);

} // namespace driftgate
