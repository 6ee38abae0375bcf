/// @file tree_diff.h
/// @brief Structural diff between a current and a desired Value tree.
///
/// Rules, applied recursively from the root:
/// - Different kinds (mapping vs scalar, string vs number, sequence vs
///   mapping, ...): one Replace at the current path carrying the whole
///   desired subtree. No recursion below that point.
/// - Two mappings: Remove for keys only in current, Add for keys only in
///   desired, recurse into shared keys.
/// - Two sequences: compared as atomic values. If they are not element-wise
///   equal, one Replace for the whole sequence. No positional ops.
/// - Two scalars of the same kind: Replace if the values differ.
///
/// Output order is fixed: within a mapping, all removals first in sorted
/// key order, then one sorted pass over the desired keys producing adds and
/// descending into shared keys. Equal inputs therefore always give
/// identical patches, and make_patch(x, x) is empty.

#pragma once

#include "api.h"
#include "patch.h"
#include "value.h"

#include <vector>

namespace driftgate {

// ============================================================
// PatchCollector - Collects the diff as a flat, ordered Patch
// ============================================================

class DRIFTGATE_API PatchCollector {
private:
    Patch patch_;

    void diff_value(const Value& current, const Value& desired, Path& current_path);
    void diff_map(const ValueMap& current, const ValueMap& desired, Path& current_path);
    void diff_vector(const ValueVector& current, const ValueVector& desired, const Value& desired_val,
                     Path& current_path);

public:
    /// Replaces any previous result
    void diff(const Value& current, const Value& desired);
    [[nodiscard]] const Patch& get_patch() const { return patch_; }
    /// Moves the result out; the collector is empty afterwards
    [[nodiscard]] Patch take_patch();
    void clear();
    [[nodiscard]] bool has_changes() const { return !patch_.empty(); }
};

/// Convenience wrapper around PatchCollector
[[nodiscard]] DRIFTGATE_API Patch make_patch(const Value& current, const Value& desired);

/// Same answer as !make_patch(a, b).empty() without building the patch
[[nodiscard]] DRIFTGATE_API bool has_any_difference(const Value& current, const Value& desired);


} // namespace driftgate
