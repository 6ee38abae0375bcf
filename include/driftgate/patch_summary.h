/// @file patch_summary.h
/// @brief Human-readable rendering of a Patch.

#pragma once

#include "api.h"
#include "patch.h"
#include "value.h"

#include <cstddef>
#include <string>
#include <vector>

namespace driftgate {

/// One line per operation, in patch order: "<OP> <pointer>"
///   REMOVE /b
///   ADD /c
///   REPLACE /a/x
[[nodiscard]] DRIFTGATE_API std::vector<std::string> summarize_patch(const Patch& patch);

/// Everything a reviewer sees for one reconciliation
struct DiffReport {
    Patch patch;
    std::vector<std::string> summary;
    std::size_t changes = 0;
};

/// Diff current against desired and summarize the result
[[nodiscard]] DRIFTGATE_API DiffReport make_diff_report(const Value& current, const Value& desired);

/// {"patch": [...], "summary": ["ADD /a", ...], "changes": n}
[[nodiscard]] DRIFTGATE_API Value report_to_value(const DiffReport& report);

} // namespace driftgate
