// patch_summary.cpp - Reviewer-facing rendering of patches

#include <driftgate/patch_summary.h>
#include <driftgate/builders.h>
#include <driftgate/json_pointer.h>
#include <driftgate/tree_diff.h>

#include <algorithm>
#include <cctype>

namespace driftgate {

std::vector<std::string> summarize_patch(const Patch& patch)
{
    std::vector<std::string> lines;
    lines.reserve(patch.size());
    for (const auto& operation : patch) {
        std::string line{op_name(operation.op)};
        std::transform(line.begin(), line.end(), line.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        line += ' ';
        line += path_to_pointer(operation.path);
        lines.push_back(std::move(line));
    }
    return lines;
}

DiffReport make_diff_report(const Value& current, const Value& desired)
{
    DiffReport report;
    report.patch = make_patch(current, desired);
    report.summary = summarize_patch(report.patch);
    report.changes = report.patch.size();
    return report;
}

Value report_to_value(const DiffReport& report)
{
    VectorBuilder summary;
    for (const auto& line : report.summary) {
        summary.push_back(line);
    }
    return MapBuilder()
        .set("patch", patch_to_value(report.patch))
        .set("summary", summary.finish())
        .set("changes", static_cast<int64_t>(report.changes))
        .finish();
}

} // namespace driftgate
