// reconcile_demo.cpp - Diff two state documents and run the result through the gate
//
// Usage:
//   reconcile_demo <current.json> <desired.json> [approval-ref] [approval-status]
//
// The approval status is served by a StaticApprovalLookup, so no ticket
// system is needed. Enforcement follows DRIFTGATE_ENABLE_ENFORCE, and the
// allowlist follows DRIFTGATE_ALLOW_STATUSES.

#include <driftgate/patch_summary.h>
#include <driftgate/policy_gate.h>
#include <driftgate/serialization.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace driftgate;

namespace {

bool load_document(const char* file_name, Value& out)
{
    std::ifstream in(file_name);
    if (!in) {
        std::cerr << "cannot open " << file_name << "\n";
        return false;
    }
    std::ostringstream text;
    text << in.rdbuf();

    std::string error;
    out = from_json(text.str(), &error);
    if (!error.empty()) {
        std::cerr << file_name << ": " << error << "\n";
        return false;
    }
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    if (argc < 3) {
        std::cerr << "usage: " << argv[0]
                  << " <current.json> <desired.json> [approval-ref] [approval-status]\n";
        return 2;
    }

    Value current;
    Value desired;
    if (!load_document(argv[1], current) || !load_document(argv[2], desired)) {
        return 1;
    }

    const std::string approval_ref = argc > 3 ? argv[3] : "CHG-1";
    const std::string approval_status = argc > 4 ? argv[4] : "Approved";

    GateConfig config;
    try {
        config = load_gate_config(process_env());
    } catch (const GateConfigError& e) {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "=== Drift ===\n";
    DiffReport report = make_diff_report(current, desired);
    if (report.changes == 0) {
        std::cout << "no changes\n";
    }
    for (const auto& line : report.summary) {
        std::cout << "  " << line << "\n";
    }

    std::cout << "\n=== Patch ===\n";
    std::cout << to_json(patch_to_value(report.patch)) << "\n";

    StaticApprovalLookup lookup;
    lookup.set_status(approval_ref, approval_status);
    PolicyGate gate(lookup, config);

    std::cout << "\n=== Decision ===\n";
    EnforcementDecision decision = gate.enforce(report.patch, approval_ref);
    std::cout << to_json(decision_to_value(decision)) << "\n";

    return decision.accepted() ? 0 : 3;
}
