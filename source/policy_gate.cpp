// policy_gate.cpp - PolicyGate state machine and decision documents

#include <driftgate/policy_gate.h>
#include <driftgate/builders.h>
#include <driftgate/log.h>

#include <optional>

namespace driftgate {

namespace detail {

std::string format_allowlist(const StatusAllowlist& allowed)
{
    std::string result = "[";
    bool first = true;
    for (const auto& status : allowed) {
        if (!first) {
            result += ", ";
        }
        result += status;
        first = false;
    }
    result += "]";
    return result;
}

} // namespace detail

std::string_view outcome_name(Outcome outcome) noexcept
{
    switch (outcome) {
        case Outcome::Accepted: return "accepted";
        case Outcome::Blocked:  return "blocked";
    }
    return "unknown";
}

std::string_view state_name(GateState state) noexcept
{
    switch (state) {
        case GateState::Init:             return "init";
        case GateState::FetchingApproval: return "fetching_approval";
        case GateState::Blocked:          return "blocked";
        case GateState::Accepted:         return "accepted";
    }
    return "unknown";
}

Value decision_to_value(const EnforcementDecision& decision)
{
    MapBuilder builder;
    builder.set("status", std::string{outcome_name(decision.outcome)})
           .set("reason", decision.reason);
    if (decision.accepted()) {
        builder.set("applied_ops", static_cast<int64_t>(decision.applied_ops_count));
    }
    return builder.finish();
}

GateCounters& global_gate_counters()
{
    static GateCounters counters;
    return counters;
}

// ============================================================
// PolicyGate Implementation
// ============================================================

PolicyGate::PolicyGate(ApprovalLookup& lookup, GateConfig config, GateCounters& counters)
    : lookup_(lookup)
    , config_(std::move(config))
    , counters_(counters)
{
}

EnforcementDecision PolicyGate::enforce(const Patch& patch,
                                        const ApprovalReference& approval_ref,
                                        const StatusAllowlist& allowed_statuses) const
{
    return enforce(patch, approval_ref, allowed_statuses, config_.enforcement_enabled);
}

EnforcementDecision PolicyGate::enforce(const Patch& patch,
                                        const ApprovalReference& approval_ref) const
{
    return enforce(patch, approval_ref, config_.default_allowed_statuses, config_.enforcement_enabled);
}

EnforcementDecision PolicyGate::enforce(const Patch& patch,
                                        const ApprovalReference& approval_ref,
                                        const StatusAllowlist& allowed_statuses,
                                        bool enforcement_enabled) const
{
    counters_.record_attempt();

    EnforcementDecision decision;
    decision.states.reserve(3);
    decision.states.push_back(GateState::Init);

    if (!enforcement_enabled) {
        return block(std::move(decision), approval_ref, "enforcement disabled");
    }

    decision.states.push_back(GateState::FetchingApproval);

    // A throwing lookup must not leave the call without a terminal state
    std::optional<ApprovalResult> result;
    try {
        result.emplace(lookup_.get_approval(approval_ref));
    } catch (const std::exception& e) {
        return block(std::move(decision), approval_ref,
                     std::string{"approval lookup failed: exception: "} + e.what());
    } catch (...) {
        return block(std::move(decision), approval_ref,
                     "approval lookup failed: exception: unknown");
    }

    if (!result->ok()) {
        return block(std::move(decision), approval_ref,
                     "approval lookup failed: " + describe(result->error()));
    }

    const std::string& status = result->state().status;
    if (allowed_statuses.find(status) == allowed_statuses.end()) {
        return block(std::move(decision), approval_ref,
                     "approval status '" + status + "' not in allowlist " +
                     detail::format_allowlist(allowed_statuses));
    }

    decision.outcome = Outcome::Accepted;
    decision.reason = "approval status '" + status + "' in allowlist";
    decision.applied_ops_count = patch.size();
    decision.states.push_back(GateState::Accepted);
    counters_.record_accepted();
    detail::log_decision("PolicyGate::enforce", approval_ref, "accepted", decision.reason);
    return decision;
}

EnforcementDecision PolicyGate::block(EnforcementDecision decision,
                                      const ApprovalReference& approval_ref,
                                      std::string reason) const
{
    decision.outcome = Outcome::Blocked;
    decision.reason = std::move(reason);
    decision.applied_ops_count = 0;
    decision.states.push_back(GateState::Blocked);
    counters_.record_blocked();
    detail::log_decision("PolicyGate::enforce", approval_ref, "blocked", decision.reason);
    return decision;
}

} // namespace driftgate
