/// @file policy_gate.h
/// @brief Approval-gated enforcement decision for a Patch.
///
/// State machine, one pass per enforce() call:
///
///   Init --(enforcement off)--------------------------> Blocked
///   Init --> FetchingApproval --(lookup failed)-------> Blocked
///                             --(status not allowed)--> Blocked
///                             --(status allowed)------> Accepted
///
/// Every call ends in exactly one terminal state and returns a decision;
/// nothing on this path throws to the caller. Accepting does not apply the
/// patch, it only authorizes a separate application step.
///
/// @code
///   StaticApprovalLookup lookup;
///   lookup.set_status("TICK-1", "Approved");
///   PolicyGate gate(lookup, load_gate_config(process_env()));
///   auto decision = gate.enforce(patch, "TICK-1", {"Approved"});
///   if (decision.accepted()) { ... }
/// @endcode

#pragma once

#include "api.h"
#include "approval.h"
#include "gate_config.h"
#include "patch.h"
#include "value.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace driftgate {

enum class Outcome : std::uint8_t { Accepted, Blocked };

enum class GateState : std::uint8_t { Init, FetchingApproval, Blocked, Accepted };

struct EnforcementDecision {
    Outcome outcome = Outcome::Blocked;
    std::string reason;
    std::size_t applied_ops_count = 0;   ///< patch size when accepted, 0 when blocked
    std::vector<GateState> states;       ///< states visited, Init first, terminal last

    [[nodiscard]] bool accepted() const noexcept { return outcome == Outcome::Accepted; }
};

/// "accepted" / "blocked"
[[nodiscard]] DRIFTGATE_API std::string_view outcome_name(Outcome outcome) noexcept;

/// "init", "fetching_approval", "blocked", "accepted"
[[nodiscard]] DRIFTGATE_API std::string_view state_name(GateState state) noexcept;

/// Audit document:
///   {"status": "blocked",  "reason": "..."}
///   {"status": "accepted", "reason": "...", "applied_ops": 3}
[[nodiscard]] DRIFTGATE_API Value decision_to_value(const EnforcementDecision& decision);

// ============================================================
// GateCounters - monotonic, safe for concurrent increment
//
// attempts == accepted + blocked once all calls have returned.
// ============================================================

class DRIFTGATE_API GateCounters {
public:
    struct Stats {
        std::uint64_t attempts = 0;
        std::uint64_t accepted = 0;
        std::uint64_t blocked = 0;
    };

    void record_attempt() noexcept { attempts_.fetch_add(1, std::memory_order_relaxed); }
    void record_accepted() noexcept { accepted_.fetch_add(1, std::memory_order_relaxed); }
    void record_blocked() noexcept { blocked_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] Stats stats() const noexcept {
        return Stats{attempts_.load(std::memory_order_relaxed),
                     accepted_.load(std::memory_order_relaxed),
                     blocked_.load(std::memory_order_relaxed)};
    }

private:
    std::atomic<std::uint64_t> attempts_{0};
    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> blocked_{0};
};

/// Process-wide counters used by gates constructed without their own
[[nodiscard]] DRIFTGATE_API GateCounters& global_gate_counters();

// ============================================================
// PolicyGate
// ============================================================

class DRIFTGATE_API PolicyGate {
public:
    PolicyGate(ApprovalLookup& lookup, GateConfig config, GateCounters& counters = global_gate_counters());

    /// Decide with the configured enforcement flag
    [[nodiscard]] EnforcementDecision enforce(const Patch& patch,
                                              const ApprovalReference& approval_ref,
                                              const StatusAllowlist& allowed_statuses) const;

    /// Decide with the configured flag and the configured default allowlist
    [[nodiscard]] EnforcementDecision enforce(const Patch& patch,
                                              const ApprovalReference& approval_ref) const;

    /// Decide with an explicit enforcement flag
    [[nodiscard]] EnforcementDecision enforce(const Patch& patch,
                                              const ApprovalReference& approval_ref,
                                              const StatusAllowlist& allowed_statuses,
                                              bool enforcement_enabled) const;

    [[nodiscard]] const GateConfig& config() const noexcept { return config_; }

private:
    EnforcementDecision block(EnforcementDecision decision, const ApprovalReference& approval_ref,
                              std::string reason) const;

    ApprovalLookup& lookup_;
    GateConfig config_;
    GateCounters& counters_;
};

namespace detail {
    /// "[a, b, c]" in set order
    [[nodiscard]] std::string format_allowlist(const StatusAllowlist& allowed);
}

} // namespace driftgate
