/// @file approval.h
/// @brief Approval lookup seam and the ticket-backed implementation.
///
/// The gate only ever sees ApprovalLookup::get_approval(), which returns an
/// explicit success-or-failure ApprovalResult. Implementations must not
/// cache: every call reflects the ticket as it is now.
///
/// TicketApprovalLookup turns a raw ticket fetch into an ApprovalResult.
/// The fetch itself (HTTP client, credentials, timeout) is a caller-provided
/// TicketTransport, so no network code lives here:
///
/// @code
///   TicketApprovalLookup lookup([&](const ApprovalReference& key) {
///       auto r = http.get(base + "/rest/api/3/issue/" + key);
///       return TicketResponse{r.status, r.body};
///   });
///   PolicyGate gate(lookup, config);
/// @endcode

#pragma once

#include "api.h"
#include "errors.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace driftgate {

/// Opaque external identifier, e.g. a ticket key like "CHG-1042"
using ApprovalReference = std::string;

struct ApprovalState {
    std::string status;
};

// ============================================================
// ApprovalResult - ApprovalState or LookupError, never both
// ============================================================

class DRIFTGATE_API ApprovalResult {
public:
    ApprovalResult(ApprovalState state) : data_(std::move(state)) {}
    ApprovalResult(LookupError error) : data_(std::move(error)) {}

    static ApprovalResult success(std::string status) {
        return ApprovalResult{ApprovalState{std::move(status)}};
    }

    static ApprovalResult failure(LookupErrorKind kind, std::string message) {
        return ApprovalResult{LookupError{kind, std::move(message)}};
    }

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<ApprovalState>(data_); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    /// @throws std::logic_error if this is a failure
    [[nodiscard]] const ApprovalState& state() const;

    /// @throws std::logic_error if this is a success
    [[nodiscard]] const LookupError& error() const;

private:
    std::variant<ApprovalState, LookupError> data_;
};

// ============================================================
// ApprovalLookup - the collaborator interface
// ============================================================

class DRIFTGATE_API ApprovalLookup {
public:
    virtual ~ApprovalLookup() = default;

    /// One fresh fetch per call. Failures are returned, not thrown.
    [[nodiscard]] virtual ApprovalResult get_approval(const ApprovalReference& reference) = 0;
};

// ============================================================
// TicketApprovalLookup
// ============================================================

struct TicketResponse {
    int status_code = 0;
    std::string body;
};

using TicketTransport = std::function<TicketResponse(const ApprovalReference&)>;

/// Where a ticket document keeps its workflow status name
inline constexpr const char* DEFAULT_STATUS_POINTER = "/fields/status/name";

class DRIFTGATE_API TicketApprovalLookup : public ApprovalLookup {
public:
    explicit TicketApprovalLookup(TicketTransport transport,
                                  std::string status_pointer = DEFAULT_STATUS_POINTER);

    [[nodiscard]] ApprovalResult get_approval(const ApprovalReference& reference) override;

    /// Map a raw response onto a result:
    /// - 401, 403          -> Authorization
    /// - 408, 504          -> Timeout
    /// - other non-2xx     -> Transport
    /// - body not JSON     -> MalformedResponse
    /// - no string status at status_pointer -> MalformedResponse
    [[nodiscard]] static ApprovalResult interpret(const TicketResponse& response,
                                                  std::string_view status_pointer = DEFAULT_STATUS_POINTER);

private:
    TicketTransport transport_;
    std::string status_pointer_;
};

// ============================================================
// StaticApprovalLookup - fixed answers per reference
//
// Configure before sharing; get_approval() only reads the tables.
// Unknown references fail with a Transport error.
// ============================================================

class DRIFTGATE_API StaticApprovalLookup : public ApprovalLookup {
public:
    StaticApprovalLookup& set_status(const ApprovalReference& reference, std::string status);
    StaticApprovalLookup& set_error(const ApprovalReference& reference, LookupError error);

    [[nodiscard]] ApprovalResult get_approval(const ApprovalReference& reference) override;

    /// Number of get_approval() calls so far
    [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(std::memory_order_relaxed); }

private:
    std::map<ApprovalReference, ApprovalResult> answers_;
    std::atomic<std::size_t> calls_{0};
};

} // namespace driftgate
