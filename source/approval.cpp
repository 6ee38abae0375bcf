// approval.cpp - ApprovalResult accessors and the bundled lookups

#include <driftgate/approval.h>
#include <driftgate/json_pointer.h>
#include <driftgate/log.h>
#include <driftgate/serialization.h>

#include <stdexcept>

namespace driftgate {

// ============================================================
// ApprovalResult
// ============================================================

const ApprovalState& ApprovalResult::state() const
{
    if (const auto* state = std::get_if<ApprovalState>(&data_)) {
        return *state;
    }
    throw std::logic_error("ApprovalResult::state() called on a failed lookup");
}

const LookupError& ApprovalResult::error() const
{
    if (const auto* error = std::get_if<LookupError>(&data_)) {
        return *error;
    }
    throw std::logic_error("ApprovalResult::error() called on a successful lookup");
}

// ============================================================
// TicketApprovalLookup
// ============================================================

TicketApprovalLookup::TicketApprovalLookup(TicketTransport transport, std::string status_pointer)
    : transport_(std::move(transport))
    , status_pointer_(std::move(status_pointer))
{
    if (!transport_) {
        throw std::invalid_argument("TicketApprovalLookup requires a transport");
    }
}

ApprovalResult TicketApprovalLookup::get_approval(const ApprovalReference& reference)
{
    TicketResponse response;
    try {
        response = transport_(reference);
    } catch (const std::exception& e) {
        detail::log_key_error("TicketApprovalLookup::get_approval", reference, e.what());
        return ApprovalResult::failure(LookupErrorKind::Transport, e.what());
    }
    return interpret(response, status_pointer_);
}

ApprovalResult TicketApprovalLookup::interpret(const TicketResponse& response,
                                               std::string_view status_pointer)
{
    const int code = response.status_code;
    const std::string code_text = "HTTP " + std::to_string(code);

    if (code == 401 || code == 403) {
        return ApprovalResult::failure(LookupErrorKind::Authorization, code_text);
    }
    if (code == 408 || code == 504) {
        return ApprovalResult::failure(LookupErrorKind::Timeout, code_text);
    }
    if (code < 200 || code > 299) {
        return ApprovalResult::failure(LookupErrorKind::Transport, code_text);
    }

    std::string parse_error;
    const Value document = from_json(response.body, &parse_error);
    if (!parse_error.empty()) {
        return ApprovalResult::failure(LookupErrorKind::MalformedResponse,
                                       "body is not JSON: " + parse_error);
    }

    const Value status = get_by_pointer(document, status_pointer);
    if (!status.is_string()) {
        return ApprovalResult::failure(LookupErrorKind::MalformedResponse,
                                       "no string status at " + std::string{status_pointer});
    }
    return ApprovalResult::success(status.as_string());
}

// ============================================================
// StaticApprovalLookup
// ============================================================

StaticApprovalLookup& StaticApprovalLookup::set_status(const ApprovalReference& reference,
                                                       std::string status)
{
    answers_.insert_or_assign(reference, ApprovalResult::success(std::move(status)));
    return *this;
}

StaticApprovalLookup& StaticApprovalLookup::set_error(const ApprovalReference& reference,
                                                      LookupError error)
{
    answers_.insert_or_assign(reference, ApprovalResult{std::move(error)});
    return *this;
}

ApprovalResult StaticApprovalLookup::get_approval(const ApprovalReference& reference)
{
    calls_.fetch_add(1, std::memory_order_relaxed);
    auto it = answers_.find(reference);
    if (it == answers_.end()) {
        return ApprovalResult::failure(LookupErrorKind::Transport,
                                       "unknown reference '" + reference + "'");
    }
    return it->second;
}

} // namespace driftgate
