// test_approval.cpp - Tests for ApprovalResult and the bundled lookups

#include <catch2/catch_all.hpp>
#include <driftgate/approval.h>
#include <driftgate/errors.h>

#include <stdexcept>
#include <string>

using namespace driftgate;

// ============================================================
// ApprovalResult
// ============================================================

TEST_CASE("ApprovalResult holds exactly one side", "[approval][result]") {
    SECTION("success") {
        auto result = ApprovalResult::success("Approved");
        REQUIRE(result.ok());
        REQUIRE(static_cast<bool>(result));
        REQUIRE(result.state().status == "Approved");
        REQUIRE_THROWS_AS(result.error(), std::logic_error);
    }

    SECTION("failure") {
        auto result = ApprovalResult::failure(LookupErrorKind::Timeout, "deadline exceeded");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind == LookupErrorKind::Timeout);
        REQUIRE(result.error().message == "deadline exceeded");
        REQUIRE_THROWS_AS(result.state(), std::logic_error);
    }
}

TEST_CASE("LookupError descriptions", "[approval][error]") {
    REQUIRE(lookup_error_kind_name(LookupErrorKind::Timeout) == "timeout");
    REQUIRE(lookup_error_kind_name(LookupErrorKind::Transport) == "transport");
    REQUIRE(lookup_error_kind_name(LookupErrorKind::Authorization) == "authorization");
    REQUIRE(lookup_error_kind_name(LookupErrorKind::MalformedResponse) == "malformed response");

    REQUIRE(describe(LookupError{LookupErrorKind::Authorization, "HTTP 401"}) == "authorization: HTTP 401");
    REQUIRE(describe(LookupError{LookupErrorKind::Timeout, ""}) == "timeout");
}

// ============================================================
// TicketApprovalLookup
// ============================================================

TEST_CASE("Ticket responses map onto results", "[approval][ticket]") {
    const std::string approved = R"({"key": "CHG-1", "fields": {"status": {"name": "Approved"}}})";

    SECTION("2xx with a status") {
        auto result = TicketApprovalLookup::interpret(TicketResponse{200, approved});
        REQUIRE(result.ok());
        REQUIRE(result.state().status == "Approved");
    }

    SECTION("authorization failures") {
        REQUIRE(TicketApprovalLookup::interpret(TicketResponse{401, ""}).error().kind ==
                LookupErrorKind::Authorization);
        REQUIRE(TicketApprovalLookup::interpret(TicketResponse{403, approved}).error().kind ==
                LookupErrorKind::Authorization);
    }

    SECTION("timeouts") {
        REQUIRE(TicketApprovalLookup::interpret(TicketResponse{408, ""}).error().kind ==
                LookupErrorKind::Timeout);
        REQUIRE(TicketApprovalLookup::interpret(TicketResponse{504, ""}).error().kind ==
                LookupErrorKind::Timeout);
    }

    SECTION("other non-2xx statuses") {
        for (int code : {0, 302, 404, 500, 503}) {
            auto result = TicketApprovalLookup::interpret(TicketResponse{code, approved});
            REQUIRE_FALSE(result.ok());
            REQUIRE(result.error().kind == LookupErrorKind::Transport);
            REQUIRE(result.error().message == "HTTP " + std::to_string(code));
        }
    }

    SECTION("body is not JSON") {
        auto result = TicketApprovalLookup::interpret(TicketResponse{200, "<html>"});
        REQUIRE(result.error().kind == LookupErrorKind::MalformedResponse);
    }

    SECTION("deeply nested body") {
        auto result = TicketApprovalLookup::interpret(TicketResponse{200, std::string(100000, '[')});
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind == LookupErrorKind::MalformedResponse);
    }

    SECTION("status missing") {
        auto result = TicketApprovalLookup::interpret(TicketResponse{200, R"({"fields": {}})"});
        REQUIRE(result.error().kind == LookupErrorKind::MalformedResponse);
    }

    SECTION("status not a string") {
        auto result = TicketApprovalLookup::interpret(
            TicketResponse{200, R"({"fields": {"status": {"name": 3}}})"});
        REQUIRE(result.error().kind == LookupErrorKind::MalformedResponse);
    }

    SECTION("custom status location") {
        auto result = TicketApprovalLookup::interpret(
            TicketResponse{200, R"({"state": "Ready for Change"})"}, "/state");
        REQUIRE(result.state().status == "Ready for Change");
    }
}

TEST_CASE("TicketApprovalLookup fetches through its transport", "[approval][ticket]") {
    std::string requested;
    TicketApprovalLookup lookup([&](const ApprovalReference& reference) {
        requested = reference;
        return TicketResponse{200, R"({"fields": {"status": {"name": "In Review"}}})"};
    });

    auto result = lookup.get_approval("CHG-7");
    REQUIRE(requested == "CHG-7");
    REQUIRE(result.state().status == "In Review");
}

TEST_CASE("Transport exceptions become transport failures", "[approval][ticket]") {
    TicketApprovalLookup lookup([](const ApprovalReference&) -> TicketResponse {
        throw std::runtime_error("connection refused");
    });

    auto result = lookup.get_approval("CHG-7");
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == LookupErrorKind::Transport);
    REQUIRE(result.error().message == "connection refused");
}

TEST_CASE("TicketApprovalLookup requires a transport", "[approval][ticket]") {
    REQUIRE_THROWS_AS(TicketApprovalLookup(TicketTransport{}), std::invalid_argument);
}

// ============================================================
// StaticApprovalLookup
// ============================================================

TEST_CASE("StaticApprovalLookup answers from its table", "[approval][static]") {
    StaticApprovalLookup lookup;
    lookup.set_status("CHG-1", "Approved")
          .set_error("CHG-2", LookupError{LookupErrorKind::Timeout, "slow"});

    REQUIRE(lookup.get_approval("CHG-1").state().status == "Approved");
    REQUIRE(lookup.get_approval("CHG-2").error().kind == LookupErrorKind::Timeout);
    REQUIRE(lookup.get_approval("CHG-3").error().kind == LookupErrorKind::Transport);
    REQUIRE(lookup.call_count() == 3);

    SECTION("later answers overwrite earlier ones") {
        lookup.set_status("CHG-2", "Ready for Change");
        REQUIRE(lookup.get_approval("CHG-2").state().status == "Ready for Change");
    }
}
