/// @file errors.h
/// @brief Error taxonomy.
///
/// - ValidationError: malformed input (patch document, op code); thrown
///   before any processing starts.
/// - LookupError: an approval fetch that did not produce a status. It is a
///   value carried by ApprovalResult, never thrown; the gate turns it into
///   a blocked decision.
/// - GateConfigError: a configuration value that cannot be interpreted.
///
/// A status outside the allowlist is not an error at all: it is a blocked
/// EnforcementDecision (see policy_gate.h).

#pragma once

#include "api.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace driftgate {

class DRIFTGATE_API ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DRIFTGATE_API GateConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class LookupErrorKind : std::uint8_t {
    Timeout,
    Transport,
    Authorization,
    MalformedResponse
};

struct LookupError {
    LookupErrorKind kind = LookupErrorKind::Transport;
    std::string message;
};

/// "timeout", "transport", "authorization", "malformed response"
[[nodiscard]] DRIFTGATE_API std::string_view lookup_error_kind_name(LookupErrorKind kind) noexcept;

/// "<kind>: <message>", or just the kind name when message is empty
[[nodiscard]] DRIFTGATE_API std::string describe(const LookupError& error);

} // namespace driftgate
