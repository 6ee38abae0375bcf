/// @file gate_config.h
/// @brief Gate configuration and its environment loader.
///
/// The gate never reads the environment itself; a GateConfig is built once
/// and handed to PolicyGate's constructor. Enforcement is off unless the
/// configuration explicitly turns it on.
///
/// Environment:
///   DRIFTGATE_ENABLE_ENFORCE  true|1|yes|on / false|0|no|off (case-insensitive),
///                             unset or empty = false
///   DRIFTGATE_ALLOW_STATUSES  comma-separated statuses, e.g. "Approved,Ready for Change"

#pragma once

#include "api.h"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace driftgate {

/// Approval statuses that authorize a patch. Membership is exact and case-sensitive.
using StatusAllowlist = std::set<std::string>;

namespace env_keys {
    inline constexpr const char* ENABLE_ENFORCE = "DRIFTGATE_ENABLE_ENFORCE";
    inline constexpr const char* ALLOW_STATUSES = "DRIFTGATE_ALLOW_STATUSES";
}

struct GateConfig {
    bool enforcement_enabled = false;
    StatusAllowlist default_allowed_statuses{"Approved", "Ready for Change"};
};

/// Returns the variable's value, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// EnvLookup backed by std::getenv
[[nodiscard]] DRIFTGATE_API EnvLookup process_env();

/// Build a GateConfig from environment variables
/// @throws GateConfigError if DRIFTGATE_ENABLE_ENFORCE is not a recognised boolean
[[nodiscard]] DRIFTGATE_API GateConfig load_gate_config(const EnvLookup& env);

/// @param name Variable name, used in the error message
/// @throws GateConfigError for anything other than the accepted spellings
[[nodiscard]] DRIFTGATE_API bool parse_flag(std::string_view name, std::string_view text);

/// Split on ',', trim spaces and tabs, drop empty entries
[[nodiscard]] DRIFTGATE_API StatusAllowlist parse_status_list(std::string_view text);

} // namespace driftgate
