// gate_config.cpp - Environment loading for GateConfig

#include <driftgate/gate_config.h>
#include <driftgate/errors.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace driftgate {

namespace {

std::string_view trim(std::string_view text)
{
    constexpr std::string_view blanks = " \t";
    const auto first = text.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(blanks);
    return text.substr(first, last - first + 1);
}

std::string to_lower(std::string_view text)
{
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // anonymous namespace

EnvLookup process_env()
{
    return [](std::string_view name) -> std::optional<std::string> {
        const std::string key{name};
        if (const char* value = std::getenv(key.c_str())) {
            return std::string{value};
        }
        return std::nullopt;
    };
}

bool parse_flag(std::string_view name, std::string_view text)
{
    const std::string lowered = to_lower(trim(text));
    if (lowered.empty()) {
        return false;
    }
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw GateConfigError(std::string{name} + ": not a boolean: '" + std::string{text} + "'");
}

StatusAllowlist parse_status_list(std::string_view text)
{
    StatusAllowlist statuses;
    while (true) {
        const auto comma = text.find(',');
        const auto entry = trim(text.substr(0, comma));
        if (!entry.empty()) {
            statuses.emplace(entry);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return statuses;
}

GateConfig load_gate_config(const EnvLookup& env)
{
    GateConfig config;

    if (auto flag = env(env_keys::ENABLE_ENFORCE)) {
        config.enforcement_enabled = parse_flag(env_keys::ENABLE_ENFORCE, *flag);
    }

    if (auto statuses = env(env_keys::ALLOW_STATUSES)) {
        auto parsed = parse_status_list(*statuses);
        // Blank value keeps the defaults
        if (!parsed.empty()) {
            config.default_allowed_statuses = std::move(parsed);
        }
    }

    return config;
}

} // namespace driftgate
