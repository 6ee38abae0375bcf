// errors.cpp - Lookup error descriptions

#include <driftgate/errors.h>

namespace driftgate {

std::string_view lookup_error_kind_name(LookupErrorKind kind) noexcept
{
    switch (kind) {
        case LookupErrorKind::Timeout:           return "timeout";
        case LookupErrorKind::Transport:         return "transport";
        case LookupErrorKind::Authorization:     return "authorization";
        case LookupErrorKind::MalformedResponse: return "malformed response";
    }
    return "unknown";
}

std::string describe(const LookupError& error)
{
    std::string text{lookup_error_kind_name(error.kind)};
    if (!error.message.empty()) {
        text += ": ";
        text += error.message;
    }
    return text;
}

} // namespace driftgate
