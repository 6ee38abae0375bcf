// value.cpp - Value utilities and explicit instantiations

#include <driftgate/value.h>
#include <driftgate/builders.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace driftgate {

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:     return "null";
        case ValueKind::Boolean:  return "boolean";
        case ValueKind::Number:   return "number";
        case ValueKind::String:   return "string";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Mapping:  return "mapping";
    }
    return "unknown";
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{mapping:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[sequence:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

namespace detail {

std::vector<std::string> sorted_keys(const ValueMap& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [key, _] : map) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace detail

// ============================================================
// Explicit Template Instantiations
//
// Matches the extern template declarations in value.h and builders.h
// so the Value code is generated once, here.
// ============================================================

template struct BasicValue<immer::default_memory_policy>;
template class BasicMapBuilder<immer::default_memory_policy>;
template class BasicVectorBuilder<immer::default_memory_policy>;

} // namespace driftgate
