// json_pointer.cpp
// Pointer strings for patch paths

#include <driftgate/json_pointer.h>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace driftgate {

namespace {

/// Unescape a pointer segment
/// ~1 -> /, ~0 -> ~
std::string unescape_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            } else if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }

    return result;
}

/// Check if a string represents a sequence index ("0", "12"; not "01")
bool is_array_index(const std::string& s)
{
    if (s.empty() || s.size() > 19 || (s.size() > 1 && s[0] == '0')) {
        return false;
    }
    return std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c); });
}

} // anonymous namespace

std::string escape_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

std::string path_to_pointer(const Path& path)
{
    if (path.empty()) {
        return "/";
    }

    std::string result;
    for (const auto& elem : path) {
        result += '/';
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += escape_segment(v);
            } else {
                result += std::to_string(v);
            }
        }, elem);
    }
    return result;
}

bool is_valid_pointer(std::string_view pointer) noexcept
{
    return pointer.empty() || pointer.front() == '/';
}

Path parse_pointer(std::string_view pointer)
{
    if (pointer.empty() || pointer == "/") {
        return Path{};
    }

    if (pointer[0] != '/') {
        std::cerr << "[parse_pointer] Invalid pointer, must start with '/': "
                  << pointer << "\n";
        return Path{};
    }

    Path path;
    pointer = pointer.substr(1);

    while (true) {
        auto pos = pointer.find('/');
        std::string_view segment = (pos == std::string_view::npos)
                                    ? pointer
                                    : pointer.substr(0, pos);

        std::string unescaped = unescape_segment(segment);
        if (is_array_index(unescaped)) {
            path.emplace_back(static_cast<std::size_t>(std::stoull(unescaped)));
        } else {
            path.emplace_back(std::move(unescaped));
        }

        if (pos == std::string_view::npos) {
            break;
        }
        pointer = pointer.substr(pos + 1);
    }

    return path;
}

Value get_by_pointer(const Value& data, std::string_view pointer)
{
    Value current = data;
    for (const auto& elem : parse_pointer(pointer)) {
        if (auto* key = std::get_if<std::string>(&elem)) {
            if (!current.contains(*key)) {
                return Value{};
            }
            current = current.at(*key);
        } else {
            const auto index = std::get<std::size_t>(elem);
            if (current.is_map()) {
                // Numeric-looking mapping key
                const auto key = std::to_string(index);
                if (!current.contains(key)) {
                    return Value{};
                }
                current = current.at(key);
            } else if (current.is_vector() && index < current.size()) {
                current = current.at(index);
            } else {
                return Value{};
            }
        }
    }
    return current;
}

} // namespace driftgate
