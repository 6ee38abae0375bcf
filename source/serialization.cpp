// serialization.cpp - JSON text <-> Value

#include <driftgate/serialization.h>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace driftgate {

namespace {

// JSON escape special characters in strings
std::string json_escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            // JSON has no NaN or infinity
            if (!std::isfinite(arg)) {
                oss << "null";
            } else {
                // Enough digits that the text reads back to the same double
                oss << std::setprecision(std::numeric_limits<double>::max_digits10) << arg;
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.size() == 0) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& key : detail::sorted_keys(arg)) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(key) << "\":" << space_after_colon;
                    to_json_impl(arg.at(key).get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

// ============================================================
// Simple JSON Parser
// ============================================================

class JsonParser {
public:
    /// Nesting limit for objects and arrays; deeper input is an error
    static constexpr std::size_t MAX_DEPTH = 512;

    JsonParser(const std::string& json) : json_(json), pos_(0), depth_(0) {}

    Value parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                if (error_out) *error_out = "Empty JSON input";
                return Value{};
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing data at position " + std::to_string(pos_));
            }
            return result;
        } catch (const std::exception& e) {
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    const std::string& json_;
    std::size_t pos_;
    std::size_t depth_;

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{' || c == '[') {
            if (++depth_ > MAX_DEPTH) {
                throw std::runtime_error("Nesting deeper than " + std::to_string(MAX_DEPTH) +
                                         " at position " + std::to_string(pos_));
            }
            Value container = (c == '{') ? parse_object() : parse_array();
            --depth_;
            return container;
        }
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        throw std::runtime_error("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    Value parse_object() {
        expect('{');
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return Value{ValueMap{}};
        }

        auto transient = ValueMap{}.transient();

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();
            // Duplicate keys: last one wins
            transient.set(std::move(key), ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }

        return Value{transient.persistent()};
    }

    Value parse_array() {
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Value{ValueVector{}};
        }

        auto transient = ValueVector{}.transient();

        while (true) {
            Value val = parse_value();
            transient.push_back(ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }

        return Value{transient.persistent()};
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape");
        }
        unsigned codepoint = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            codepoint <<= 4;
            if (h >= '0' && h <= '9') codepoint |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') codepoint |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') codepoint |= static_cast<unsigned>(h - 'A' + 10);
            else throw std::runtime_error("Invalid unicode escape");
        }
        return codepoint;
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (c == '\\') {
                if (pos_ >= json_.size()) {
                    throw std::runtime_error("Unexpected end of string escape");
                }
                char escaped = consume();
                switch (escaped) {
                    case '"':  result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/':  result += '/'; break;
                    case 'b':  result += '\b'; break;
                    case 'f':  result += '\f'; break;
                    case 'n':  result += '\n'; break;
                    case 'r':  result += '\r'; break;
                    case 't':  result += '\t'; break;
                    case 'u': {
                        unsigned codepoint = parse_hex4();
                        // Surrogate pair
                        if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                            json_.compare(pos_, 2, "\\u") == 0) {
                            pos_ += 2;
                            unsigned low = parse_hex4();
                            if (low < 0xDC00 || low > 0xDFFF) {
                                throw std::runtime_error("Invalid unicode surrogate pair");
                            }
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        }
                        append_utf8(result, codepoint);
                        break;
                    }
                    default:
                        throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
                }
            } else {
                result += c;
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    Value parse_string() {
        return Value{parse_string_raw()};
    }

    bool at_digit() const {
        return std::isdigit(static_cast<unsigned char>(peek())) != 0;
    }

    void consume_digits() {
        while (at_digit()) consume();
    }

    // -? (0 | [1-9][0-9]*) (.[0-9]+)? ([eE][+-]?[0-9]+)?
    Value parse_number() {
        const std::size_t start = pos_;
        bool is_integer = true;

        if (peek() == '-') consume();

        if (peek() == '0') {
            consume();
            if (at_digit()) {
                throw std::runtime_error("Leading zero in number at position " + std::to_string(start));
            }
        } else if (at_digit()) {
            consume_digits();
        } else {
            throw std::runtime_error("Invalid number at position " + std::to_string(start));
        }

        if (peek() == '.') {
            consume();
            is_integer = false;
            if (!at_digit()) {
                throw std::runtime_error("Expected digit after '.' at position " + std::to_string(pos_));
            }
            consume_digits();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            is_integer = false;
            if (peek() == '+' || peek() == '-') consume();
            if (!at_digit()) {
                throw std::runtime_error("Expected digit in exponent at position " + std::to_string(pos_));
            }
            consume_digits();
        }

        const std::string num_str = json_.substr(start, pos_ - start);
        if (!is_integer) {
            return Value{std::stod(num_str)};
        }
        try {
            return Value{static_cast<int64_t>(std::stoll(num_str))};
        } catch (const std::out_of_range&) {
            return Value{std::stod(num_str)};
        }
    }

    Value parse_bool() {
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Value{true};
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(const std::string& json_str, std::string* error_out) {
    if (error_out) error_out->clear();
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

} // namespace driftgate
