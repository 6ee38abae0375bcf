/// @file value.h
/// @brief The generic tree value that desired and current policy state are expressed in.
///
/// A Value is exactly one of:
/// - null (std::monostate)
/// - boolean
/// - number (stored as int64_t or double; both are the same kind)
/// - string
/// - sequence (immer::vector of boxed values)
/// - mapping  (immer::map from string key to boxed value)
///
/// Containers are immer persistent containers, so copying a Value or a
/// subtree is O(1) and patches can carry desired subtrees without deep copies.
/// The Value type is templated on an immer memory policy.

#pragma once

#include "api.h"
#include "driftgate_config.h"
#include "log.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace driftgate {

/// Structural kind of a Value. Two values of different kinds are never
/// equal and never diffed below the point where they diverge.
enum class ValueKind : std::uint8_t {
    Null,
    Boolean,
    Number,
    String,
    Sequence,
    Mapping
};

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>,
                                       MemoryPolicy>;

/// A path segment: a mapping key or a sequence index
using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 value_vector,
                 value_map>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(v) {}
    BasicValue(int v) noexcept : data(static_cast<int64_t>(v)) {}
    BasicValue(int64_t v) noexcept : data(v) {}
    BasicValue(double v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_map v) : data(std::move(v)) {}

    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept {
        switch (data.index()) {
            case 0: return ValueKind::Null;
            case 1: return ValueKind::Boolean;
            case 2:
            case 3: return ValueKind::Number;
            case 4: return ValueKind::String;
            case 5: return ValueKind::Sequence;
            default: return ValueKind::Mapping;
        }
    }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at_or(const std::string& key, BasicValue default_val) const {
        if (count(key) == 0) return default_val;
        return at(key);
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<double>()) return static_cast<int64_t>(*p);
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_vector as_vector(value_vector default_val = {}) const {
        if (auto* p = get_if<value_vector>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        return 0;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        if (is_null()) return value_map{}.set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-mapping type");
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

using Value       = BasicValue<immer::default_memory_policy>;
using ValueBox    = BasicValueBox<immer::default_memory_policy>;
using ValueMap    = BasicValueMap<immer::default_memory_policy>;
using ValueVector = BasicValueVector<immer::default_memory_policy>;

// ============================================================
// Equality
//
// Deep structural equality. int64_t and double are one kind, so
// Value{1} == Value{1.0}; mixed pairs compare exactly, never via double. Nested containers compare their boxes,
// which forwards back here for every element.
// ============================================================

namespace detail {

/// Exact: true only when d is integral, inside int64_t range and equal to i.
/// No rounding through double, so 2^53 + 1 != 2^53.
inline bool integer_equals_double(int64_t i, double d) noexcept
{
    // -2^63 and 2^63 are exact doubles; the valid range is [-2^63, 2^63)
    constexpr double lower = -9223372036854775808.0;
    constexpr double upper = 9223372036854775808.0;
    if (!std::isfinite(d) || std::trunc(d) != d || d < lower || d >= upper) {
        return false;
    }
    return static_cast<int64_t>(d) == i;
}

} // namespace detail

template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    if (a.data.index() != b.data.index()) {
        if (auto* i = a.template get_if<int64_t>()) {
            if (auto* d = b.template get_if<double>()) {
                return detail::integer_equals_double(*i, *d);
            }
        } else if (auto* d = a.template get_if<double>()) {
            if (auto* i = b.template get_if<int64_t>()) {
                return detail::integer_equals_double(*i, *d);
            }
        }
        return false;
    }
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Lowercase kind name: "null", "boolean", "number", "string", "sequence", "mapping"
[[nodiscard]] DRIFTGATE_API std::string_view kind_name(ValueKind kind) noexcept;

/// Short human-readable rendering: 42, "text", [sequence:3], {mapping:2}
[[nodiscard]] DRIFTGATE_API std::string value_to_string(const Value& val);

namespace detail {
    /// Keys of a mapping in lexicographic order
    [[nodiscard]] DRIFTGATE_API std::vector<std::string> sorted_keys(const ValueMap& map);
}

extern template struct BasicValue<immer::default_memory_policy>;

} // namespace driftgate
