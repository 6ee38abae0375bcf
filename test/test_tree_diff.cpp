// test_tree_diff.cpp - Tests for the structural differ

#include <catch2/catch_all.hpp>
#include <driftgate/json_pointer.h>
#include <driftgate/serialization.h>
#include <driftgate/tree_diff.h>
#include <driftgate/value.h>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

using namespace driftgate;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value parse(const std::string& text) {
    std::string error;
    Value v = from_json(text, &error);
    REQUIRE(error.empty());
    return v;
}

std::vector<std::string> pointers(const Patch& patch) {
    std::vector<std::string> result;
    for (const auto& op : patch) {
        result.push_back(path_to_pointer(op.path));
    }
    return result;
}

Value current_segments() {
    return parse(R"({
        "segments": {
            "crm": {"enabled": true, "apps": ["crm.example.com"], "owner": "sales"},
            "hr":  {"enabled": true, "apps": ["hr.example.com"]}
        },
        "version": 3
    })");
}

} // anonymous namespace

// ============================================================
// Identity
// ============================================================

TEST_CASE("Identical trees produce an empty patch", "[diff][identity]") {
    SECTION("same object") {
        auto v = current_segments();
        REQUIRE(make_patch(v, v).empty());
    }

    SECTION("equal but separately built") {
        REQUIRE(make_patch(current_segments(), current_segments()).empty());
    }

    SECTION("scalars and null") {
        REQUIRE(make_patch(Value{}, Value{}).empty());
        REQUIRE(make_patch(Value{"x"}, Value{"x"}).empty());
        REQUIRE(make_patch(Value{1}, Value{1.0}).empty());
    }
}

// ============================================================
// Mapping rules
// ============================================================

TEST_CASE("Mapping differences", "[diff][mapping]") {
    auto current = parse(R"({"a": {"x": 1}, "b": 2})");
    auto desired = parse(R"({"a": {"x": 2}, "c": 3})");

    auto patch = make_patch(current, desired);

    REQUIRE(patch.size() == 3);
    REQUIRE(patch[0] == PatchOperation::remove(parse_pointer("/b")));
    REQUIRE(patch[1] == PatchOperation::replace(parse_pointer("/a/x"), Value{2}));
    REQUIRE(patch[2] == PatchOperation::add(parse_pointer("/c"), Value{3}));
}

TEST_CASE("Single key changes", "[diff][mapping]") {
    SECTION("add to an empty mapping") {
        auto patch = make_patch(parse("{}"), parse(R"({"a": 1})"));
        REQUIRE(patch == Patch{PatchOperation::add(parse_pointer("/a"), Value{1})});
    }

    SECTION("remove a key") {
        auto patch = make_patch(parse(R"({"a": 1, "b": 2})"), parse(R"({"a": 1})"));
        REQUIRE(patch == Patch{PatchOperation::remove(parse_pointer("/b"))});
    }

    SECTION("replace a nested scalar") {
        auto patch = make_patch(parse(R"({"a": {"x": 1}})"), parse(R"({"a": {"x": 2}})"));
        REQUIRE(patch == Patch{PatchOperation::replace(parse_pointer("/a/x"), Value{2})});
    }
}

TEST_CASE("Removals come first in sorted order", "[diff][mapping][order]") {
    auto current = parse(R"({"z": 1, "m": 1, "a": 1, "keep": 1})");
    auto desired = parse(R"({"keep": 2, "y": 1, "b": 1})");

    auto patch = make_patch(current, desired);

    REQUIRE(pointers(patch) == std::vector<std::string>{"/a", "/m", "/z", "/b", "/keep", "/y"});
    REQUIRE(patch[0].op == PatchOp::Remove);
    REQUIRE(patch[1].op == PatchOp::Remove);
    REQUIRE(patch[2].op == PatchOp::Remove);
    REQUIRE(patch[3].op == PatchOp::Add);
    REQUIRE(patch[4].op == PatchOp::Replace);
    REQUIRE(patch[5].op == PatchOp::Add);
}

TEST_CASE("Removed operations carry no value", "[diff][mapping]") {
    auto patch = make_patch(parse(R"({"gone": {"deep": 1}})"), parse("{}"));
    REQUIRE(patch.size() == 1);
    REQUIRE(patch[0].op == PatchOp::Remove);
    REQUIRE_FALSE(patch[0].value.has_value());
}

TEST_CASE("Added subtrees are carried whole", "[diff][mapping]") {
    auto desired = parse(R"({"new": {"a": {"b": [1, 2]}}})");
    auto patch = make_patch(parse("{}"), desired);

    REQUIRE(patch.size() == 1);
    REQUIRE(patch[0].op == PatchOp::Add);
    REQUIRE(path_to_pointer(patch[0].path) == "/new");
    REQUIRE(*patch[0].value == desired.at("new"));
}

TEST_CASE("Shared unchanged subtrees are skipped", "[diff][mapping]") {
    auto current = current_segments();
    auto desired = current.set("version", Value{4});

    auto patch = make_patch(current, desired);
    REQUIRE(patch.size() == 1);
    REQUIRE(path_to_pointer(patch[0].path) == "/version");
}

// ============================================================
// Kind mismatches
// ============================================================

TEST_CASE("Kind mismatch replaces the whole subtree", "[diff][kind]") {
    SECTION("mapping to scalar") {
        auto patch = make_patch(parse(R"({"a": {"x": 1}})"), parse(R"({"a": 5})"));
        REQUIRE(patch.size() == 1);
        REQUIRE(patch[0] == PatchOperation::replace(parse_pointer("/a"), Value{5}));
    }

    SECTION("string to number") {
        auto patch = make_patch(parse(R"({"port": "443"})"), parse(R"({"port": 443})"));
        REQUIRE(patch.size() == 1);
        REQUIRE(patch[0].op == PatchOp::Replace);
    }

    SECTION("sequence to mapping") {
        auto desired = parse(R"({"a": {"k": 1}})");
        auto patch = make_patch(parse(R"({"a": [1]})"), desired);
        REQUIRE(patch.size() == 1);
        REQUIRE(*patch[0].value == desired.at("a"));
    }

    SECTION("at the root") {
        auto patch = make_patch(parse(R"({"a": 1})"), parse("[1]"));
        REQUIRE(patch.size() == 1);
        REQUIRE(patch[0].op == PatchOp::Replace);
        REQUIRE(path_to_pointer(patch[0].path) == "/");
    }

    SECTION("null to value") {
        auto patch = make_patch(parse(R"({"a": null})"), parse(R"({"a": false})"));
        REQUIRE(patch.size() == 1);
        REQUIRE(patch[0] == PatchOperation::replace(parse_pointer("/a"), Value{false}));
    }
}

TEST_CASE("Large integers against doubles are compared exactly", "[diff][number]") {
    SECTION("integer above 2^53 against its nearest double") {
        auto current = Value::map({{"a", Value{int64_t{9007199254740993}}}});
        auto desired = Value::map({{"a", Value{9007199254740992.0}}});

        auto patch = make_patch(current, desired);
        REQUIRE(patch.size() == 1);
        REQUIRE(patch[0] == PatchOperation::replace(parse_pointer("/a"), Value{9007199254740992.0}));
        REQUIRE(has_any_difference(current, desired));
    }

    SECTION("same integral value stays equal") {
        REQUIRE(make_patch(Value{int64_t{9007199254740992}}, Value{9007199254740992.0}).empty());
        REQUIRE(make_patch(Value{-3}, Value{-3.0}).empty());
    }

    SECTION("fractional and out-of-range doubles never equal an integer") {
        REQUIRE(make_patch(Value{2}, Value{2.5}).size() == 1);
        REQUIRE(make_patch(Value{std::numeric_limits<int64_t>::max()}, Value{9223372036854775808.0}).size() == 1);
        REQUIRE(make_patch(Value{0}, Value{std::numeric_limits<double>::quiet_NaN()}).size() == 1);
    }
}

// ============================================================
// Sequences
// ============================================================

TEST_CASE("Sequences are replaced atomically", "[diff][sequence]") {
    SECTION("one changed element") {
        auto desired = parse(R"({"apps": ["a", "b", "d"]})");
        auto patch = make_patch(parse(R"({"apps": ["a", "b", "c"]})"), desired);
        REQUIRE(patch.size() == 1);
        REQUIRE(patch[0] == PatchOperation::replace(parse_pointer("/apps"), desired.at("apps")));
    }

    SECTION("reordered elements") {
        auto patch = make_patch(parse(R"({"apps": ["a", "b"]})"), parse(R"({"apps": ["b", "a"]})"));
        REQUIRE(patch.size() == 1);
        REQUIRE(patch[0].op == PatchOp::Replace);
    }

    SECTION("nested mapping inside a sequence element") {
        auto patch = make_patch(parse(R"([{"a": 1}])"), parse(R"([{"a": 2}])"));
        REQUIRE(patch.size() == 1);
        REQUIRE(path_to_pointer(patch[0].path) == "/");
    }

    SECTION("equal sequences") {
        REQUIRE(make_patch(parse("[1, 2.0, [3]]"), parse("[1.0, 2, [3]]")).empty());
    }
}

// ============================================================
// Escaping and determinism
// ============================================================

TEST_CASE("Keys with separators are escaped in paths", "[diff][escape]") {
    auto patch = make_patch(parse(R"({"crm/web": {"x~y": 1}})"), parse(R"({"crm/web": {"x~y": 2}})"));
    REQUIRE(patch.size() == 1);
    REQUIRE(path_to_pointer(patch[0].path) == "/crm~1web/x~0y");
}

TEST_CASE("Patches are deterministic", "[diff][determinism]") {
    const std::string current_text = R"({"k9": 1, "k3": {"a": 1}, "k1": [1], "k7": "x", "k5": true})";
    const std::string desired_text = R"({"k2": 1, "k3": {"a": 2, "b": 1}, "k1": [2], "k8": null, "k5": false})";

    auto first = make_patch(parse(current_text), parse(desired_text));
    for (int i = 0; i < 10; ++i) {
        REQUIRE(make_patch(parse(current_text), parse(desired_text)) == first);
    }

    REQUIRE(pointers(first) ==
            std::vector<std::string>{"/k7", "/k9", "/k1", "/k2", "/k3/a", "/k3/b", "/k5", "/k8"});
}

TEST_CASE("Patch paths follow the diff rules", "[diff][properties]") {
    auto current = current_segments();
    auto desired = parse(R"({
        "segments": {
            "crm": {"enabled": false, "apps": ["crm.example.com", "crm2.example.com"]},
            "finance": {"enabled": true, "apps": []}
        },
        "version": "4"
    })");

    auto patch = make_patch(current, desired);

    for (const auto& op : patch) {
        const auto pointer = path_to_pointer(op.path);
        switch (op.op) {
            case PatchOp::Remove:
                // Removes name something that exists now and not in desired
                REQUIRE(get_by_pointer(current, pointer).kind() != ValueKind::Null);
                REQUIRE(get_by_pointer(desired, pointer).is_null());
                REQUIRE_FALSE(op.value.has_value());
                break;
            case PatchOp::Add:
                REQUIRE(get_by_pointer(current, pointer).is_null());
                REQUIRE(*op.value == get_by_pointer(desired, pointer));
                break;
            case PatchOp::Replace:
                REQUIRE(*op.value == get_by_pointer(desired, pointer));
                REQUIRE_FALSE(get_by_pointer(current, pointer) == *op.value);
                break;
        }
    }

    REQUIRE(pointers(patch) == std::vector<std::string>{
        "/segments/hr",
        "/segments/crm/owner",
        "/segments/crm/apps",
        "/segments/crm/enabled",
        "/segments/finance",
        "/version"});
}

// ============================================================
// PatchCollector and has_any_difference
// ============================================================

TEST_CASE("PatchCollector reuse", "[diff][collector]") {
    PatchCollector collector;

    collector.diff(parse(R"({"a": 1})"), parse(R"({"a": 2})"));
    REQUIRE(collector.has_changes());
    REQUIRE(collector.get_patch().size() == 1);

    SECTION("diff replaces the previous result") {
        collector.diff(parse(R"({"a": 1})"), parse(R"({"a": 1})"));
        REQUIRE_FALSE(collector.has_changes());
    }

    SECTION("take_patch empties the collector") {
        auto taken = collector.take_patch();
        REQUIRE(taken.size() == 1);
        REQUIRE_FALSE(collector.has_changes());
    }

    SECTION("clear") {
        collector.clear();
        REQUIRE(collector.get_patch().empty());
    }
}

TEST_CASE("has_any_difference agrees with make_patch", "[diff][quick]") {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {R"({"a": 1})", R"({"a": 1})"},
        {R"({"a": 1})", R"({"a": 1.0})"},
        {R"({"a": 1})", R"({"a": 2})"},
        {R"({"a": [1]})", R"({"a": [1, 2]})"},
        {R"({"a": {}})", R"({"a": null})"},
        {"[]", "{}"},
    };

    for (const auto& [current_text, desired_text] : cases) {
        auto current = parse(current_text);
        auto desired = parse(desired_text);
        REQUIRE(has_any_difference(current, desired) == !make_patch(current, desired).empty());
    }
}
