#include <catch2/catch_all.hpp>
#include <hron/error.h>
#include <hron/reconcile.h>

using namespace hron;
using Catch::Matchers::ContainsSubstring;

static LeveledSchemaEntry key(const std::string& name, KeyKind kind, size_t depth) {
    return LeveledSchemaEntry{name, kind, depth};
}

static LeveledDataEntry scalar(Value v, size_t depth) {
    ValueKind kind = ValueKind::Null;
    if (v.is_string()) kind = ValueKind::String;
    if (v.is_number()) kind = ValueKind::Number;
    if (v.is_bool()) kind = ValueKind::Boolean;
    return LeveledDataEntry{kind, std::move(v), depth};
}

static LeveledDataEntry open_entry(ValueKind kind, size_t depth) {
    return LeveledDataEntry{kind, Value(), depth};
}

TEST_CASE("Flat record") {
    auto v = reconcile({key("id", KeyKind::Leaf, 1), key("name", KeyKind::Leaf, 1)},
                       {scalar(1, 1), scalar("a", 1)});
    REQUIRE(v == Value::object({{"id", 1}, {"name", "a"}}));
    REQUIRE(v.keys() == std::vector<std::string>{"id", "name"});
}

TEST_CASE("Field names cycle over repeated records") {
    std::vector<LeveledSchemaEntry> keys = {
        key("users", KeyKind::List, 1),
        key("", KeyKind::Object, 2),
        key("id", KeyKind::Leaf, 3),
        key("name", KeyKind::Leaf, 3),
    };
    std::vector<LeveledDataEntry> values = {
        open_entry(ValueKind::List, 1),
        open_entry(ValueKind::Object, 2), scalar(1, 3), scalar("a", 3),
        open_entry(ValueKind::Object, 2), scalar(2, 3), scalar("b", 3),
        open_entry(ValueKind::Object, 2), scalar(3, 3),
    };
    auto v = reconcile(keys, values);
    const auto& users = v.at("users");
    REQUIRE(users.size() == 3);
    REQUIRE(users.at(1) == Value::object({{"id", 2}, {"name", "b"}}));
    // the short record just lacks the field
    REQUIRE(users.at(2) == Value::object({{"id", 3}}));
}

TEST_CASE("List root") {
    std::vector<LeveledSchemaEntry> keys = {key("", KeyKind::Object, 1), key("x", KeyKind::Leaf, 2)};
    std::vector<LeveledDataEntry> values = {open_entry(ValueKind::Object, 1), scalar(1.5, 2),
                                            open_entry(ValueKind::Object, 1), scalar(-2.5, 2)};
    auto v = reconcile(keys, values, KeyKind::List);
    REQUIRE(v == Value::list({Value::object({{"x", 1.5}}), Value::object({{"x", -2.5}})}));
}

TEST_CASE("Flat list root") {
    auto v = reconcile({}, {scalar(1, 1), scalar("two", 1), scalar(Value(), 1)}, KeyKind::List);
    REQUIRE(v == Value::list({1, "two", Value()}));
}

TEST_CASE("Empty object header ignores the values") {
    auto v = reconcile({}, {scalar(1, 1), scalar(2, 1)});
    REQUIRE(v == Value::object());
}

TEST_CASE("A leaf key may hold a list") {
    auto v = reconcile({key("a", KeyKind::Leaf, 1)},
                       {open_entry(ValueKind::List, 1), scalar(1, 2), scalar(2, 2)});
    REQUIRE(v == Value::object({{"a", Value::list({1, 2})}}));
}

TEST_CASE("Declared composites are checked") {
    SECTION("object field") {
        try {
            reconcile({key("meta", KeyKind::Object, 1)}, {scalar(5, 1)});
            FAIL("expected reconcile to throw");
        } catch (const Error& e) {
            REQUIRE(e.kind == ErrorKind::SchemaMismatch);
            REQUIRE_THAT(e.what(), ContainsSubstring("'meta'"));
            REQUIRE_THAT(e.what(), ContainsSubstring("Object"));
            REQUIRE_THAT(e.what(), ContainsSubstring("Number"));
        }
    }
    SECTION("list element") {
        try {
            reconcile({key("items", KeyKind::List, 1), key("", KeyKind::List, 2)},
                      {open_entry(ValueKind::List, 1), open_entry(ValueKind::List, 2), scalar("x", 2)});
            FAIL("expected reconcile to throw");
        } catch (const Error& e) {
            REQUIRE(e.kind == ErrorKind::SchemaMismatch);
            REQUIRE_THAT(e.what(), ContainsSubstring("'items[]'"));
        }
    }
}

TEST_CASE("Values with no key left are reported") {
    try {
        reconcile({key("a", KeyKind::Leaf, 1)}, {scalar(1, 1), scalar(2, 1), scalar(3, 1)});
        FAIL("expected reconcile to throw");
    } catch (const ExtraValuesError& e) {
        REQUIRE(e.kind == ErrorKind::ExtraValues);
        REQUIRE(e.remaining == 2);
        REQUIRE_THAT(e.what(), ContainsSubstring("2 values"));
    }
}

TEST_CASE("Nested records reset their cursor per instance") {
    // groups[{name,members[{id}]}]
    std::vector<LeveledSchemaEntry> keys = {
        key("groups", KeyKind::List, 1),
        key("", KeyKind::Object, 2),
        key("name", KeyKind::Leaf, 3),
        key("members", KeyKind::List, 3),
        key("", KeyKind::Object, 4),
        key("id", KeyKind::Leaf, 5),
    };
    std::vector<LeveledDataEntry> values = {
        open_entry(ValueKind::List, 1),
        open_entry(ValueKind::Object, 2), scalar("ops", 3), open_entry(ValueKind::List, 3),
        open_entry(ValueKind::Object, 4), scalar(1, 5),
        open_entry(ValueKind::Object, 4), scalar(2, 5),
        open_entry(ValueKind::Object, 2), scalar("dev", 3), open_entry(ValueKind::List, 3),
    };
    auto v = reconcile(keys, values);
    auto expected = Value::object({{"groups", Value::list({
        Value::object({{"name", "ops"},
                       {"members", Value::list({Value::object({{"id", 1}}),
                                                Value::object({{"id", 2}})})}}),
        Value::object({{"name", "dev"}, {"members", Value::list()}}),
    })}});
    REQUIRE(v == expected);
}
