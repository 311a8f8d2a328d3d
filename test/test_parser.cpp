#include <catch2/catch_all.hpp>
#include <hron/parser.h>

using namespace hron;

static Document parse_document(const std::string& text, const ParseOptions& options = {}) {
    auto tokens = tokenize(text);
    Parser parser(tokens, options, text);
    return parser.parse();
}

static ErrorKind parse_error_kind(const std::string& text, const ParseOptions& options = {}) {
    try {
        parse_document(text, options);
    } catch (const Error& e) {
        return e.kind;
    }
    FAIL("expected parse to throw: " << text);
    return ErrorKind::Unrepresentable;
}

TEST_CASE("Named list of records") {
    auto doc = parse_document("users[{id,name}]: [{1,'a'},{2,'b'}]");

    REQUIRE(doc.header.kind == KeyKind::Object);
    REQUIRE(doc.header.children.size() == 1);
    const auto& users = doc.header.children[0];
    REQUIRE(users.name == "users");
    REQUIRE(users.kind == KeyKind::List);
    REQUIRE(users.children.size() == 1);
    REQUIRE(users.children[0].kind == KeyKind::Object);
    REQUIRE(users.children[0].name.empty());
    REQUIRE(users.children[0].children.size() == 2);
    REQUIRE(users.children[0].children[1].name == "name");
    REQUIRE(users.children[0].children[1].kind == KeyKind::Leaf);

    REQUIRE(doc.body.kind == ValueKind::Object);
    REQUIRE(doc.body.children.size() == 1);
    const auto& list = doc.body.children[0];
    REQUIRE(list.kind == ValueKind::List);
    REQUIRE(list.children.size() == 2);
    REQUIRE(list.children[1].children[1].kind == ValueKind::String);
    REQUIRE(list.children[1].children[1].literal.as_string() == "b");
}

TEST_CASE("A single unnamed bracket is the root") {
    SECTION("object") {
        auto doc = parse_document("{a,b}: {1,true}");
        REQUIRE(doc.header.kind == KeyKind::Object);
        REQUIRE(doc.header.children.size() == 2);
        REQUIRE(doc.body.kind == ValueKind::Object);
        REQUIRE(doc.body.children.size() == 2);
        REQUIRE(doc.body.children[1].kind == ValueKind::Boolean);
    }
    SECTION("list") {
        auto doc = parse_document("[]: [1, null]");
        REQUIRE(doc.header.kind == KeyKind::List);
        REQUIRE(doc.header.children.empty());
        REQUIRE(doc.body.kind == ValueKind::List);
        REQUIRE(doc.body.children[1].kind == ValueKind::Null);
    }
    SECTION("scalar body") {
        auto doc = parse_document("{a}: 5");
        REQUIRE(doc.body.kind == ValueKind::Number);
    }
}

TEST_CASE("Several top-level keys") {
    auto doc = parse_document("name, tags[], size: 'x', ['a'], 3");
    REQUIRE(doc.header.kind == KeyKind::Object);
    REQUIRE(doc.header.children.size() == 3);
    REQUIRE(doc.header.children[1].kind == KeyKind::List);
    REQUIRE(doc.body.children.size() == 3);
    REQUIRE(doc.body.children[2].literal == Value(3));
}

TEST_CASE("Empty header and body") {
    auto doc = parse_document(":");
    REQUIRE(doc.header.kind == KeyKind::Object);
    REQUIRE(doc.header.children.empty());
    REQUIRE(doc.body.children.empty());
}

TEST_CASE("Trailing commas are tolerated") {
    auto doc = parse_document("{a,b,}: {1,2,}");
    REQUIRE(doc.header.children.size() == 2);
    REQUIRE(doc.body.children.size() == 2);

    auto top = parse_document("a, b,: 1, 2,");
    REQUIRE(top.header.children.size() == 2);
    REQUIRE(top.body.children.size() == 2);

    auto root = parse_document("{a}: {1},");
    REQUIRE(root.body.kind == ValueKind::Object);
    REQUIRE(root.body.children.size() == 1);
    REQUIRE(parse_document("[]: [1, 2],").body.children.size() == 2);
    REQUIRE(parse_error_kind("{a}: {1},,") == ErrorKind::UnexpectedToken);
}

TEST_CASE("Structural errors") {
    REQUIRE(parse_error_kind("{a b}: {1, 2}") == ErrorKind::UnexpectedToken);
    REQUIRE(parse_error_kind("{a}: {1 2}") == ErrorKind::UnexpectedToken);
    REQUIRE(parse_error_kind("{a}") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(parse_error_kind("{a}:") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(parse_error_kind("{a}: {1") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(parse_error_kind("{a}: {1}, {2}") == ErrorKind::UnexpectedToken);
    REQUIRE(parse_error_kind("{a}: {1}}") == ErrorKind::UnexpectedToken);
    REQUIRE(parse_error_kind("a.b: 1") == ErrorKind::UnexpectedToken);
    REQUIRE(parse_error_kind("'a': 1") == ErrorKind::UnexpectedToken);
    REQUIRE(parse_error_kind("a: 1 . 2") == ErrorKind::UnexpectedToken);
}

TEST_CASE("Values must be literals or brackets") {
    try {
        parse_document("{a}: {bare}");
        FAIL("expected parse to throw");
    } catch (const SyntaxError& e) {
        REQUIRE(e.kind == ErrorKind::UnexpectedToken);
        REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("quoted"));
        REQUIRE(e.offset == 6);
    }
}

TEST_CASE("Object fields must be named and unique") {
    REQUIRE(parse_error_kind("{a, a}: {1, 2}") == ErrorKind::DuplicateKey);
    REQUIRE(parse_error_kind("a, a: 1, 2") == ErrorKind::DuplicateKey);
    REQUIRE(parse_error_kind("x{a, b{c}, a}: {1, {2}, 3}") == ErrorKind::DuplicateKey);
    REQUIRE(parse_error_kind("{a, {b}}: {1, {2}}") == ErrorKind::UnexpectedToken);
    REQUIRE(parse_error_kind("{a}, b: {1}, 2") == ErrorKind::UnexpectedToken);

    // the same name in different objects is fine
    auto doc = parse_document("a{id}, b{id}: {1}, {2}");
    REQUIRE(doc.header.children.size() == 2);
}

TEST_CASE("Nesting depth is bounded") {
    ParseOptions options;
    options.max_depth = 3;
    REQUIRE_NOTHROW(parse_document("a[[[]]]: [[[]]]", options));
    REQUIRE(parse_error_kind("a[[[[]]]]: []", options) == ErrorKind::NestingTooDeep);
    REQUIRE(parse_error_kind("a[]: [[[[1]]]]", options) == ErrorKind::NestingTooDeep);

    std::string deep(2000, '[');
    REQUIRE(parse_error_kind("a: " + deep) == ErrorKind::NestingTooDeep);
}
