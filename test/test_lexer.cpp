#include <catch2/catch_all.hpp>
#include <hron/error.h>
#include <hron/lexer.h>

using namespace hron;
using Catch::Matchers::ContainsSubstring;

static std::vector<TokenKind> kinds(const std::vector<Token>& tokens) {
    std::vector<TokenKind> out;
    for (auto const& t : tokens) out.push_back(t.kind);
    return out;
}

TEST_CASE("Tokenize a small document") {
    auto tokens = tokenize("users[{id}]: [{1}]");
    REQUIRE(tokens.size() == 12);
    REQUIRE(tokens[0].kind == TokenKind::Identifier);
    REQUIRE(tokens[0].literal.as_string() == "users");
    REQUIRE(tokens[1].is_symbol('['));
    REQUIRE(tokens[3].literal.as_string() == "id");
    REQUIRE(tokens[6].is_symbol(':'));
    REQUIRE(tokens[6].offset == 11);
    REQUIRE(tokens[9].kind == TokenKind::Number);
    REQUIRE(tokens[9].literal.as_int() == 1);
}

TEST_CASE("Whitespace and comments are skipped") {
    auto tokens = tokenize("  # header comment\n a ,\t b # trailing\r\n:");
    REQUIRE(kinds(tokens) == std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Symbol,
                                                    TokenKind::Identifier, TokenKind::Symbol});
    REQUIRE(tokens.back().is_symbol(':'));
}

TEST_CASE("Strings use either quote and keep backslashes") {
    auto tokens = tokenize(R"('single' "it's" 'a\nb' '')");
    REQUIRE(tokens.size() == 4);
    REQUIRE(tokens[0].literal.as_string() == "single");
    REQUIRE(tokens[1].literal.as_string() == "it's");
    REQUIRE(tokens[2].literal.as_string() == "a\\nb");
    REQUIRE(tokens[3].literal.as_string().empty());
}

TEST_CASE("Numbers") {
    SECTION("integers and doubles") {
        auto tokens = tokenize("42 3.25 -7 -0.5");
        REQUIRE(tokens[0].literal == Value(42));
        REQUIRE(tokens[1].literal == Value(3.25));
        REQUIRE(tokens[2].literal == Value(-7));
        REQUIRE(tokens[3].literal == Value(-0.5));
    }
    SECTION("integers too wide for 64 bits become doubles") {
        auto tokens = tokenize("123456789012345678901234");
        REQUIRE(tokens[0].literal.is_double());
        REQUIRE(tokens[0].literal.as_double() == Catch::Approx(1.23456789012345678901234e23));
    }
    SECTION("a second decimal point is rejected") {
        try {
            tokenize("1.2.3");
            FAIL("expected tokenize to throw");
        } catch (const SyntaxError& e) {
            REQUIRE(e.kind == ErrorKind::UnexpectedCharacter);
            REQUIRE(e.offset == 3);
        }
    }
    SECTION("a leading dot is a symbol") {
        auto tokens = tokenize(".5");
        REQUIRE(tokens.size() == 2);
        REQUIRE(tokens[0].is_symbol('.'));
        REQUIRE(tokens[1].literal == Value(5));
    }
}

TEST_CASE("Keywords") {
    auto tokens = tokenize("true false null truthy");
    REQUIRE(tokens[0].kind == TokenKind::Boolean);
    REQUIRE(tokens[0].literal.as_bool());
    REQUIRE(tokens[1].kind == TokenKind::Boolean);
    REQUIRE_FALSE(tokens[1].literal.as_bool());
    REQUIRE(tokens[2].kind == TokenKind::Null);
    REQUIRE(tokens[3].kind == TokenKind::Identifier);
}

TEST_CASE("Unterminated string") {
    try {
        tokenize("{a}:\n{'open}");
        FAIL("expected tokenize to throw");
    } catch (const SyntaxError& e) {
        REQUIRE(e.kind == ErrorKind::UnterminatedString);
        REQUIRE(e.offset == 6);
        REQUIRE(e.line == 2);
        REQUIRE(e.column == 2);
    }
}

TEST_CASE("Unexpected character") {
    try {
        tokenize("{a}: {1 @}");
        FAIL("expected tokenize to throw");
    } catch (const SyntaxError& e) {
        REQUIRE(e.kind == ErrorKind::UnexpectedCharacter);
        REQUIRE_THAT(e.what(), ContainsSubstring("'@'"));
        REQUIRE_THAT(e.what(), ContainsSubstring("offset 8"));
        REQUIRE(e.column == 9);
    }
    REQUIRE_THROWS_AS(tokenize("- 1"), SyntaxError);
}
