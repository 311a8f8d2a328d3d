#pragma once

#include <hron/value.h>
#include <string>
#include <vector>

namespace hron {

enum class TokenKind { Identifier, Number, String, Boolean, Null, Symbol };

const char* token_kind_name(TokenKind kind) noexcept;

struct Token {
    TokenKind kind;
    // Identifier/Symbol/String: the text. Number: Integer or Double.
    // Boolean: bool. Null: null.
    Value literal;
    size_t offset = 0;

    bool is_symbol(char c) const {
        return kind == TokenKind::Symbol and literal.as_string().size() == 1 and
               literal.as_string()[0] == c;
    }
};

// Split HRON text into tokens. Whitespace and '#' comments are dropped.
// Throws SyntaxError (UnterminatedString, UnexpectedCharacter).
std::vector<Token> tokenize(const std::string& text);

}  // namespace hron
