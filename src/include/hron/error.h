#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace hron {

enum class ErrorKind {
    UnterminatedString,
    UnexpectedCharacter,
    UnexpectedEndOfInput,
    UnexpectedToken,
    SchemaMismatch,
    ExtraValues,
    UndefinedKey,
    DuplicateKey,
    NestingTooDeep,
    Unrepresentable
};

const char* error_kind_name(ErrorKind kind) noexcept;

// Base of every error the codec raises. A call that throws produces no output.
struct Error : public std::runtime_error {
    ErrorKind kind;

    Error(ErrorKind k, const std::string& msg) : std::runtime_error(msg), kind(k) {}
};

// Lexer and parser errors. line/column are 1-based and 0 when unknown.
struct SyntaxError : public Error {
    size_t offset;
    size_t line;
    size_t column;

    SyntaxError(ErrorKind k, const std::string& msg, size_t off, size_t l, size_t c)
        : Error(k, msg), offset(off), line(l), column(c) {}
};

struct ExtraValuesError : public Error {
    size_t remaining;

    ExtraValuesError(const std::string& msg, size_t n)
        : Error(ErrorKind::ExtraValues, msg), remaining(n) {}
};

// Build a SyntaxError for `offset` in `source`. When the source is known the
// message gets the line/column and the offending line with a caret under it.
SyntaxError make_syntax_error(ErrorKind kind, const std::string& base,
                              const std::string& source, size_t offset);

}  // namespace hron
