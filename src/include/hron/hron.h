#pragma once

#include <hron/error.h>
#include <hron/parser.h>
#include <hron/value.h>
#include <string>

namespace hron {

struct StringifyOptions {
    // Spaces per nesting level; 0 puts the whole document on one line.
    int indent = 2;
    // Decorate the output with ANSI colors.
    bool colorize = false;
};

// Decode a HRON document. Each call is self-contained.
// When `options.verbose` is true, the size of every stage is printed to
// std::cerr.
Value parse(const std::string& text, const ParseOptions& options = {});

// Encode an Object or List value as a HRON document.
std::string stringify(const Value& value, const StringifyOptions& options = {});

namespace literals {
    inline Value operator"" _hron(const char* s, std::size_t len) {
        return parse(std::string(s, len));
    }
}

}  // namespace hron
