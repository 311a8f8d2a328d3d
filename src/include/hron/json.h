#pragma once

#include <hron/value.h>
#include <stdexcept>
#include <string>

namespace hron {

struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c)
        : std::runtime_error(msg), line(l), col(c) {}
};

// JSON reader used by the CLI. Accepts // and /* */ comments, keeps object
// key order and rejects duplicate keys.
Value parse_json(const std::string& text);

// indent == 0 gives a single line.
std::string dump_json(const Value& value, int indent = 2);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

}  // namespace hron
