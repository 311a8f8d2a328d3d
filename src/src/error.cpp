#include <hron/error.h>
#include <sstream>
#include <utility>

namespace hron {

namespace {
    std::pair<size_t, size_t> line_col_from_index(const std::string& s, size_t idx) {
        size_t line = 1;
        size_t col = 1;
        for (size_t pos = 0; pos < idx and pos < s.size(); ++pos) {
            if (s[pos] == '\n') {
                ++line;
                col = 1;
            } else {
                ++col;
            }
        }
        return {line, col};
    }
}

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnterminatedString:
            return "UnterminatedString";
        case ErrorKind::UnexpectedCharacter:
            return "UnexpectedCharacter";
        case ErrorKind::UnexpectedEndOfInput:
            return "UnexpectedEndOfInput";
        case ErrorKind::UnexpectedToken:
            return "UnexpectedToken";
        case ErrorKind::SchemaMismatch:
            return "SchemaMismatch";
        case ErrorKind::ExtraValues:
            return "ExtraValues";
        case ErrorKind::UndefinedKey:
            return "UndefinedKey";
        case ErrorKind::DuplicateKey:
            return "DuplicateKey";
        case ErrorKind::NestingTooDeep:
            return "NestingTooDeep";
        case ErrorKind::Unrepresentable:
            return "Unrepresentable";
    }
    return "Unknown";
}

SyntaxError make_syntax_error(ErrorKind kind, const std::string& base,
                              const std::string& source, size_t offset) {
    if (source.empty()) {
        std::ostringstream ss;
        ss << base << " (offset " << offset << ")";
        return SyntaxError(kind, ss.str(), offset, 0, 0);
    }

    auto [line, col] = line_col_from_index(source, offset);

    size_t line_start = offset < source.size() ? offset : source.size();
    while (line_start > 0 and source[line_start - 1] != '\n') --line_start;
    size_t line_end = line_start;
    while (line_end < source.size() and source[line_end] != '\n') ++line_end;
    std::string line_text = source.substr(line_start, line_end - line_start);
    if (not line_text.empty() and line_text.back() == '\r') line_text.pop_back();

    size_t caret_pos = col - 1;
    if (caret_pos > line_text.size()) caret_pos = line_text.size();
    std::string caret(caret_pos, ' ');
    caret.push_back('^');

    std::ostringstream ss;
    ss << base << " (line " << line << ", column " << col << ")\n";
    ss << line_text << "\n" << caret;
    return SyntaxError(kind, ss.str(), offset, line, col);
}

}  // namespace hron
