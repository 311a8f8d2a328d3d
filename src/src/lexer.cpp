#include <hron/lexer.h>
#include <hron/error.h>
#include <cctype>
#include <sstream>

namespace hron {

namespace {
    bool is_symbol_char(char c) {
        switch (c) {
            case '{':
            case '}':
            case '[':
            case ']':
            case ',':
            case '.':
            case ':':
                return true;
            default:
                return false;
        }
    }

    bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

    bool is_ident_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) or c == '_';
    }

    bool is_ident_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) or c == '_';
    }

    struct Lexer {
        const std::string& s;
        size_t i = 0;
        std::vector<Token> out;

        explicit Lexer(const std::string& str) : s(str) {}

        char peek(size_t ahead = 0) const {
            return i + ahead < s.size() ? s[i + ahead] : '\0';
        }

        void emit(TokenKind kind, Value literal, size_t start) {
            out.push_back(Token{kind, std::move(literal), start});
        }

        void skip_comment() {
            while (i < s.size() and s[i] != '\n') ++i;
        }

        void lex_string() {
            const char quote = s[i];
            const size_t start = i;
            size_t end = s.find(quote, start + 1);
            if (end == std::string::npos) {
                throw make_syntax_error(ErrorKind::UnterminatedString,
                                        "unterminated string", s, start);
            }
            emit(TokenKind::String, s.substr(start + 1, end - start - 1), start);
            i = end + 1;
        }

        void lex_number() {
            const size_t start = i;
            if (peek() == '-') ++i;
            size_t dots = 0;
            while (i < s.size() and (is_digit(s[i]) or s[i] == '.')) {
                if (s[i] == '.' and ++dots > 1) {
                    throw make_syntax_error(ErrorKind::UnexpectedCharacter,
                                            "unexpected character '.' in number", s, i);
                }
                ++i;
            }
            std::string run = s.substr(start, i - start);
            if (dots == 0) {
                std::istringstream ss(run);
                int64_t n;
                if (ss >> n and ss.peek() == std::char_traits<char>::eof()) {
                    emit(TokenKind::Number, n, start);
                    return;
                }
                // too wide for 64 bits; keep it as a double
            }
            std::istringstream ss(run);
            double d;
            if (not(ss >> d)) {
                throw make_syntax_error(ErrorKind::UnexpectedCharacter,
                                        "invalid number '" + run + "'", s, start);
            }
            emit(TokenKind::Number, d, start);
        }

        void lex_word() {
            const size_t start = i;
            while (i < s.size() and is_ident_char(s[i])) ++i;
            std::string word = s.substr(start, i - start);
            if (word == "true")
                emit(TokenKind::Boolean, true, start);
            else if (word == "false")
                emit(TokenKind::Boolean, false, start);
            else if (word == "null")
                emit(TokenKind::Null, Value(), start);
            else
                emit(TokenKind::Identifier, std::move(word), start);
        }

        std::vector<Token> run() {
            while (i < s.size()) {
                const char c = s[i];
                if (c == ' ' or c == '\t' or c == '\r' or c == '\n') {
                    ++i;
                    continue;
                }
                if (c == '#') {
                    skip_comment();
                    continue;
                }
                if (is_symbol_char(c)) {
                    emit(TokenKind::Symbol, std::string(1, c), i);
                    ++i;
                    continue;
                }
                if (c == '\'' or c == '"') {
                    lex_string();
                    continue;
                }
                if (is_digit(c) or (c == '-' and is_digit(peek(1)))) {
                    lex_number();
                    continue;
                }
                if (is_ident_start(c)) {
                    lex_word();
                    continue;
                }
                std::ostringstream msg;
                msg << "unexpected character '" << c << "' at offset " << i;
                throw make_syntax_error(ErrorKind::UnexpectedCharacter, msg.str(), s, i);
            }
            return std::move(out);
        }
    };
}

const char* token_kind_name(TokenKind kind) noexcept {
    switch (kind) {
        case TokenKind::Identifier:
            return "Identifier";
        case TokenKind::Number:
            return "Number";
        case TokenKind::String:
            return "String";
        case TokenKind::Boolean:
            return "Boolean";
        case TokenKind::Null:
            return "Null";
        case TokenKind::Symbol:
            return "Symbol";
    }
    return "Unknown";
}

std::vector<Token> tokenize(const std::string& text) {
    Lexer lexer(text);
    return lexer.run();
}

}  // namespace hron
