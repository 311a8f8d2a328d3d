#include <hron/colorize.h>
#include <cctype>
#include <string_view>

namespace hron {

namespace {
    const char* YELLOW = "\033[33m";
    const char* GREEN = "\033[32m";
    const char* MAGENTA = "\033[35m";
    const char* RESET = "\033[0m";

    bool is_word_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) or c == '_';
    }

    bool is_number_char(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) or c == '.' or c == '-';
    }
}

std::string colorize(const std::string& document) {
    std::string out;
    out.reserve(document.size() * 2);
    bool in_header = true;
    size_t i = 0;

    auto paint = [&](const char* color, size_t end) {
        out += color;
        out.append(document, i, end - i);
        out += RESET;
        i = end;
    };

    while (i < document.size()) {
        const char c = document[i];
        if (c == ':' and in_header) {
            in_header = false;
            out.push_back(c);
            ++i;
        } else if (c == '\'' or c == '"') {
            size_t end = document.find(c, i + 1);
            end = end == std::string::npos ? document.size() : end + 1;
            paint(GREEN, end);
        } else if (not in_header and is_number_char(c)) {
            size_t end = i + 1;
            while (end < document.size() and is_number_char(document[end])) ++end;
            paint(MAGENTA, end);
        } else if (is_word_char(c)) {
            size_t end = i;
            while (end < document.size() and is_word_char(document[end])) ++end;
            paint(in_header ? YELLOW : MAGENTA, end);
        } else {
            out.push_back(c);
            ++i;
        }
    }
    return out;
}

std::string strip_ansi(const std::string& text) {
    // only the codes colorize() writes; other escape bytes belong to the text
    const char* codes[] = {YELLOW, GREEN, MAGENTA, RESET};
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool matched = false;
        if (text[i] == '\033') {
            for (const char* code : codes) {
                const std::string_view sv(code);
                if (text.compare(i, sv.size(), sv) == 0) {
                    i += sv.size();
                    matched = true;
                    break;
                }
            }
        }
        if (not matched) out.push_back(text[i++]);
    }
    return out;
}

}  // namespace hron
