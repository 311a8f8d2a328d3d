#include <hron/json.h>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace hron {

namespace {
    std::string escape_json_string(const std::string& s) {
        std::string result;
        result.reserve(s.size() + 2);
        result.push_back('"');
        for (char c : s) {
            switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        result += buf;
                    } else {
                        result.push_back(c);
                    }
                    break;
            }
        }
        result.push_back('"');
        return result;
    }

    // Shortest form that reads back as the same double, and still reads back
    // as a double.
    std::string format_double(double d) {
        if (not std::isfinite(d)) return "null";
        std::array<char, 64> buf{};
        auto res = std::to_chars(buf.data(), buf.data() + buf.size(), d);
        std::string out(buf.data(), res.ptr);
        if (out.find_first_of(".e") == std::string::npos) out += ".0";
        return out;
    }

    void dump_value(const Value& val, int indent, int level, std::ostringstream& out) {
        const bool pretty = indent > 0;
        const std::string pad(static_cast<size_t>(pretty ? level + indent : 0), ' ');
        const std::string close_pad(static_cast<size_t>(pretty ? level : 0), ' ');

        switch (val.type()) {
            case Value::Type::Null:
                out << "null";
                return;
            case Value::Type::Boolean:
                out << (val.as_bool() ? "true" : "false");
                return;
            case Value::Type::Integer:
                out << val.as_int();
                return;
            case Value::Type::Double:
                out << format_double(val.as_double());
                return;
            case Value::Type::String:
                out << escape_json_string(val.as_string());
                return;
            case Value::Type::List: {
                const auto& L = val.as_list();
                if (L.empty()) {
                    out << "[]";
                    return;
                }
                out << '[' << (pretty ? "\n" : "");
                for (size_t i = 0; i < L.size(); ++i) {
                    out << pad;
                    dump_value(L[i], indent, level + indent, out);
                    if (i + 1 < L.size()) out << ",";
                    if (pretty) out << "\n";
                }
                out << close_pad << ']';
                return;
            }
            case Value::Type::Object: {
                const auto& items = val.as_object().items();
                if (items.empty()) {
                    out << "{}";
                    return;
                }
                out << '{' << (pretty ? "\n" : "");
                for (size_t i = 0; i < items.size(); ++i) {
                    out << pad << escape_json_string(items[i].first) << (pretty ? ": " : ":");
                    dump_value(items[i].second, indent, level + indent, out);
                    if (i + 1 < items.size()) out << ",";
                    if (pretty) out << "\n";
                }
                out << close_pad << '}';
                return;
            }
        }
    }
}

std::string dump_json(const Value& value, int indent) {
    std::ostringstream out;
    dump_value(value, indent, 0, out);
    return out.str();
}

}  // namespace hron
