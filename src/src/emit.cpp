#include <hron/emit.h>
#include <hron/error.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <cctype>
#include <cmath>
#include <sstream>
#include <vector>

namespace hron {

namespace {
    std::string join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += sep;
            out += parts[i];
        }
        return out;
    }

    std::string schema_of(const Value& value, const std::string& name) {
        switch (value.type()) {
            case Value::Type::Object: {
                std::vector<std::string> fields;
                for (auto const& [key, child] : value.as_object().items()) {
                    if (not is_valid_key(key)) {
                        throw Error(ErrorKind::UndefinedKey,
                                    "cannot write '" + key + "' as a key");
                    }
                    fields.push_back(schema_of(child, key));
                }
                return name + "{" + join(fields, ",") + "}";
            }
            case Value::Type::List: {
                const auto& items = value.as_list();
                if (items.empty()) return name + "[]";
                return name + "[" + schema_of(items.front(), std::string()) + "]";
            }
            case Value::Type::Null:
            case Value::Type::Boolean:
            case Value::Type::Integer:
            case Value::Type::Double:
            case Value::Type::String:
                return name;
        }
        return name;
    }

    std::string quote(const std::string& s) {
        const bool has_single = s.find('\'') != std::string::npos;
        const bool has_double = s.find('"') != std::string::npos;
        if (has_single and has_double) {
            throw Error(ErrorKind::Unrepresentable,
                        "string contains both quote characters: " + s);
        }
        const char q = has_single ? '"' : '\'';
        return q + s + q;
    }

    std::string format_double(double d) {
        if (not std::isfinite(d)) {
            std::ostringstream msg;
            msg << "non-finite number " << d << " has no literal form";
            throw Error(ErrorKind::Unrepresentable, msg.str());
        }
        std::array<char, 512> buf{};
        auto res = std::to_chars(buf.data(), buf.data() + buf.size(), d, std::chars_format::fixed);
        std::string out(buf.data(), res.ptr);
        if (out.find('.') == std::string::npos) out += ".0";
        return out;
    }

    std::string scalar(const Value& value) {
        switch (value.type()) {
            case Value::Type::Null:
                return "null";
            case Value::Type::Boolean:
                return value.as_bool() ? "true" : "false";
            case Value::Type::Integer:
                return std::to_string(value.as_int());
            case Value::Type::Double:
                return format_double(value.as_double());
            case Value::Type::String:
                return quote(value.as_string());
            case Value::Type::List:
            case Value::Type::Object:
                break;
        }
        return std::string();
    }

    std::string render(const Value& value, int indent, int depth) {
        if (not value.is_composite()) return scalar(value);

        const bool is_object = value.is_object();
        const char open = is_object ? '{' : '[';
        const char close = is_object ? '}' : ']';

        std::vector<std::string> parts;
        bool single_composite = false;
        if (is_object) {
            for (auto const& item : value.as_object().items()) {
                parts.push_back(render(item.second, indent, depth + 1));
                single_composite = item.second.is_composite();
            }
        } else {
            for (auto const& item : value.as_list()) {
                parts.push_back(render(item, indent, depth + 1));
                single_composite = item.is_composite();
            }
        }
        if (parts.empty()) return std::string{open, close};

        if (indent < 1 or (parts.size() == 1 and single_composite))
            return open + join(parts, ",") + close;

        const std::string pad(size_t(indent * depth), ' ');
        const std::string close_pad(size_t(indent * std::max(depth - 1, 0)), ' ');
        std::string out(1, open);
        out += "\n";
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += ",\n";
            out += pad + parts[i];
        }
        out += "\n" + close_pad + close;
        return out;
    }

    std::string strip_brackets(const std::string& s) {
        if (s.size() < 2) return s;
        std::string inner = s.substr(1, s.size() - 2);
        size_t b = 0;
        while (b < inner.size() and std::isspace(static_cast<unsigned char>(inner[b]))) ++b;
        size_t e = inner.size();
        while (e > b and std::isspace(static_cast<unsigned char>(inner[e - 1]))) --e;
        return inner.substr(b, e - b);
    }
}

bool is_valid_key(const std::string& name) {
    if (name.empty()) return false;
    if (name == "true" or name == "false" or name == "null") return false;
    const auto c0 = static_cast<unsigned char>(name[0]);
    if (not(std::isalpha(c0) or c0 == '_')) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) or c == '_';
    });
}

std::string emit_schema(const Value& value) { return schema_of(value, std::string()); }

std::string emit_values(const Value& value, int indent) { return render(value, indent, 0); }

std::string compose(const Value& root, const std::string& schema, const std::string& values) {
    if (root.is_object()) return strip_brackets(schema) + ": " + strip_brackets(values);
    if (root.is_list()) return schema + ": " + values;
    throw Error(ErrorKind::Unrepresentable,
                std::string("a document root must be an Object or a List, not ") +
                    Value::type_name(root.type()));
}

}  // namespace hron
