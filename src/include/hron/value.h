// hron::Value - the native value a HRON document decodes to
#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hron {

struct Object;  // forward

struct Value {
    enum class Type { Null, Boolean, Integer, Double, String, List, Object };

    using list_t = std::vector<Value>;
    using object_ptr = std::shared_ptr<hron::Object>;
    using key_type = std::string;

    std::variant<std::monostate, bool, int64_t, double, std::string, list_t, object_ptr> v;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : v(b) {}
    Value(int64_t x) : v(x) {}
    Value(int x) : v(int64_t(x)) {}
    Value(double x) : v(x) {}
    Value(const char* s) : v(std::string(s)) {}
    Value(const std::string& s) : v(s) {}
    Value(std::string&& s) : v(std::move(s)) {}
    Value(const list_t& l) : v(l) {}
    Value(list_t&& l) : v(std::move(l)) {}
    Value(const hron::Object& o);
    Value(hron::Object&& o);

    // Copies are deep: two Values never share an Object.
    Value(const Value& other);
    Value(Value&& other) noexcept = default;
    Value& operator=(const Value& other);
    Value& operator=(Value&& other) noexcept = default;
    ~Value() = default;

    static Value null() { return Value(); }
    static Value list() { return Value(list_t{}); }
    static Value object();
    static Value list(std::initializer_list<Value> items) { return Value(list_t(items)); }
    static Value object(std::initializer_list<std::pair<key_type, Value>> fields);

    Type type() const noexcept;
    static const char* type_name(Type t) noexcept;

    bool is_null() const noexcept { return std::holds_alternative<std::monostate>(v); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(v); }
    bool is_int() const noexcept { return std::holds_alternative<int64_t>(v); }
    bool is_double() const noexcept { return std::holds_alternative<double>(v); }
    bool is_number() const noexcept { return is_int() or is_double(); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_list() const noexcept { return std::holds_alternative<list_t>(v); }
    bool is_object() const noexcept { return std::holds_alternative<object_ptr>(v); }
    bool is_composite() const noexcept { return is_list() or is_object(); }

    bool as_bool() const { return std::get<bool>(v); }
    int64_t as_int() const { return std::get<int64_t>(v); }
    double as_double() const;
    const std::string& as_string() const { return std::get<std::string>(v); }
    const list_t& as_list() const { return std::get<list_t>(v); }
    list_t& as_list() { return std::get<list_t>(v); }
    const hron::Object& as_object() const;
    hron::Object& as_object();

    // Object access. operator[] turns a non-object into an empty object first.
    Value& operator[](const key_type& k);
    const Value& at(const key_type& k) const;
    Value& at(const key_type& k);
    bool has(const key_type& k) const;
    std::vector<key_type> keys() const;

    // List access. push_back turns a non-list into an empty list first.
    const Value& at(size_t idx) const;
    Value& at(size_t idx);
    void push_back(Value item);

    size_t size() const noexcept;
    bool empty() const noexcept;

    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

    // Short single-line debug form; use dump_json for interchange.
    std::string to_string() const;
};

// Insertion-ordered mapping of field name to Value.
struct Object {
    using key_type = std::string;
    using entry_type = std::pair<key_type, Value>;

    std::vector<entry_type> entries;

    Object() = default;
    Object(std::initializer_list<entry_type> init);

    Value& operator[](const key_type& k);
    const Value& at(const key_type& k) const;
    Value& at(const key_type& k);

    bool has(const key_type& k) const noexcept { return find(k) != nullptr; }
    bool erase(const key_type& k);
    size_t size() const noexcept { return entries.size(); }
    bool empty() const noexcept { return entries.empty(); }

    std::vector<key_type> keys() const;
    const std::vector<entry_type>& items() const noexcept { return entries; }

    const Value* find(const key_type& k) const noexcept;
    Value* find(const key_type& k) noexcept;

    // Key order does not take part in equality.
    bool operator==(const Object& rhs) const;
    bool operator!=(const Object& rhs) const { return not(*this == rhs); }
};

std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace hron
