#include <hron/value.h>
#include <hron/json.h>
#include <algorithm>
#include <stdexcept>

namespace hron {

Value::Value(const hron::Object& o) : v(std::make_shared<hron::Object>(o)) {}
Value::Value(hron::Object&& o) : v(std::make_shared<hron::Object>(std::move(o))) {}

Value::Value(const Value& other) : v(other.v) {
    // the variant copy duplicated the pointer, not the object behind it
    if (auto* p = std::get_if<object_ptr>(&v)) {
        if (*p) *p = std::make_shared<hron::Object>(**p);
    }
}

Value& Value::operator=(const Value& other) {
    if (this == &other) return *this;
    // copy first so assigning from one of our own children is safe
    Value tmp(other);
    v = std::move(tmp.v);
    return *this;
}

Value Value::object() { return Value(hron::Object{}); }

Value Value::object(std::initializer_list<std::pair<key_type, Value>> fields) {
    hron::Object o;
    for (auto const& f : fields) o[f.first] = f.second;
    return Value(std::move(o));
}

Value::Type Value::type() const noexcept {
    switch (v.index()) {
        case 0:
            return Type::Null;
        case 1:
            return Type::Boolean;
        case 2:
            return Type::Integer;
        case 3:
            return Type::Double;
        case 4:
            return Type::String;
        case 5:
            return Type::List;
        default:
            return Type::Object;
    }
}

const char* Value::type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:
            return "Null";
        case Type::Boolean:
            return "Boolean";
        case Type::Integer:
            return "Integer";
        case Type::Double:
            return "Double";
        case Type::String:
            return "String";
        case Type::List:
            return "List";
        case Type::Object:
            return "Object";
    }
    return "Unknown";
}

double Value::as_double() const {
    if (is_int()) return static_cast<double>(as_int());
    return std::get<double>(v);
}

const hron::Object& Value::as_object() const {
    const auto& p = std::get<object_ptr>(v);
    if (not p) throw std::runtime_error("null object pointer");
    return *p;
}

hron::Object& Value::as_object() {
    auto& p = std::get<object_ptr>(v);
    if (not p) p = std::make_shared<hron::Object>();
    return *p;
}

Value& Value::operator[](const key_type& k) {
    if (not is_object()) v = std::make_shared<hron::Object>();
    return as_object()[k];
}

const Value& Value::at(const key_type& k) const {
    if (not is_object()) throw std::out_of_range("not an object");
    return as_object().at(k);
}

Value& Value::at(const key_type& k) {
    if (not is_object()) throw std::out_of_range("not an object");
    return as_object().at(k);
}

bool Value::has(const key_type& k) const {
    return is_object() and as_object().has(k);
}

std::vector<Value::key_type> Value::keys() const {
    if (not is_object()) throw std::runtime_error("not an object");
    return as_object().keys();
}

const Value& Value::at(size_t idx) const {
    if (not is_list()) throw std::out_of_range("not a list");
    const auto& L = as_list();
    if (idx >= L.size()) throw std::out_of_range("index out of range");
    return L[idx];
}

Value& Value::at(size_t idx) {
    if (not is_list()) throw std::out_of_range("not a list");
    auto& L = as_list();
    if (idx >= L.size()) throw std::out_of_range("index out of range");
    return L[idx];
}

void Value::push_back(Value item) {
    if (not is_list()) v = list_t{};
    as_list().push_back(std::move(item));
}

size_t Value::size() const noexcept {
    if (is_list()) return std::get<list_t>(v).size();
    if (is_object()) {
        const auto& p = std::get<object_ptr>(v);
        return p ? p->size() : 0;
    }
    return 0;
}

bool Value::empty() const noexcept { return size() == 0; }

bool Value::operator==(const Value& rhs) const {
    if (type() != rhs.type()) return false;
    switch (type()) {
        case Type::Null:
            return true;
        case Type::Boolean:
            return as_bool() == rhs.as_bool();
        case Type::Integer:
            return as_int() == rhs.as_int();
        case Type::Double:
            return std::get<double>(v) == std::get<double>(rhs.v);
        case Type::String:
            return as_string() == rhs.as_string();
        case Type::List:
            return as_list() == rhs.as_list();
        case Type::Object: {
            const auto& a = std::get<object_ptr>(v);
            const auto& b = std::get<object_ptr>(rhs.v);
            if (not a or not b) return a == b;
            return *a == *b;
        }
    }
    return false;
}

std::string Value::to_string() const { return dump_json(*this, 0); }

Object::Object(std::initializer_list<entry_type> init) {
    for (auto const& e : init) (*this)[e.first] = e.second;
}

Value& Object::operator[](const key_type& k) {
    if (Value* found = find(k)) return *found;
    entries.emplace_back(k, Value());
    return entries.back().second;
}

const Value& Object::at(const key_type& k) const {
    if (const Value* found = find(k)) return *found;
    throw std::out_of_range("key not found: '" + k + "'");
}

Value& Object::at(const key_type& k) {
    if (Value* found = find(k)) return *found;
    throw std::out_of_range("key not found: '" + k + "'");
}

bool Object::erase(const key_type& k) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const entry_type& e) { return e.first == k; });
    if (it == entries.end()) return false;
    entries.erase(it);
    return true;
}

std::vector<Object::key_type> Object::keys() const {
    std::vector<key_type> out;
    out.reserve(entries.size());
    for (auto const& e : entries) out.push_back(e.first);
    return out;
}

const Value* Object::find(const key_type& k) const noexcept {
    for (auto const& e : entries)
        if (e.first == k) return &e.second;
    return nullptr;
}

Value* Object::find(const key_type& k) noexcept {
    for (auto& e : entries)
        if (e.first == k) return &e.second;
    return nullptr;
}

bool Object::operator==(const Object& rhs) const {
    if (size() != rhs.size()) return false;
    for (auto const& e : entries) {
        const Value* other = rhs.find(e.first);
        if (other == nullptr or *other != e.second) return false;
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    os << value.to_string();
    return os;
}

}  // namespace hron
