#pragma once

#include <hron/value.h>
#include <string>

namespace hron {

// Key declarations for `value`, e.g. `{users[{id,name}],tags[]}`. Element 0
// stands in for every element of a list. Throws Error(UndefinedKey) for a
// field name that cannot be written as a key.
std::string emit_schema(const Value& value);

// The full value tree, e.g. `{[{1,'a'},{2,'b'}],['x']}`. indent < 1 keeps
// everything on one line. Throws Error(Unrepresentable).
std::string emit_values(const Value& value, int indent = 2);

// Join the two halves into a document. Object roots lose their outer
// brackets, list roots keep them. Scalar roots are Unrepresentable.
std::string compose(const Value& root, const std::string& schema, const std::string& values);

bool is_valid_key(const std::string& name);

}  // namespace hron
