#pragma once

#include <hron/value.h>
#include <string>
#include <vector>

namespace hron {

enum class KeyKind { Object, List, Leaf };
enum class ValueKind { Object, List, String, Number, Boolean, Null };

const char* key_kind_name(KeyKind kind) noexcept;
const char* value_kind_name(ValueKind kind) noexcept;

// A declaration in the header (the part before ':').
struct SchemaNode {
    KeyKind kind = KeyKind::Object;
    std::string name;
    std::vector<SchemaNode> children;

    bool is_composite() const noexcept { return kind != KeyKind::Leaf; }
};

// A value in the body (the part after ':'). Scalars carry `literal`,
// composites carry `children`.
struct DataNode {
    ValueKind kind = ValueKind::Object;
    Value literal;
    std::vector<DataNode> children;

    bool is_composite() const noexcept {
        return kind == ValueKind::Object or kind == ValueKind::List;
    }
};

// Both members are unnamed roots. `header.kind` is Object unless the document
// was written as a single unnamed list such as `[{id}]: [...]`.
struct Document {
    SchemaNode header;
    DataNode body;
};

}  // namespace hron
