#pragma once

#include <hron/ast.h>
#include <string>
#include <vector>

namespace hron {

struct LeveledSchemaEntry {
    std::string name;
    KeyKind kind = KeyKind::Leaf;
    size_t depth = 0;
};

struct LeveledDataEntry {
    ValueKind kind = ValueKind::Null;
    Value literal;
    size_t depth = 0;
};

// Pre-order flattening of a tree. The root itself is not emitted; its
// children are depth 1.
std::vector<LeveledSchemaEntry> flatten(const SchemaNode& root);
std::vector<LeveledDataEntry> flatten(const DataNode& root);

}  // namespace hron
