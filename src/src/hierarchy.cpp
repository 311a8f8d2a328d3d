#include <hron/hierarchy.h>
#include <utility>

namespace hron {

namespace {
    // Walks `root` without recursion and calls visit(node, depth) for every
    // descendant in pre-order.
    template <typename Node, typename Visit>
    void walk(const Node& root, Visit visit) {
        std::vector<std::pair<const Node*, size_t>> stack;
        for (auto it = root.children.rbegin(); it != root.children.rend(); ++it)
            stack.emplace_back(&*it, 1);

        while (not stack.empty()) {
            auto [node, depth] = stack.back();
            stack.pop_back();
            visit(*node, depth);
            for (auto it = node->children.rbegin(); it != node->children.rend(); ++it)
                stack.emplace_back(&*it, depth + 1);
        }
    }
}

std::vector<LeveledSchemaEntry> flatten(const SchemaNode& root) {
    std::vector<LeveledSchemaEntry> out;
    walk(root, [&](const SchemaNode& node, size_t depth) {
        out.push_back(LeveledSchemaEntry{node.name, node.kind, depth});
    });
    return out;
}

std::vector<LeveledDataEntry> flatten(const DataNode& root) {
    std::vector<LeveledDataEntry> out;
    walk(root, [&](const DataNode& node, size_t depth) {
        out.push_back(LeveledDataEntry{node.kind, node.literal, depth});
    });
    return out;
}

}  // namespace hron
