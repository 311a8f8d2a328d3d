#include <hron/reconcile.h>
#include <hron/error.h>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

namespace hron {

namespace {
    constexpr size_t no_shape = std::numeric_limits<size_t>::max();

    // One declared key with the indices of its child keys. Index 0 is the root.
    struct Shape {
        KeyKind kind;
        std::string name;
        std::vector<size_t> children;
    };

    // An open container in the value being built.
    struct Frame {
        size_t depth;
        Value* target;
        size_t shape;
        std::string name;
    };

    ValueKind declared_value_kind(KeyKind kind) {
        return kind == KeyKind::Object ? ValueKind::Object : ValueKind::List;
    }

    class Reconciler {
    public:
        Reconciler(const std::vector<LeveledSchemaEntry>& keys,
                   const std::vector<LeveledDataEntry>& values, KeyKind root)
            : keys_(keys), values_(values) {
            shapes_.push_back(Shape{root, std::string(), {}});
            result_ = root == KeyKind::List ? Value::list() : Value::object();
            build_shapes();
        }

        Value run() {
            if (shapes_[0].kind == KeyKind::Object and keys_.empty()) return std::move(result_);

            frames_.push_back(Frame{0, &result_, 0, std::string()});
            cursor_[1] = 0;

            bool open = consume(1);
            for (auto const& key : keys_) {
                if (not open) break;
                open = consume(key.depth + 1);
            }

            if (next_ < values_.size()) {
                const size_t remaining = values_.size() - next_;
                std::ostringstream msg;
                msg << remaining << (remaining == 1 ? " value" : " values")
                    << " left over with no key to hold "
                    << (remaining == 1 ? "it" : "them");
                throw ExtraValuesError(msg.str(), remaining);
            }
            return std::move(result_);
        }

    private:
        void build_shapes() {
            std::vector<std::pair<size_t, size_t>> open{{0, 0}};  // (depth, shape)
            for (auto const& key : keys_) {
                while (open.size() > 1 and open.back().first >= key.depth) open.pop_back();
                const size_t idx = shapes_.size();
                shapes_.push_back(Shape{key.kind, key.name, {}});
                shapes_[open.back().second].children.push_back(idx);
                if (key.kind != KeyKind::Leaf) open.emplace_back(key.depth, idx);
            }
        }

        // Place values while they are no deeper than `bound`. Returns false
        // when a value has nowhere to go.
        bool consume(size_t bound) {
            while (next_ < values_.size() and values_[next_].depth <= bound) {
                if (not place(values_[next_])) return false;
                ++next_;
            }
            return true;
        }

        bool place(const LeveledDataEntry& entry) {
            while (frames_.size() > 1 and frames_.back().depth >= entry.depth) frames_.pop_back();
            Frame& parent = frames_.back();

            size_t declared = no_shape;
            std::string name;
            if (parent.target->is_list()) {
                if (parent.shape != no_shape and shapes_[parent.shape].kind == KeyKind::List and
                    not shapes_[parent.shape].children.empty())
                    declared = shapes_[parent.shape].children.front();
                name = parent.name + "[]";
            } else {
                if (parent.shape == no_shape or shapes_[parent.shape].kind != KeyKind::Object)
                    return false;
                const auto& fields = shapes_[parent.shape].children;
                size_t& cursor = cursor_[entry.depth];
                if (cursor >= fields.size()) return false;
                declared = fields[cursor++];
                name = shapes_[declared].name;
            }

            if (declared != no_shape and shapes_[declared].kind != KeyKind::Leaf) {
                const ValueKind expected = declared_value_kind(shapes_[declared].kind);
                if (entry.kind != expected) {
                    std::ostringstream msg;
                    msg << "schema mismatch for '" << name << "': declared "
                        << value_kind_name(expected) << " but found "
                        << value_kind_name(entry.kind);
                    throw Error(ErrorKind::SchemaMismatch, msg.str());
                }
            }

            Value* slot = attach(parent, name, make_value(entry));
            if (entry.kind == ValueKind::Object) cursor_[entry.depth + 1] = 0;
            if (entry.kind == ValueKind::Object or entry.kind == ValueKind::List)
                frames_.push_back(Frame{entry.depth, slot, declared, name});
            return true;
        }

        static Value make_value(const LeveledDataEntry& entry) {
            switch (entry.kind) {
                case ValueKind::Object:
                    return Value::object();
                case ValueKind::List:
                    return Value::list();
                case ValueKind::Null:
                    return Value();
                case ValueKind::String:
                case ValueKind::Number:
                case ValueKind::Boolean:
                    return entry.literal;
            }
            return Value();
        }

        // Frames deeper than `parent` are gone by now, so growing its
        // container cannot leave a dangling Frame::target behind.
        static Value* attach(Frame& parent, const std::string& name, Value item) {
            if (parent.target->is_list()) {
                auto& list = parent.target->as_list();
                list.push_back(std::move(item));
                return &list.back();
            }
            Value& slot = parent.target->as_object()[name];
            slot = std::move(item);
            return &slot;
        }

        const std::vector<LeveledSchemaEntry>& keys_;
        const std::vector<LeveledDataEntry>& values_;
        std::vector<Shape> shapes_;
        std::vector<Frame> frames_;
        std::map<size_t, size_t> cursor_;  // depth -> next field index
        size_t next_ = 0;
        Value result_;
    };
}

Value reconcile(const std::vector<LeveledSchemaEntry>& keys,
                const std::vector<LeveledDataEntry>& values, KeyKind root) {
    Reconciler r(keys, values, root);
    return r.run();
}

}  // namespace hron
