#pragma once

#include <hron/hierarchy.h>
#include <hron/value.h>
#include <vector>

namespace hron {

// Merge a flattened header and a flattened body into a native value.
//
// `root` is the kind of the (implicit) depth-0 container. Object fields are
// named by cycling through the field list of the Object key that governs
// them, so one declaration names every repeated instance in the data.
//
// Throws Error(SchemaMismatch) when a value's kind disagrees with a declared
// Object or List, and ExtraValuesError when values are left that no key can
// place.
Value reconcile(const std::vector<LeveledSchemaEntry>& keys,
                const std::vector<LeveledDataEntry>& values, KeyKind root = KeyKind::Object);

}  // namespace hron
