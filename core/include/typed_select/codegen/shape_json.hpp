// typed_select/codegen/shape_json.hpp - JSON descriptor for projected shapes
//
// Descriptor layout:
//
//   {"kind": "object", "fields": [
//     {"name": "id", "optional": false, "type": {"kind": "uuid"}},
//     {"name": "summary", "optional": false, "type": {"kind": "string"},
//      "args": {"kind": "object", "fields": [...]}}]}
//   {"kind": "array", "element": {...}}
//   {"kind": "nullable", "base": {...}}
//   {"kind": "literal", "values": ["a", "b"]}
//   {"kind": "union", "alternatives": [...]}
//
#pragma once

#include <nlohmann/json.hpp>

#include "typed_select/schema/type.hpp"

namespace typed_select
{

/**
 * Serialize a shape to its JSON descriptor.
 *
 * Calculation arguments carried on object members are included under
 * "args"; they are not part of the data type itself.
 */
[[nodiscard]] nlohmann::json to_json(const Type * shape);

}  // namespace typed_select
