// typed_select/schema/schema_loader.hpp - Build a registry from a JSON schema dump
//
// The reflection layer that introspects a backend writes its TypedEntity
// graph as JSON:
//
//   {
//     "entities": [
//       { "name": "Todo", "kind": "resource",
//         "primitives": [ { "name": "id", "type": "uuid" },
//                         { "name": "status", "type": "enum", "values": ["open", "done"] } ],
//         "fields": [ { "name": "author", "category": "relationship",
//                       "target": "User", "nullable": true } ] },
//       { "name": "Content", "kind": "union", "tag_field": "type",
//         "variants": [ { "tag": "text", "entity": "TextContent" },
//                       { "tag": "note", "type": "string" } ] }
//     ],
//     "actions": [ { "name": "listTodos", "entity": "Todo", "kind": "read",
//                    "pagination": { "offset": true, "keyset": true } } ]
//   }
//
#pragma once

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

#include "typed_select/basic/diagnostic.hpp"
#include "typed_select/basic/selection_path.hpp"
#include "typed_select/schema/entity_registry.hpp"

namespace typed_select
{

/**
 * Declare every entity and action of a schema document in `registry`.
 *
 * The registry is not finalized, so several documents can be loaded before
 * calling EntityRegistry::finalize().
 *
 * @param root Root name used for diagnostic paths
 * @return true if the document was well-formed
 */
bool load_schema_document(
  EntityRegistry & registry, const nlohmann::json & document, DiagnosticBag & diags,
  std::string_view root = EntityRegistry::k_schema_root);

/**
 * Read and load a schema file.
 *
 * Unreadable files and JSON syntax errors are reported as
 * InvalidSchemaDocument diagnostics.
 */
bool load_schema_file(
  EntityRegistry & registry, const std::filesystem::path & path, DiagnosticBag & diags);

/**
 * Parse a scalar type description: `{"type": "string", "array": true, ...}`.
 *
 * @return The type, or nullptr after reporting a diagnostic
 */
[[nodiscard]] const Type * parse_scalar_type(
  TypeContext & types, const nlohmann::json & node, const SelectionPath & path,
  DiagnosticBag & diags);

}  // namespace typed_select
