// typed_select/schema/type_utils.hpp - Shared type utilities
//
// Rendering, structural comparison and merging of types, plus matching of
// JSON values against scalar types.
//
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "typed_select/schema/type.hpp"

namespace typed_select
{

// ============================================================================
// Rendering
// ============================================================================

/**
 * Convert a Type to its one-line TypeScript representation.
 *
 * e.g. `{ id: string; author: { name: string } | null }`
 */
[[nodiscard]] std::string to_string(const Type * type);

/// TypeScript spelling of a scalar kind ("string", "number", ...)
[[nodiscard]] std::string_view ts_scalar_name(TypeKind kind) noexcept;

/// Schema spelling of a scalar kind ("string", "integer", "datetime", ...)
[[nodiscard]] std::string_view scalar_name(TypeKind kind) noexcept;

/// Whether `name` can be written as an unquoted TypeScript property key
[[nodiscard]] bool is_identifier(std::string_view name) noexcept;

/// Double-quoted TypeScript string literal with `"`, `\` and control characters escaped
[[nodiscard]] std::string quote_string(std::string_view text);

/// `name` as a property key: bare when it is an identifier, quoted otherwise
[[nodiscard]] std::string property_key(std::string_view name);

// ============================================================================
// Structural Operations
// ============================================================================

/**
 * Structural equality, valid across TypeContexts.
 *
 * Object members compare by name, type, optionality and args, in order.
 */
[[nodiscard]] bool same_type(const Type * lhs, const Type * rhs);

/// Remove one Nullable wrapper, if present
[[nodiscard]] const Type * strip_nullable(const Type * type) noexcept;

/**
 * Structural merge (key-wise union) of two shapes.
 *
 * - Objects: keys in first-appearance order; a key present on both sides
 *   merges recursively and stays optional only if optional on both sides.
 * - Array/Nullable wrappers of the same kind merge their inner types.
 * - Structurally equal shapes return `lhs`.
 * - Anything else becomes `lhs | rhs`.
 */
[[nodiscard]] const Type * merge_shapes(TypeContext & types, const Type * lhs, const Type * rhs);

// ============================================================================
// Value Matching
// ============================================================================

/**
 * Check whether a JSON value is an instance of `type`.
 *
 * Temporal and uuid scalars are transported as strings; decimal accepts a
 * string or a number.
 */
[[nodiscard]] bool json_matches_type(const Type * type, const nlohmann::json & value);

}  // namespace typed_select
