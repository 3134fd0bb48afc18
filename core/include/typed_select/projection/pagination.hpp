// typed_select/projection/pagination.hpp - Pagination shape resolution
//
// Read actions return either the bare collection or an offset/keyset page
// envelope around it, depending on the page parameters the client sends.
//
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "typed_select/basic/diagnostic.hpp"
#include "typed_select/basic/selection_path.hpp"
#include "typed_select/schema/entity_registry.hpp"
#include "typed_select/schema/type.hpp"

namespace typed_select
{

enum class PaginationFlavor : uint8_t {
  None,  ///< Bare collection
  Offset,
  Keyset,
};

[[nodiscard]] std::string_view to_string(PaginationFlavor flavor) noexcept;

/// Builds a page envelope around the bare collection shape
using EnvelopeFactory = std::function<const Type *(const Type * results)>;

/**
 * Classify page parameters.
 *
 * `limit` is shared by both flavors; `offset`/`count` select offset
 * pagination, `after`/`before` select keyset pagination. An action with a
 * single flavor takes it for any page; only mixed actions check keys and
 * values.
 *
 * @return The flavor, or std::nullopt after reporting a diagnostic
 */
std::optional<PaginationFlavor> classify_page(
  const nlohmann::json & page, const PaginationSupport & support, DiagnosticBag & diags,
  const SelectionPath & path);

/**
 * Resolve the shape returned by a read action.
 *
 * @param page      Page parameters, or nullptr when the client sent none
 * @param base_shape Shape of the bare collection (Array<T>), handed to the
 *                   envelope factories as `results`
 * @return The resolved shape, or nullptr after reporting a diagnostic
 */
const Type * resolve_page_shape(
  TypeContext & types, const nlohmann::json * page, const Type * base_shape,
  const PaginationSupport & support, const EnvelopeFactory & offset_envelope,
  const EnvelopeFactory & keyset_envelope, DiagnosticBag & diags,
  const SelectionPath & path = SelectionPath("page"));

// ============================================================================
// Envelopes
// ============================================================================

/**
 * `{ results: R; hasMore: boolean; limit: number; offset: number;
 *    count?: number | null }`, plus `type: "offset"` when `discriminated`.
 */
[[nodiscard]] const Type * make_offset_envelope(
  TypeContext & types, const Type * results, bool discriminated);

/**
 * `{ results: R; hasMore: boolean; limit: number; after: string | null;
 *    before: string | null; previousPage: string; nextPage: string }`.
 *
 * Mixed actions (`discriminated`) also get `count?` and `type: "keyset"`.
 */
[[nodiscard]] const Type * make_keyset_envelope(
  TypeContext & types, const Type * results, bool discriminated);

}  // namespace typed_select
