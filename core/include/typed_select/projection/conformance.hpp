// typed_select/projection/conformance.hpp - Result value vs. shape checks
//
// The execution engine must return values that match the projected shape
// exactly. check_conformance() verifies a JSON result against a shape and
// reports every mismatch with its location in the value.
//
#pragma once

#include <nlohmann/json.hpp>

#include "typed_select/basic/diagnostic.hpp"
#include "typed_select/basic/selection_path.hpp"
#include "typed_select/schema/type.hpp"

namespace typed_select
{

/**
 * Check that `value` is an instance of `shape`.
 *
 * Objects must carry every non-optional key and no others; nulls are
 * accepted only under Nullable shapes; a union value must match at least
 * one alternative.
 *
 * @return true if the value conforms (no ShapeMismatch was reported)
 */
bool check_conformance(
  const Type * shape, const nlohmann::json & value, DiagnosticBag & diags,
  const SelectionPath & path = SelectionPath("result"));

}  // namespace typed_select
