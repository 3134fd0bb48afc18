// typed_select/selection/selection_validator.hpp - Selection grammar checks
//
// A selection is a JSON list whose elements are primitive field names
// (strings) or objects mapping complex field names to sub-selections.
// Validation fails closed: the first invalid node is reported with its path
// and the walk stops.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "typed_select/basic/diagnostic.hpp"
#include "typed_select/basic/selection_path.hpp"
#include "typed_select/schema/entity.hpp"

namespace typed_select
{

struct ValidationOptions
{
  /// Maximum list nesting; the root selection list is depth 1
  size_t max_depth = 64;

  /// Accept a field named twice in one list (projections are merged)
  bool allow_duplicate_fields = false;
};

/**
 * Validates selections against a TypedEntity.
 *
 * The validator only reads the schema, so one instance per request is
 * enough and registries can be shared between threads.
 */
class SelectionValidator
{
public:
  explicit SelectionValidator(DiagnosticBag * diags = nullptr, ValidationOptions options = {})
  : diags_(diags), options_(options)
  {
  }

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Validate `selection` against `entity`.
   *
   * @param path Location of `selection` in its document
   * @return true if the selection is valid
   */
  bool validate(
    const TypedEntity & entity, const nlohmann::json & selection,
    const SelectionPath & path = SelectionPath());

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] const ValidationOptions & options() const noexcept { return options_; }

private:
  bool validate_list(
    const TypedEntity & entity, const nlohmann::json & node, const SelectionPath & path,
    size_t depth);
  bool validate_union_list(
    const TypedEntity & union_entity, const nlohmann::json & node, const SelectionPath & path,
    size_t depth);

  bool validate_primitive(
    const TypedEntity & entity, const std::string & name, const SelectionPath & path);
  bool validate_field(
    const TypedEntity & entity, const std::string & name, const nlohmann::json & value,
    const SelectionPath & path, size_t depth);
  bool validate_calculation(
    const CalculationField & calc, const nlohmann::json & value, const SelectionPath & path,
    size_t depth);
  bool validate_args(
    const CalculationField & calc, const nlohmann::json & args, const SelectionPath & path);
  bool check_repeated_args(
    const CalculationField & calc, const nlohmann::json & args, const SelectionPath & path);

  bool fail(
    DiagnosticKind kind, const SelectionPath & path, std::string message,
    std::string_view subject = {}, std::string help = {});

  DiagnosticBag * diags_ = nullptr;
  ValidationOptions options_;
  bool has_errors_ = false;

  // Arguments of each calculation seen so far, keyed by its merged shape path
  std::unordered_map<std::string, nlohmann::json> seen_args_;
};

}  // namespace typed_select
