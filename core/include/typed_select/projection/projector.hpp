// typed_select/projection/projector.hpp - Selection to shape projection
//
// Computes the exact output shape of applying a validated selection to a
// TypedEntity. Recursion follows the selection tree only, so cyclic schema
// graphs terminate.
//
#pragma once

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "typed_select/schema/entity.hpp"
#include "typed_select/schema/type.hpp"

namespace typed_select
{

/**
 * Result Type Projector.
 *
 * Shapes are allocated in the TypeContext given at construction; scalar
 * leaves are borrowed from the schema, which must outlive the shapes.
 *
 * The selection must have passed SelectionValidator. Unvalidated input
 * raises std::logic_error.
 */
class Projector
{
public:
  explicit Projector(TypeContext & types) : types_(types) {}

  /// Shape of `selection` applied to `entity`
  [[nodiscard]] const Type * project(const TypedEntity & entity, const nlohmann::json & selection);

private:
  /// Object members collected in first-appearance order
  class FieldList
  {
  public:
    explicit FieldList(TypeContext & types) : types_(types) {}

    void add(std::string_view name, const Type * type, const Type * args = nullptr);
    [[nodiscard]] const Type * build() const;

  private:
    TypeContext & types_;
    std::vector<ObjectField> fields_;
  };

  const Type * project_record(const TypedEntity & entity, const nlohmann::json & selection);
  const Type * project_primitives(const TypedEntity & entity, const nlohmann::json & selection);
  const Type * project_union(const TypedEntity & union_entity, const nlohmann::json & selection);

  void project_field(
    const TypedEntity & entity, const std::string & name, const nlohmann::json & value,
    FieldList & out);
  void project_calculation(
    const CalculationField & calc, const nlohmann::json & value, FieldList & out);
  const Type * project_args(const CalculationField & calc, const nlohmann::json & args);

  /// Relationship / Calculation wrapping: Array, else Nullable
  const Type * wrap(const FieldSpec & field, const Type * shape);

  /// NestedMap / UnionField wrapping: Array, then Nullable
  const Type * wrap_embedded(const FieldSpec & field, const Type * shape);

  TypeContext & types_;
};

}  // namespace typed_select
