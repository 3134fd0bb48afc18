// typed_select/schema/entity.hpp - TypedEntity and FieldSpec definitions
//
// A TypedEntity is a named schema node: a Resource, an embedded TypedMap,
// or a Union of tagged members. Complex fields are described by FieldSpec
// subclasses and dispatched with isa/cast/dyn_cast.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <gsl/span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "typed_select/schema/type.hpp"

namespace typed_select
{

class TypedEntity;

// ============================================================================
// Name lookup helpers
// ============================================================================

/// Transparent hash functor for string_view heterogeneous lookup
struct NameHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct NameEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

template <typename V>
using NameMap = std::unordered_map<std::string_view, V, NameHash, NameEqual>;

// ============================================================================
// Field Specs
// ============================================================================

enum class FieldCategory : uint8_t {
  Relationship,
  Calculation,
  NestedMap,
  UnionField,
};

[[nodiscard]] std::string_view to_string(FieldCategory category) noexcept;

/// Array/nullable modifiers of a complex field
struct FieldFlags
{
  bool array = false;
  bool nullable = false;
};

/**
 * One declared calculation argument.
 */
struct ArgSpec
{
  std::string_view name;
  const Type * type = nullptr;
  bool required = false;
};

/**
 * Base of all complex field descriptions.
 *
 * FieldSpecs are arena-allocated by the EntityRegistry and must stay
 * trivially destructible.
 */
class FieldSpec
{
public:
  [[nodiscard]] FieldCategory get_category() const noexcept { return category_; }

  std::string_view name;
  FieldFlags flags;

  /// Name of the referenced entity (empty for scalar calculations)
  std::string_view target_name;

  /// Referenced entity, resolved by EntityRegistry::finalize()
  const TypedEntity * target = nullptr;

  [[nodiscard]] bool is_array() const noexcept { return flags.array; }
  [[nodiscard]] bool is_nullable() const noexcept { return flags.nullable; }

protected:
  explicit FieldSpec(FieldCategory category) : category_(category) {}

private:
  FieldCategory category_;
};

/// Link to another Resource
class RelationshipField : public FieldSpec
{
public:
  RelationshipField() : FieldSpec(FieldCategory::Relationship) {}

  static bool classof(const FieldSpec * f)
  {
    return f->get_category() == FieldCategory::Relationship;
  }
};

/**
 * Computed field. Returns either an entity (target) or a scalar type.
 */
class CalculationField : public FieldSpec
{
public:
  CalculationField() : FieldSpec(FieldCategory::Calculation) {}

  /// Scalar return type (nullptr when the calculation returns an entity)
  const Type * return_type = nullptr;

  /// Whether an ArgSpec was declared (possibly with zero arguments)
  bool has_arg_spec = false;

  gsl::span<const ArgSpec> args;

  [[nodiscard]] bool returns_entity() const noexcept { return return_type == nullptr; }

  /// True when at least one declared argument is required
  [[nodiscard]] bool requires_args() const noexcept
  {
    for (const auto & a : args) {
      if (a.required) return true;
    }
    return false;
  }

  [[nodiscard]] const ArgSpec * find_arg(std::string_view arg_name) const noexcept
  {
    for (const auto & a : args) {
      if (a.name == arg_name) return &a;
    }
    return nullptr;
  }

  static bool classof(const FieldSpec * f)
  {
    return f->get_category() == FieldCategory::Calculation;
  }
};

/// Embedded TypedMap value
class NestedMapField : public FieldSpec
{
public:
  NestedMapField() : FieldSpec(FieldCategory::NestedMap) {}

  static bool classof(const FieldSpec * f)
  {
    return f->get_category() == FieldCategory::NestedMap;
  }
};

/// Embedded Union value
class UnionField : public FieldSpec
{
public:
  UnionField() : FieldSpec(FieldCategory::UnionField) {}

  static bool classof(const FieldSpec * f)
  {
    return f->get_category() == FieldCategory::UnionField;
  }
};

// ============================================================================
// TypedEntity
// ============================================================================

enum class EntityKind : uint8_t {
  Resource,
  TypedMap,
  Union,
};

[[nodiscard]] std::string_view to_string(EntityKind kind) noexcept;

struct PrimitiveField
{
  std::string_view name;
  const Type * type = nullptr;
};

/**
 * A Union member. Either a variant (entity_name/entity set) or a
 * primitive member (type set).
 */
struct UnionMember
{
  std::string_view tag;
  std::string_view entity_name;
  const TypedEntity * entity = nullptr;
  const Type * type = nullptr;

  [[nodiscard]] bool is_variant() const noexcept { return type == nullptr; }
};

/**
 * Named schema node.
 *
 * Instances are owned by an EntityRegistry and only mutated through it.
 * For Unions, primitive_fields() holds the tag field (typed as the literal
 * set of all member tags) followed by one entry per primitive member; this
 * list is built by EntityRegistry::finalize().
 */
class TypedEntity
{
public:
  TypedEntity(EntityKind kind, std::string_view name) : kind_(kind), name_(name) {}

  [[nodiscard]] EntityKind kind() const noexcept { return kind_; }
  [[nodiscard]] std::string_view name() const noexcept { return name_; }

  [[nodiscard]] bool is_resource() const noexcept { return kind_ == EntityKind::Resource; }
  [[nodiscard]] bool is_typed_map() const noexcept { return kind_ == EntityKind::TypedMap; }
  [[nodiscard]] bool is_union() const noexcept { return kind_ == EntityKind::Union; }

  // ===========================================================================
  // Fields
  // ===========================================================================

  [[nodiscard]] const std::vector<PrimitiveField> & primitive_fields() const noexcept
  {
    return primitives_;
  }
  [[nodiscard]] const std::vector<const FieldSpec *> & complex_fields() const noexcept
  {
    return complex_;
  }

  [[nodiscard]] bool has_complex_fields() const noexcept { return !complex_.empty(); }

  [[nodiscard]] const PrimitiveField * find_primitive(std::string_view field_name) const;
  [[nodiscard]] const FieldSpec * find_complex(std::string_view field_name) const;

  // ===========================================================================
  // Union
  // ===========================================================================

  /// Discriminant field name (Union only)
  [[nodiscard]] std::string_view tag_field() const noexcept { return tag_field_; }

  [[nodiscard]] const std::vector<UnionMember> & members() const noexcept { return members_; }

  [[nodiscard]] const UnionMember * find_member(std::string_view tag) const;

  /// Variant member with an entity value, or nullptr
  [[nodiscard]] const UnionMember * find_variant(std::string_view tag) const;

private:
  friend class EntityRegistry;

  EntityKind kind_;
  std::string_view name_;

  std::vector<PrimitiveField> primitives_;
  std::vector<const FieldSpec *> complex_;
  NameMap<size_t> primitive_index_;
  NameMap<size_t> complex_index_;

  std::string_view tag_field_;
  std::vector<UnionMember> members_;
  NameMap<size_t> member_index_;
};

}  // namespace typed_select
