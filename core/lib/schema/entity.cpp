// typed_select/schema/entity.cpp - TypedEntity implementation
//
#include "typed_select/schema/entity.hpp"

namespace typed_select
{

std::string_view to_string(FieldCategory category) noexcept
{
  switch (category) {
    case FieldCategory::Relationship:
      return "relationship";
    case FieldCategory::Calculation:
      return "calculation";
    case FieldCategory::NestedMap:
      return "nested map";
    case FieldCategory::UnionField:
      return "union field";
  }
  return "field";
}

std::string_view to_string(EntityKind kind) noexcept
{
  switch (kind) {
    case EntityKind::Resource:
      return "resource";
    case EntityKind::TypedMap:
      return "typed map";
    case EntityKind::Union:
      return "union";
  }
  return "entity";
}

const PrimitiveField * TypedEntity::find_primitive(std::string_view field_name) const
{
  auto it = primitive_index_.find(field_name);
  return it != primitive_index_.end() ? &primitives_[it->second] : nullptr;
}

const FieldSpec * TypedEntity::find_complex(std::string_view field_name) const
{
  auto it = complex_index_.find(field_name);
  return it != complex_index_.end() ? complex_[it->second] : nullptr;
}

const UnionMember * TypedEntity::find_member(std::string_view tag) const
{
  auto it = member_index_.find(tag);
  return it != member_index_.end() ? &members_[it->second] : nullptr;
}

const UnionMember * TypedEntity::find_variant(std::string_view tag) const
{
  const UnionMember * m = find_member(tag);
  return (m != nullptr && m->is_variant()) ? m : nullptr;
}

}  // namespace typed_select
