// typed_select/schema/type.cpp - Type context implementation
//
#include "typed_select/schema/type.hpp"

namespace typed_select
{

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext(size_t initial_buffer_size) : arena_(initial_buffer_size)
{
  string_ = Type{TypeKind::String};
  integer_ = Type{TypeKind::Integer};
  float_ = Type{TypeKind::Float};
  decimal_ = Type{TypeKind::Decimal};
  boolean_ = Type{TypeKind::Boolean};
  date_ = Type{TypeKind::Date};
  datetime_ = Type{TypeKind::DateTime};
  time_ = Type{TypeKind::Time};
  uuid_ = Type{TypeKind::Uuid};
  json_ = Type{TypeKind::Json};
  any_ = Type{TypeKind::Any};
}

const Type * TypeContext::get_literal_type(gsl::span<const std::string_view> values)
{
  // Search for existing
  for (const auto & t : composite_types_) {
    if (t.kind != TypeKind::Literal || t.literals.size() != values.size()) {
      continue;
    }
    bool same = true;
    for (size_t i = 0; i < values.size() && same; ++i) {
      same = t.literals[i] == values[i];
    }
    if (same) {
      return &t;
    }
  }

  // Create new (values are interned so callers may pass temporaries)
  std::vector<std::string_view> interned;
  interned.reserve(values.size());
  for (const auto v : values) {
    interned.push_back(intern(v));
  }

  Type new_type{TypeKind::Literal};
  new_type.literals = copy_to_arena(gsl::span<const std::string_view>(interned));
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_array_type(const Type * element_type)
{
  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Array && t.element_type == element_type) {
      return &t;
    }
  }

  Type new_type{TypeKind::Array};
  new_type.element_type = element_type;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_nullable_type(const Type * base_type)
{
  // Don't double-wrap nullable
  if (base_type->is_nullable()) {
    return base_type;
  }

  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Nullable && t.base_type == base_type) {
      return &t;
    }
  }

  Type new_type{TypeKind::Nullable};
  new_type.base_type = base_type;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_object_type(gsl::span<const ObjectField> fields)
{
  for (const auto & t : composite_types_) {
    if (t.kind != TypeKind::Object || t.fields.size() != fields.size()) {
      continue;
    }
    bool same = true;
    for (size_t i = 0; i < fields.size() && same; ++i) {
      const ObjectField & a = t.fields[i];
      const ObjectField & b = fields[i];
      same = a.name == b.name && a.type == b.type && a.optional == b.optional && a.args == b.args;
    }
    if (same) {
      return &t;
    }
  }

  std::vector<ObjectField> owned(fields.begin(), fields.end());
  for (auto & f : owned) {
    f.name = intern(f.name);
  }

  Type new_type{TypeKind::Object};
  new_type.fields = copy_to_arena(gsl::span<const ObjectField>(owned));
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_union_type(gsl::span<const Type * const> alternatives)
{
  if (alternatives.size() == 1) {
    return alternatives[0];
  }

  for (const auto & t : composite_types_) {
    if (t.kind != TypeKind::Union || t.alternatives.size() != alternatives.size()) {
      continue;
    }
    bool same = true;
    for (size_t i = 0; i < alternatives.size() && same; ++i) {
      same = t.alternatives[i] == alternatives[i];
    }
    if (same) {
      return &t;
    }
  }

  Type new_type{TypeKind::Union};
  new_type.alternatives = copy_to_arena(alternatives);
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::lookup_scalar(std::string_view name) const
{
  if (name == "string" || name == "ci_string") return &string_;
  if (name == "integer") return &integer_;
  if (name == "float") return &float_;
  if (name == "decimal") return &decimal_;
  if (name == "boolean") return &boolean_;
  if (name == "date") return &date_;
  if (name == "datetime") return &datetime_;
  if (name == "time") return &time_;
  if (name == "uuid") return &uuid_;
  if (name == "json" || name == "map") return &json_;
  if (name == "any") return &any_;

  // Aliases used by reflection dumps
  if (name == "utc_datetime" || name == "utc_datetime_usec" || name == "naive_datetime") {
    return &datetime_;
  }
  if (name == "bool") return &boolean_;
  if (name == "int") return &integer_;

  return nullptr;
}

std::string_view TypeContext::intern(std::string_view s)
{
  auto it = string_pool_.emplace(s.begin(), s.end()).first;
  return *it;
}

}  // namespace typed_select
