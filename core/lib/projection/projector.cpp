// typed_select/projection/projector.cpp - Selection to shape projection

#include "typed_select/projection/projector.hpp"

#include <stdexcept>
#include <string>

#include "typed_select/basic/casting.hpp"
#include "typed_select/schema/type_utils.hpp"

namespace typed_select
{

namespace
{

[[noreturn]] void unvalidated(const std::string & what)
{
  throw std::logic_error("Projector: unvalidated selection: " + what);
}

bool is_flat_selection(const nlohmann::json & selection)
{
  for (const auto & element : selection) {
    if (!element.is_string()) {
      return false;
    }
  }
  return true;
}

}  // namespace

// ============================================================================
// FieldList
// ============================================================================

void Projector::FieldList::add(std::string_view name, const Type * type, const Type * args)
{
  for (auto & f : fields_) {
    if (f.name == name) {
      f.type = merge_shapes(types_, f.type, type);
      f.args = merge_shapes(types_, f.args, args);
      return;
    }
  }
  ObjectField field;
  field.name = name;
  field.type = type;
  field.args = args;
  fields_.push_back(field);
}

const Type * Projector::FieldList::build() const
{
  return types_.get_object_type(gsl::span<const ObjectField>(fields_.data(), fields_.size()));
}

// ============================================================================
// Entry
// ============================================================================

const Type * Projector::project(const TypedEntity & entity, const nlohmann::json & selection)
{
  if (!selection.is_array()) {
    unvalidated("selection of '" + std::string(entity.name()) + "' is not a list");
  }
  if (entity.is_union()) {
    return project_union(entity, selection);
  }
  return project_record(entity, selection);
}

// ============================================================================
// Records
// ============================================================================

const Type * Projector::project_record(const TypedEntity & entity, const nlohmann::json & selection)
{
  if (!entity.has_complex_fields() || is_flat_selection(selection)) {
    return project_primitives(entity, selection);
  }

  FieldList fields(types_);
  for (const auto & element : selection) {
    if (element.is_string()) {
      const auto & name = element.get_ref<const std::string &>();
      const PrimitiveField * p = entity.find_primitive(name);
      if (p == nullptr) {
        unvalidated("unknown primitive '" + name + "'");
      }
      fields.add(p->name, p->type);
    } else if (element.is_object()) {
      for (const auto & [key, value] : element.items()) {
        project_field(entity, key, value, fields);
      }
    } else {
      unvalidated("bad element in selection of '" + std::string(entity.name()) + "'");
    }
  }
  return fields.build();
}

const Type * Projector::project_primitives(
  const TypedEntity & entity, const nlohmann::json & selection)
{
  FieldList fields(types_);
  for (const auto & element : selection) {
    const PrimitiveField * p =
      element.is_string() ? entity.find_primitive(element.get_ref<const std::string &>()) : nullptr;
    if (p == nullptr) {
      unvalidated(
        "'" + element.dump() + "' is not a primitive of '" + std::string(entity.name()) + "'");
    }
    fields.add(p->name, p->type);
  }
  return fields.build();
}

// ============================================================================
// Unions
// ============================================================================

const Type * Projector::project_union(
  const TypedEntity & union_entity, const nlohmann::json & selection)
{
  FieldList fields(types_);
  for (const auto & element : selection) {
    if (element.is_string()) {
      const auto & tag = element.get_ref<const std::string &>();
      const PrimitiveField * p = union_entity.find_primitive(tag);
      if (p == nullptr) {
        unvalidated("unknown tag '" + tag + "'");
      }
      // The discriminant is always present; member keys only when populated
      if (p->name == union_entity.tag_field()) {
        fields.add(p->name, p->type);
      } else {
        fields.add(p->name, types_.get_nullable_type(p->type));
      }
    } else if (element.is_object()) {
      for (const auto & [tag, sub] : element.items()) {
        const UnionMember * variant = union_entity.find_variant(tag);
        if (variant == nullptr) {
          unvalidated("unknown variant '" + tag + "'");
        }
        fields.add(variant->tag, types_.get_nullable_type(project(*variant->entity, sub)));
      }
    } else {
      unvalidated("bad element in union selection");
    }
  }
  return fields.build();
}

// ============================================================================
// Complex fields
// ============================================================================

void Projector::project_field(
  const TypedEntity & entity, const std::string & name, const nlohmann::json & value,
  FieldList & out)
{
  const FieldSpec * field = entity.find_complex(name);
  if (field == nullptr) {
    unvalidated("unknown complex field '" + name + "'");
  }

  switch (field->get_category()) {
    case FieldCategory::Relationship:
      out.add(field->name, wrap(*field, project(*field->target, value)));
      return;
    case FieldCategory::Calculation:
      project_calculation(*cast<CalculationField>(field), value, out);
      return;
    case FieldCategory::NestedMap:
    case FieldCategory::UnionField:
      out.add(field->name, wrap_embedded(*field, project(*field->target, value)));
      return;
  }
}

void Projector::project_calculation(
  const CalculationField & calc, const nlohmann::json & value, FieldList & out)
{
  const Type * args = nullptr;
  if (value.is_object()) {
    auto it = value.find("args");
    if (it != value.end()) {
      args = project_args(calc, *it);
    }
  }

  const Type * shape = calc.return_type;
  if (calc.returns_entity()) {
    if (value.is_array()) {
      shape = project(*calc.target, value);
    } else if (value.is_object() && value.contains("fields")) {
      shape = project(*calc.target, value["fields"]);
    } else {
      unvalidated("calculation '" + std::string(calc.name) + "' has no fields");
    }
  }
  out.add(calc.name, wrap(calc, shape), args);
}

const Type * Projector::project_args(const CalculationField & calc, const nlohmann::json & args)
{
  std::vector<ObjectField> fields;
  for (const auto & [key, _] : args.items()) {
    const ArgSpec * spec = calc.find_arg(key);
    if (spec == nullptr) {
      unvalidated("unknown argument '" + key + "'");
    }
    ObjectField field;
    field.name = spec->name;
    field.type = spec->type;
    fields.push_back(field);
  }
  return types_.get_object_type(gsl::span<const ObjectField>(fields.data(), fields.size()));
}

// ============================================================================
// Wrapping
// ============================================================================

const Type * Projector::wrap(const FieldSpec & field, const Type * shape)
{
  if (field.is_array()) {
    return types_.get_array_type(shape);
  }
  if (field.is_nullable()) {
    return types_.get_nullable_type(shape);
  }
  return shape;
}

const Type * Projector::wrap_embedded(const FieldSpec & field, const Type * shape)
{
  if (field.is_array()) {
    shape = types_.get_array_type(shape);
  }
  if (field.is_nullable()) {
    shape = types_.get_nullable_type(shape);
  }
  return shape;
}

}  // namespace typed_select
