// typed_select/selection/selection_validator.cpp - Selection grammar checks

#include "typed_select/selection/selection_validator.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "typed_select/basic/casting.hpp"
#include "typed_select/schema/type_utils.hpp"

namespace typed_select
{

namespace
{

std::string quoted(std::string_view name) { return "'" + std::string(name) + "'"; }

/// Path with list indices dropped; repeated selections of a field share it
std::string shape_path(const SelectionPath & path)
{
  std::string out(path.root());
  for (const auto & seg : path.segments()) {
    if (seg.is_key()) {
      out += '\0';
      out += seg.key;
    }
  }
  return out;
}

std::string calculation_form(const CalculationField & calc)
{
  if (calc.returns_entity()) {
    return R"(expected {"args": {...}, "fields": [...]})";
  }
  return R"(expected {"args": {...}})";
}

}  // namespace

bool SelectionValidator::fail(
  DiagnosticKind kind, const SelectionPath & path, std::string message, std::string_view subject,
  std::string help)
{
  has_errors_ = true;
  if (diags_ == nullptr) {
    return false;
  }
  auto builder = diags_->report_error(path, std::move(message));
  builder.with_kind(kind);
  if (!subject.empty()) {
    builder.with_subject(std::string(subject));
  }
  if (!help.empty()) {
    builder.with_help(std::move(help));
  }
  return false;
}

bool SelectionValidator::validate(
  const TypedEntity & entity, const nlohmann::json & selection, const SelectionPath & path)
{
  seen_args_.clear();
  if (entity.is_union()) {
    return validate_union_list(entity, selection, path, 1);
  }
  return validate_list(entity, selection, path, 1);
}

// ============================================================================
// Lists
// ============================================================================

bool SelectionValidator::validate_list(
  const TypedEntity & entity, const nlohmann::json & node, const SelectionPath & path,
  size_t depth)
{
  if (depth > options_.max_depth) {
    return fail(
      DiagnosticKind::RecursionDepthExceeded, path,
      "selection is nested deeper than " + std::to_string(options_.max_depth) + " levels");
  }
  if (!node.is_array()) {
    return fail(
      DiagnosticKind::InvalidSelectionFormat, path,
      "selection of " + quoted(entity.name()) + " must be a list, found " +
        std::string(node.type_name()));
  }
  if (node.empty()) {
    return fail(
      DiagnosticKind::EmptySelection, path,
      "selection of " + quoted(entity.name()) + " selects no fields");
  }

  std::unordered_set<std::string> seen;
  auto check_duplicate = [&](const std::string & name, const SelectionPath & at) {
    if (seen.insert(name).second || options_.allow_duplicate_fields) {
      return true;
    }
    return fail(
      DiagnosticKind::DuplicateField, at,
      "field " + quoted(name) + " is selected more than once", name);
  };

  for (size_t i = 0; i < node.size(); ++i) {
    const nlohmann::json & element = node[i];
    const SelectionPath element_path = path.at(i);

    if (element.is_string()) {
      const auto & name = element.get_ref<const std::string &>();
      if (!validate_primitive(entity, name, element_path)) {
        return false;
      }
      if (!check_duplicate(name, element_path)) {
        return false;
      }
      continue;
    }

    if (element.is_object()) {
      if (element.empty()) {
        return fail(
          DiagnosticKind::EmptySelection, element_path, "empty object in selection",
          {}, "name at least one complex field, e.g. {\"author\": [\"id\"]}");
      }
      for (const auto & [key, value] : element.items()) {
        const SelectionPath field_path = element_path.child(key);
        if (!validate_field(entity, key, value, field_path, depth)) {
          return false;
        }
        if (!check_duplicate(key, field_path)) {
          return false;
        }
      }
      continue;
    }

    return fail(
      DiagnosticKind::InvalidSelectionFormat, element_path,
      "selection elements must be field names or objects, found " +
        std::string(element.type_name()));
  }
  return true;
}

bool SelectionValidator::validate_union_list(
  const TypedEntity & union_entity, const nlohmann::json & node, const SelectionPath & path,
  size_t depth)
{
  if (depth > options_.max_depth) {
    return fail(
      DiagnosticKind::RecursionDepthExceeded, path,
      "selection is nested deeper than " + std::to_string(options_.max_depth) + " levels");
  }
  if (!node.is_array()) {
    return fail(
      DiagnosticKind::InvalidSelectionFormat, path,
      "selection of union " + quoted(union_entity.name()) + " must be a list, found " +
        std::string(node.type_name()));
  }
  if (node.empty()) {
    return fail(
      DiagnosticKind::EmptySelection, path,
      "selection of union " + quoted(union_entity.name()) + " selects no members");
  }

  std::unordered_set<std::string> seen;
  auto check_duplicate = [&](const std::string & name, const SelectionPath & at) {
    if (seen.insert(name).second || options_.allow_duplicate_fields) {
      return true;
    }
    return fail(
      DiagnosticKind::DuplicateField, at,
      "union member " + quoted(name) + " is selected more than once", name);
  };

  for (size_t i = 0; i < node.size(); ++i) {
    const nlohmann::json & element = node[i];
    const SelectionPath element_path = path.at(i);

    if (element.is_string()) {
      const auto & tag = element.get_ref<const std::string &>();
      if (union_entity.find_primitive(tag) == nullptr) {
        if (union_entity.find_variant(tag) != nullptr) {
          return fail(
            DiagnosticKind::InvalidFieldSelection, element_path,
            "variant " + quoted(tag) + " needs a sub-selection", tag,
            "select it as {\"" + tag + "\": [...]}");
        }
        return fail(
          DiagnosticKind::InvalidUnionVariant, element_path,
          quoted(tag) + " is not a member of union " + quoted(union_entity.name()), tag);
      }
      if (!check_duplicate(tag, element_path)) {
        return false;
      }
      continue;
    }

    if (element.is_object()) {
      if (element.empty()) {
        return fail(
          DiagnosticKind::EmptySelection, element_path, "empty object in union selection");
      }
      for (const auto & [tag, value] : element.items()) {
        const SelectionPath member_path = element_path.child(tag);
        const UnionMember * variant = union_entity.find_variant(tag);
        if (variant == nullptr) {
          if (union_entity.find_member(tag) != nullptr || tag == union_entity.tag_field()) {
            return fail(
              DiagnosticKind::InvalidFieldSelection, member_path,
              quoted(tag) + " is a scalar member of union " + quoted(union_entity.name()), tag,
              "select it as the string \"" + tag + "\"");
          }
          return fail(
            DiagnosticKind::InvalidUnionVariant, member_path,
            quoted(tag) + " is not a variant of union " + quoted(union_entity.name()), tag);
        }
        if (!validate_list(*variant->entity, value, member_path, depth + 1)) {
          return false;
        }
        if (!check_duplicate(tag, member_path)) {
          return false;
        }
      }
      continue;
    }

    return fail(
      DiagnosticKind::InvalidSelectionFormat, element_path,
      "union selection elements must be tags or objects, found " +
        std::string(element.type_name()));
  }
  return true;
}

// ============================================================================
// Fields
// ============================================================================

bool SelectionValidator::validate_primitive(
  const TypedEntity & entity, const std::string & name, const SelectionPath & path)
{
  if (entity.find_primitive(name) != nullptr) {
    return true;
  }
  if (const FieldSpec * field = entity.find_complex(name)) {
    return fail(
      DiagnosticKind::UnknownPrimitiveField, path,
      quoted(name) + " is not a primitive field of " + quoted(entity.name()), name,
      quoted(name) + " is a " + std::string(to_string(field->get_category())) +
        "; select it as {\"" + name + "\": [...]}");
  }
  return fail(
    DiagnosticKind::UnknownPrimitiveField, path,
    quoted(name) + " is not a primitive field of " + quoted(entity.name()), name);
}

bool SelectionValidator::validate_field(
  const TypedEntity & entity, const std::string & name, const nlohmann::json & value,
  const SelectionPath & path, size_t depth)
{
  const FieldSpec * field = entity.find_complex(name);
  if (field == nullptr) {
    std::string help;
    if (entity.find_primitive(name) != nullptr) {
      help = quoted(name) + " is a primitive field; select it as the string \"" + name + "\"";
    } else if (!entity.has_complex_fields()) {
      help = quoted(entity.name()) + " has no complex fields";
    }
    return fail(
      DiagnosticKind::UnknownComplexField, path,
      quoted(name) + " is not a complex field of " + quoted(entity.name()), name,
      std::move(help));
  }
  if (!field->target_name.empty() && field->target == nullptr) {
    throw std::logic_error(
      "field " + quoted(entity.name()) + "." + quoted(name) +
      " is unresolved; finalize the entity registry first");
  }

  if (const auto * calc = dyn_cast<CalculationField>(field)) {
    return validate_calculation(*calc, value, path, depth);
  }

  // Relationship, NestedMap and UnionField take a list; a flat TypedMap
  // rejects nested objects because it has no complex fields.
  if (field->target->is_union()) {
    return validate_union_list(*field->target, value, path, depth + 1);
  }
  return validate_list(*field->target, value, path, depth + 1);
}

bool SelectionValidator::validate_calculation(
  const CalculationField & calc, const nlohmann::json & value, const SelectionPath & path,
  size_t depth)
{
  if (!calc.has_arg_spec) {
    // Entity-returning calculation without arguments
    if (value.is_array()) {
      return validate_list(*calc.target, value, path, depth + 1);
    }
    if (!value.is_object()) {
      return fail(
        DiagnosticKind::InvalidSelectionFormat, path,
        "calculation " + quoted(calc.name) + " must be selected with a list or {\"fields\": [...]}",
        calc.name);
    }
    for (const auto & [key, _] : value.items()) {
      if (key == "fields") {
        continue;
      }
      return fail(
        DiagnosticKind::InvalidCalculationArgs, path.child(key),
        key == "args" ? "calculation " + quoted(calc.name) + " takes no arguments"
                      : "unexpected key " + quoted(key) + " in calculation " + quoted(calc.name),
        calc.name);
    }
    auto fields = value.find("fields");
    if (fields == value.end()) {
      return fail(
        DiagnosticKind::EmptySelection, path,
        "calculation " + quoted(calc.name) + " selects no fields", calc.name,
        R"(expected {"fields": [...]})");
    }
    return validate_list(*calc.target, *fields, path.child("fields"), depth + 1);
  }

  if (!value.is_object()) {
    return fail(
      DiagnosticKind::InvalidSelectionFormat, path,
      "calculation " + quoted(calc.name) + " must be selected with an object", calc.name,
      calculation_form(calc));
  }

  for (const auto & [key, _] : value.items()) {
    if (key != "args" && key != "fields") {
      return fail(
        DiagnosticKind::InvalidCalculationArgs, path.child(key),
        "unexpected key " + quoted(key) + " in calculation " + quoted(calc.name), calc.name,
        calculation_form(calc));
    }
  }

  auto args = value.find("args");
  if (args == value.end()) {
    if (calc.requires_args()) {
      return fail(
        DiagnosticKind::MissingCalculationArgs, path,
        "calculation " + quoted(calc.name) + " requires arguments", calc.name,
        calculation_form(calc));
    }
  } else if (!validate_args(calc, *args, path.child("args"))) {
    return false;
  }
  if (!check_repeated_args(
        calc, args != value.end() ? *args : nlohmann::json::object(), path)) {
    return false;
  }

  auto fields = value.find("fields");
  if (!calc.returns_entity()) {
    if (fields != value.end()) {
      return fail(
        DiagnosticKind::InvalidFieldSelection, path.child("fields"),
        "calculation " + quoted(calc.name) + " returns " + to_string(calc.return_type) +
          " and has no fields to select",
        calc.name);
    }
    return true;
  }

  if (fields == value.end()) {
    return fail(
      DiagnosticKind::EmptySelection, path,
      "calculation " + quoted(calc.name) + " selects no fields", calc.name,
      calculation_form(calc));
  }
  return validate_list(*calc.target, *fields, path.child("fields"), depth + 1);
}

bool SelectionValidator::validate_args(
  const CalculationField & calc, const nlohmann::json & args, const SelectionPath & path)
{
  if (!args.is_object()) {
    return fail(
      DiagnosticKind::InvalidCalculationArgs, path,
      "arguments of " + quoted(calc.name) + " must be an object", calc.name);
  }

  for (const auto & [key, value] : args.items()) {
    const ArgSpec * spec = calc.find_arg(key);
    if (spec == nullptr) {
      return fail(
        DiagnosticKind::InvalidCalculationArgs, path.child(key),
        quoted(key) + " is not an argument of " + quoted(calc.name), key);
    }
    if (!json_matches_type(spec->type, value)) {
      return fail(
        DiagnosticKind::InvalidCalculationArgs, path.child(key),
        "argument " + quoted(key) + " expects " + to_string(spec->type) + ", found " +
          std::string(value.type_name()),
        key);
    }
  }

  for (const auto & spec : calc.args) {
    if (spec.required && !args.contains(std::string(spec.name))) {
      return fail(
        DiagnosticKind::MissingCalculationArgs, path,
        "missing required argument " + quoted(spec.name) + " of " + quoted(calc.name),
        spec.name);
    }
  }
  return true;
}

bool SelectionValidator::check_repeated_args(
  const CalculationField & calc, const nlohmann::json & args, const SelectionPath & path)
{
  // Repeated selections merge into one shape field, which has one set of arguments
  const auto [it, inserted] = seen_args_.emplace(shape_path(path), args);
  if (inserted || it->second == args) {
    return true;
  }
  return fail(
    DiagnosticKind::InvalidCalculationArgs, path,
    "calculation " + quoted(calc.name) + " is selected again with different arguments",
    calc.name, "select it once, or repeat it with the same \"args\"");
}

}  // namespace typed_select
