// typed_select/schema/schema_loader.cpp - JSON schema dump loader
//
#include "typed_select/schema/schema_loader.hpp"

#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace typed_select
{

namespace
{

void report_invalid(DiagnosticBag & diags, const SelectionPath & path, std::string message)
{
  diags.report_error(path, std::move(message)).with_kind(DiagnosticKind::InvalidSchemaDocument);
}

/// Required string member
std::optional<std::string> require_string(
  const nlohmann::json & node, std::string_view key, const SelectionPath & path,
  DiagnosticBag & diags)
{
  auto it = node.find(std::string(key));
  if (it == node.end()) {
    report_invalid(diags, path, "missing required member '" + std::string(key) + "'");
    return std::nullopt;
  }
  if (!it->is_string()) {
    report_invalid(diags, path.child(key), "'" + std::string(key) + "' must be a string");
    return std::nullopt;
  }
  return it->get<std::string>();
}

/// Optional boolean member (false when absent)
bool optional_bool(
  const nlohmann::json & node, std::string_view key, const SelectionPath & path,
  DiagnosticBag & diags)
{
  auto it = node.find(std::string(key));
  if (it == node.end() || it->is_null()) {
    return false;
  }
  if (!it->is_boolean()) {
    report_invalid(diags, path.child(key), "'" + std::string(key) + "' must be a boolean");
    return false;
  }
  return it->get<bool>();
}

/// Optional list member; nullptr when absent, reports when not a list
const nlohmann::json * optional_list(
  const nlohmann::json & node, std::string_view key, const SelectionPath & path,
  DiagnosticBag & diags)
{
  auto it = node.find(std::string(key));
  if (it == node.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_array()) {
    report_invalid(diags, path.child(key), "'" + std::string(key) + "' must be a list");
    return nullptr;
  }
  return &*it;
}

FieldFlags parse_flags(
  const nlohmann::json & node, const SelectionPath & path, DiagnosticBag & diags)
{
  FieldFlags flags;
  flags.array = optional_bool(node, "array", path, diags);
  flags.nullable = optional_bool(node, "nullable", path, diags);
  return flags;
}

std::optional<std::vector<ArgSpec>> parse_args(
  TypeContext & types, const nlohmann::json & node, const SelectionPath & path,
  DiagnosticBag & diags, bool & ok)
{
  const nlohmann::json * list = optional_list(node, "args", path, diags);
  if (list == nullptr) {
    ok = ok && (node.find("args") == node.end() || node["args"].is_null());
    return std::nullopt;
  }

  std::vector<ArgSpec> args;
  for (size_t i = 0; i < list->size(); ++i) {
    const nlohmann::json & arg = (*list)[i];
    const SelectionPath arg_path = path.child("args").at(i);
    if (!arg.is_object()) {
      report_invalid(diags, arg_path, "argument entry must be an object");
      ok = false;
      continue;
    }
    const auto name = require_string(arg, "name", arg_path, diags);
    const Type * type = parse_scalar_type(types, arg, arg_path, diags);
    if (!name || type == nullptr) {
      ok = false;
      continue;
    }
    ArgSpec spec;
    spec.name = types.intern(*name);
    spec.type = type;
    spec.required = optional_bool(arg, "required", arg_path, diags);
    args.push_back(spec);
  }
  return args;
}

bool load_field(
  EntityRegistry & registry, TypedEntity & entity, const nlohmann::json & node,
  const SelectionPath & path, DiagnosticBag & diags)
{
  if (!node.is_object()) {
    report_invalid(diags, path, "field entry must be an object");
    return false;
  }

  const size_t errors_before = diags.errors().size();
  const auto name = require_string(node, "name", path, diags);
  const auto category = require_string(node, "category", path, diags);
  if (!name || !category) {
    return false;
  }
  const FieldFlags flags = parse_flags(node, path, diags);

  if (*category == "calculation") {
    auto returns = node.find("returns");
    if (returns == node.end() || !returns->is_object()) {
      report_invalid(diags, path, "calculation '" + *name + "' needs a 'returns' object");
      return false;
    }
    bool ok = true;
    auto args = parse_args(registry.types(), node, path, diags, ok);
    if (!ok) {
      return false;
    }
    if (returns->contains("entity")) {
      const auto target = require_string(*returns, "entity", path.child("returns"), diags);
      if (!target) {
        return false;
      }
      registry.add_entity_calculation(entity, *name, *target, std::move(args), flags);
    } else {
      const Type * type =
        parse_scalar_type(registry.types(), *returns, path.child("returns"), diags);
      if (type == nullptr) {
        return false;
      }
      registry.add_scalar_calculation(entity, *name, type, std::move(args), flags);
    }
    return diags.errors().size() == errors_before;
  }

  const auto target = require_string(node, "target", path, diags);
  if (!target) {
    return false;
  }

  if (*category == "relationship") {
    registry.add_relationship(entity, *name, *target, flags);
  } else if (*category == "nested_map") {
    registry.add_nested_map(entity, *name, *target, flags);
  } else if (*category == "union") {
    registry.add_union_field(entity, *name, *target, flags);
  } else {
    report_invalid(
      diags, path.child("category"),
      "unknown field category '" + *category +
        "' (expected relationship, calculation, nested_map or union)");
    return false;
  }
  return diags.errors().size() == errors_before;
}

bool load_union_members(
  EntityRegistry & registry, TypedEntity & entity, const nlohmann::json & node,
  const SelectionPath & path, DiagnosticBag & diags)
{
  const nlohmann::json * variants = optional_list(node, "variants", path, diags);
  if (variants == nullptr) {
    report_invalid(
      diags, path, "union '" + std::string(entity.name()) + "' needs a 'variants' list");
    return false;
  }

  bool ok = true;
  for (size_t i = 0; i < variants->size(); ++i) {
    const nlohmann::json & member = (*variants)[i];
    const SelectionPath member_path = path.child("variants").at(i);
    if (!member.is_object()) {
      report_invalid(diags, member_path, "variant entry must be an object");
      ok = false;
      continue;
    }
    const auto tag = require_string(member, "tag", member_path, diags);
    if (!tag) {
      ok = false;
      continue;
    }
    if (member.contains("entity")) {
      const auto target = require_string(member, "entity", member_path, diags);
      if (!target) {
        ok = false;
        continue;
      }
      registry.add_variant(entity, *tag, *target);
    } else {
      const Type * type = parse_scalar_type(registry.types(), member, member_path, diags);
      if (type == nullptr) {
        ok = false;
        continue;
      }
      registry.add_primitive_member(entity, *tag, type);
    }
  }
  return ok;
}

bool load_entity(
  EntityRegistry & registry, const nlohmann::json & node, const SelectionPath & path,
  DiagnosticBag & diags)
{
  if (!node.is_object()) {
    report_invalid(diags, path, "entity entry must be an object");
    return false;
  }

  const auto name = require_string(node, "name", path, diags);
  const auto kind = require_string(node, "kind", path, diags);
  if (!name || !kind) {
    return false;
  }

  bool ok = true;

  if (*kind == "union") {
    const auto tag_field = require_string(node, "tag_field", path, diags);
    if (!tag_field) {
      return false;
    }
    TypedEntity & entity = registry.declare_union(*name, *tag_field);
    ok = load_union_members(registry, entity, node, path, diags);
    if (node.contains("primitives") || node.contains("fields")) {
      report_invalid(
        diags, path, "union '" + *name + "' declares members under 'variants' only");
      ok = false;
    }
    return ok;
  }

  TypedEntity * entity = nullptr;
  if (*kind == "resource") {
    entity = &registry.declare_resource(*name);
  } else if (*kind == "typed_map") {
    entity = &registry.declare_typed_map(*name);
  } else {
    report_invalid(
      diags, path.child("kind"),
      "unknown entity kind '" + *kind + "' (expected resource, typed_map or union)");
    return false;
  }

  if (const auto * primitives = optional_list(node, "primitives", path, diags)) {
    for (size_t i = 0; i < primitives->size(); ++i) {
      const nlohmann::json & p = (*primitives)[i];
      const SelectionPath p_path = path.child("primitives").at(i);
      if (!p.is_object()) {
        report_invalid(diags, p_path, "primitive entry must be an object");
        ok = false;
        continue;
      }
      const auto field_name = require_string(p, "name", p_path, diags);
      const Type * type = parse_scalar_type(registry.types(), p, p_path, diags);
      if (!field_name || type == nullptr) {
        ok = false;
        continue;
      }
      registry.add_primitive(*entity, *field_name, type);
    }
  }

  if (const auto * fields = optional_list(node, "fields", path, diags)) {
    for (size_t i = 0; i < fields->size(); ++i) {
      ok = load_field(registry, *entity, (*fields)[i], path.child("fields").at(i), diags) && ok;
    }
  }
  return ok;
}

bool load_action(
  EntityRegistry & registry, const nlohmann::json & node, const SelectionPath & path,
  DiagnosticBag & diags)
{
  if (!node.is_object()) {
    report_invalid(diags, path, "action entry must be an object");
    return false;
  }

  const auto name = require_string(node, "name", path, diags);
  const auto entity = require_string(node, "entity", path, diags);
  const auto kind_text = require_string(node, "kind", path, diags);
  if (!name || !entity || !kind_text) {
    return false;
  }

  const auto kind = parse_action_kind(*kind_text);
  if (!kind) {
    report_invalid(
      diags, path.child("kind"),
      "unknown action kind '" + *kind_text + "' (expected read, get, create, update or destroy)");
    return false;
  }

  PaginationSupport pagination;
  auto page_it = node.find("pagination");
  if (page_it != node.end() && !page_it->is_null()) {
    if (!page_it->is_object()) {
      report_invalid(diags, path.child("pagination"), "'pagination' must be an object");
      return false;
    }
    const SelectionPath page_path = path.child("pagination");
    pagination.offset = optional_bool(*page_it, "offset", page_path, diags);
    pagination.keyset = optional_bool(*page_it, "keyset", page_path, diags);
    pagination.required = optional_bool(*page_it, "required", page_path, diags);
  }

  registry.add_action(*name, *entity, *kind, pagination);
  return true;
}

}  // namespace

const Type * parse_scalar_type(
  TypeContext & types, const nlohmann::json & node, const SelectionPath & path,
  DiagnosticBag & diags)
{
  const auto type_name = require_string(node, "type", path, diags);
  if (!type_name) {
    return nullptr;
  }

  const Type * type = nullptr;
  if (*type_name == "enum") {
    auto values = node.find("values");
    if (values == node.end() || !values->is_array() || values->empty()) {
      report_invalid(diags, path, "enum type needs a non-empty 'values' list");
      return nullptr;
    }
    std::vector<std::string> owned;
    for (const auto & v : *values) {
      if (!v.is_string()) {
        report_invalid(diags, path.child("values"), "enum values must be strings");
        return nullptr;
      }
      owned.push_back(v.get<std::string>());
    }
    std::vector<std::string_view> views(owned.begin(), owned.end());
    type = types.get_literal_type(views);
  } else {
    type = types.lookup_scalar(*type_name);
    if (type == nullptr) {
      diags.report_error(path.child("type"), "unknown scalar type '" + *type_name + "'")
        .with_kind(DiagnosticKind::UnknownScalarType)
        .with_subject(*type_name)
        .with_help(
          "expected one of string, integer, float, decimal, boolean, date, datetime, time, "
          "uuid, json, any or enum");
      return nullptr;
    }
  }

  if (optional_bool(node, "array", path, diags)) {
    type = types.get_array_type(type);
  }
  if (optional_bool(node, "nullable", path, diags)) {
    type = types.get_nullable_type(type);
  }
  return type;
}

bool load_schema_document(
  EntityRegistry & registry, const nlohmann::json & document, DiagnosticBag & diags,
  std::string_view root)
{
  const SelectionPath path(root);
  if (!document.is_object()) {
    report_invalid(diags, path, "schema document must be an object");
    return false;
  }

  bool ok = true;
  if (const auto * entities = optional_list(document, "entities", path, diags)) {
    for (size_t i = 0; i < entities->size(); ++i) {
      ok = load_entity(registry, (*entities)[i], path.child("entities").at(i), diags) && ok;
    }
  } else {
    ok = document.contains("entities") ? false : ok;
  }

  if (const auto * actions = optional_list(document, "actions", path, diags)) {
    for (size_t i = 0; i < actions->size(); ++i) {
      ok = load_action(registry, (*actions)[i], path.child("actions").at(i), diags) && ok;
    }
  }
  return ok && !diags.has_errors();
}

bool load_schema_file(
  EntityRegistry & registry, const std::filesystem::path & path, DiagnosticBag & diags)
{
  const SelectionPath root(EntityRegistry::k_schema_root);

  std::ifstream in(path);
  if (!in.is_open()) {
    report_invalid(diags, root, "cannot open schema file: " + path.string());
    return false;
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error & e) {
    report_invalid(diags, root, "failed to parse " + path.string() + ": " + e.what());
    return false;
  }

  return load_schema_document(registry, document, diags);
}

}  // namespace typed_select
