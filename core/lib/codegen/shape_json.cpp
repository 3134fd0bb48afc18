// typed_select/codegen/shape_json.cpp - JSON descriptor for projected shapes
//
#include "typed_select/codegen/shape_json.hpp"

#include <string>

#include "typed_select/schema/type_utils.hpp"

namespace typed_select
{

namespace
{

using nlohmann::json;

json j_field(const ObjectField & field)
{
  json j{
    {"name", std::string(field.name)},
    {"optional", field.optional},
    {"type", to_json(field.type)}};
  if (field.args != nullptr) {
    j["args"] = to_json(field.args);
  }
  return j;
}

}  // namespace

nlohmann::json to_json(const Type * shape)
{
  if (!shape) return json{{"kind", "missing"}};

  json j{{"kind", std::string(scalar_name(shape->kind))}};

  switch (shape->kind) {
    case TypeKind::Literal: {
      json values = json::array();
      for (const auto v : shape->literals) {
        values.push_back(std::string(v));
      }
      j["values"] = std::move(values);
      break;
    }

    case TypeKind::Array:
      j["element"] = to_json(shape->element_type);
      break;

    case TypeKind::Nullable:
      j["base"] = to_json(shape->base_type);
      break;

    case TypeKind::Object: {
      json fields = json::array();
      for (const auto & f : shape->fields) {
        fields.push_back(j_field(f));
      }
      j["fields"] = std::move(fields);
      break;
    }

    case TypeKind::Union: {
      json alternatives = json::array();
      for (const auto * alt : shape->alternatives) {
        alternatives.push_back(to_json(alt));
      }
      j["alternatives"] = std::move(alternatives);
      break;
    }

    default:
      break;
  }
  return j;
}

}  // namespace typed_select
