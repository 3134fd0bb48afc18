// typed_select/schema/type_utils.cpp - Shared type utilities implementation
//
#include "typed_select/schema/type_utils.hpp"

#include <cctype>
#include <vector>

namespace typed_select
{

// ============================================================================
// Rendering
// ============================================================================

std::string_view ts_scalar_name(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Integer:
    case TypeKind::Float:
      return "number";
    case TypeKind::Boolean:
      return "boolean";
    case TypeKind::Json:
      return "Record<string, any>";
    case TypeKind::Any:
      return "any";
    case TypeKind::String:
    case TypeKind::Decimal:
    case TypeKind::Date:
    case TypeKind::DateTime:
    case TypeKind::Time:
    case TypeKind::Uuid:
      return "string";
    default:
      return "unknown";
  }
}

std::string_view scalar_name(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::String:
      return "string";
    case TypeKind::Integer:
      return "integer";
    case TypeKind::Float:
      return "float";
    case TypeKind::Decimal:
      return "decimal";
    case TypeKind::Boolean:
      return "boolean";
    case TypeKind::Date:
      return "date";
    case TypeKind::DateTime:
      return "datetime";
    case TypeKind::Time:
      return "time";
    case TypeKind::Uuid:
      return "uuid";
    case TypeKind::Json:
      return "json";
    case TypeKind::Any:
      return "any";
    case TypeKind::Literal:
      return "literal";
    case TypeKind::Array:
      return "array";
    case TypeKind::Nullable:
      return "nullable";
    case TypeKind::Object:
      return "object";
    case TypeKind::Union:
      return "union";
  }
  return "unknown";
}

bool is_identifier(std::string_view name) noexcept
{
  if (name.empty()) {
    return false;
  }
  const auto first = static_cast<unsigned char>(name.front());
  if (std::isdigit(first) != 0) {
    return false;
  }
  for (const char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && c != '_' && c != '$') {
      return false;
    }
  }
  return true;
}

std::string quote_string(std::string_view text)
{
  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (const char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static constexpr char k_hex[] = "0123456789abcdef";
          out += "\\u00";
          out += k_hex[(static_cast<unsigned char>(c) >> 4) & 0xF];
          out += k_hex[static_cast<unsigned char>(c) & 0xF];
        } else {
          out += c;
        }
    }
  }
  out += '"';
  return out;
}

std::string property_key(std::string_view name)
{
  return is_identifier(name) ? std::string(name) : quote_string(name);
}

std::string to_string(const Type * type)
{
  if (!type) return "<null>";

  switch (type->kind) {
    case TypeKind::Literal: {
      std::string out;
      for (size_t i = 0; i < type->literals.size(); ++i) {
        if (i > 0) out += " | ";
        out += quote_string(type->literals[i]);
      }
      return out.empty() ? "never" : out;
    }

    case TypeKind::Array:
      return "Array<" + to_string(type->element_type) + ">";

    case TypeKind::Nullable:
      return to_string(type->base_type) + " | null";

    case TypeKind::Object: {
      if (type->fields.empty()) return "{}";
      std::string out = "{ ";
      for (size_t i = 0; i < type->fields.size(); ++i) {
        const ObjectField & f = type->fields[i];
        if (i > 0) out += "; ";
        out += property_key(f.name);
        if (f.optional) out += '?';
        out += ": ";
        out += to_string(f.type);
      }
      out += " }";
      return out;
    }

    case TypeKind::Union: {
      std::string out;
      for (size_t i = 0; i < type->alternatives.size(); ++i) {
        if (i > 0) out += " | ";
        out += to_string(type->alternatives[i]);
      }
      return out;
    }

    default:
      return std::string(ts_scalar_name(type->kind));
  }
}

// ============================================================================
// Structural Operations
// ============================================================================

bool same_type(const Type * lhs, const Type * rhs)
{
  if (lhs == rhs) return true;
  if (!lhs || !rhs) return false;
  if (lhs->kind != rhs->kind) return false;

  switch (lhs->kind) {
    case TypeKind::Literal: {
      if (lhs->literals.size() != rhs->literals.size()) return false;
      for (size_t i = 0; i < lhs->literals.size(); ++i) {
        if (lhs->literals[i] != rhs->literals[i]) return false;
      }
      return true;
    }

    case TypeKind::Array:
      return same_type(lhs->element_type, rhs->element_type);

    case TypeKind::Nullable:
      return same_type(lhs->base_type, rhs->base_type);

    case TypeKind::Object: {
      if (lhs->fields.size() != rhs->fields.size()) return false;
      for (size_t i = 0; i < lhs->fields.size(); ++i) {
        const ObjectField & a = lhs->fields[i];
        const ObjectField & b = rhs->fields[i];
        if (a.name != b.name || a.optional != b.optional) return false;
        if (!same_type(a.type, b.type)) return false;
        if ((a.args == nullptr) != (b.args == nullptr)) return false;
        if (a.args && !same_type(a.args, b.args)) return false;
      }
      return true;
    }

    case TypeKind::Union: {
      if (lhs->alternatives.size() != rhs->alternatives.size()) return false;
      for (size_t i = 0; i < lhs->alternatives.size(); ++i) {
        if (!same_type(lhs->alternatives[i], rhs->alternatives[i])) return false;
      }
      return true;
    }

    default:
      // Scalars are identified by kind
      return true;
  }
}

const Type * strip_nullable(const Type * type) noexcept
{
  return (type && type->is_nullable()) ? type->base_type : type;
}

const Type * merge_shapes(TypeContext & types, const Type * lhs, const Type * rhs)
{
  if (!lhs) return rhs;
  if (!rhs) return lhs;
  if (same_type(lhs, rhs)) return lhs;

  if (lhs->is_object() && rhs->is_object()) {
    std::vector<ObjectField> merged(lhs->fields.begin(), lhs->fields.end());
    for (const auto & f : rhs->fields) {
      ObjectField * existing = nullptr;
      for (auto & m : merged) {
        if (m.name == f.name) {
          existing = &m;
          break;
        }
      }
      if (existing == nullptr) {
        merged.push_back(f);
        continue;
      }
      existing->type = merge_shapes(types, existing->type, f.type);
      existing->optional = existing->optional && f.optional;
      existing->args = merge_shapes(types, existing->args, f.args);
    }
    return types.get_object_type(merged);
  }

  if (lhs->is_array() && rhs->is_array()) {
    return types.get_array_type(merge_shapes(types, lhs->element_type, rhs->element_type));
  }

  if (lhs->is_nullable() || rhs->is_nullable()) {
    return types.get_nullable_type(
      merge_shapes(types, strip_nullable(lhs), strip_nullable(rhs)));
  }

  const Type * const alternatives[] = {lhs, rhs};
  return types.get_union_type(alternatives);
}

// ============================================================================
// Value Matching
// ============================================================================

bool json_matches_type(const Type * type, const nlohmann::json & value)
{
  if (!type) return false;

  switch (type->kind) {
    case TypeKind::String:
    case TypeKind::Date:
    case TypeKind::DateTime:
    case TypeKind::Time:
    case TypeKind::Uuid:
      return value.is_string();

    case TypeKind::Integer:
      return value.is_number_integer();

    case TypeKind::Float:
      return value.is_number();

    case TypeKind::Decimal:
      return value.is_string() || value.is_number();

    case TypeKind::Boolean:
      return value.is_boolean();

    case TypeKind::Json:
      return value.is_object();

    case TypeKind::Any:
      return true;

    case TypeKind::Literal:
      return value.is_string() && type->has_literal(value.get_ref<const std::string &>());

    case TypeKind::Array: {
      if (!value.is_array()) return false;
      for (const auto & element : value) {
        if (!json_matches_type(type->element_type, element)) return false;
      }
      return true;
    }

    case TypeKind::Nullable:
      return value.is_null() || json_matches_type(type->base_type, value);

    case TypeKind::Object: {
      if (!value.is_object()) return false;
      for (const auto & f : type->fields) {
        auto it = value.find(std::string(f.name));
        if (it == value.end()) {
          if (!f.optional) return false;
          continue;
        }
        if (!json_matches_type(f.type, *it)) return false;
      }
      for (auto it = value.begin(); it != value.end(); ++it) {
        if (type->find_field(it.key()) == nullptr) return false;
      }
      return true;
    }

    case TypeKind::Union: {
      for (const auto * alt : type->alternatives) {
        if (json_matches_type(alt, value)) return true;
      }
      return false;
    }
  }
  return false;
}

}  // namespace typed_select
