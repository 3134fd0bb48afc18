// typed_select/projection/pagination.cpp - Pagination shape resolution

#include "typed_select/projection/pagination.hpp"

#include <string>
#include <vector>

namespace typed_select
{

std::string_view to_string(PaginationFlavor flavor) noexcept
{
  switch (flavor) {
    case PaginationFlavor::None:
      return "none";
    case PaginationFlavor::Offset:
      return "offset";
    case PaginationFlavor::Keyset:
      return "keyset";
  }
  return "none";
}

namespace
{

void report_parameter(
  DiagnosticBag & diags, const SelectionPath & path, std::string message, std::string_view key)
{
  auto builder = diags.report_error(path, std::move(message));
  builder.with_kind(DiagnosticKind::InvalidPaginationParameter);
  if (!key.empty()) {
    builder.with_subject(std::string(key));
  }
}

bool is_positive_integer(const nlohmann::json & v)
{
  if (v.is_number_unsigned()) return v.get<uint64_t>() > 0;
  if (v.is_number_integer()) return v.get<int64_t>() > 0;
  return false;
}

bool is_non_negative_integer(const nlohmann::json & v)
{
  if (v.is_number_unsigned()) return true;
  if (v.is_number_integer()) return v.get<int64_t>() >= 0;
  return false;
}

ObjectField member(std::string_view name, const Type * type, bool optional = false)
{
  ObjectField f;
  f.name = name;
  f.type = type;
  f.optional = optional;
  return f;
}

const Type * discriminant(TypeContext & types, std::string_view flavor)
{
  const std::string_view values[] = {flavor};
  return types.get_literal_type(values);
}

}  // namespace

std::optional<PaginationFlavor> classify_page(
  const nlohmann::json & page, const PaginationSupport & support, DiagnosticBag & diags,
  const SelectionPath & path)
{
  if (!support.supported()) {
    report_parameter(diags, path, "action does not support pagination", {});
    return std::nullopt;
  }
  if (!support.mixed()) {
    return support.offset ? PaginationFlavor::Offset : PaginationFlavor::Keyset;
  }
  if (!page.is_object()) {
    report_parameter(
      diags, path, "page parameters must be an object, found " + std::string(page.type_name()), {});
    return std::nullopt;
  }

  bool offset_keys = false;
  bool keyset_keys = false;

  for (const auto & [key, value] : page.items()) {
    const SelectionPath key_path = path.child(key);
    if (key == "limit") {
      if (!is_positive_integer(value)) {
        report_parameter(diags, key_path, "'limit' must be a positive integer", key);
        return std::nullopt;
      }
    } else if (key == "offset") {
      if (!is_non_negative_integer(value)) {
        report_parameter(diags, key_path, "'offset' must be a non-negative integer", key);
        return std::nullopt;
      }
      offset_keys = true;
    } else if (key == "count") {
      if (!value.is_boolean()) {
        report_parameter(diags, key_path, "'count' must be a boolean", key);
        return std::nullopt;
      }
      offset_keys = true;
    } else if (key == "after" || key == "before") {
      if (!value.is_string()) {
        report_parameter(diags, key_path, "'" + key + "' must be a cursor string", key);
        return std::nullopt;
      }
      keyset_keys = true;
    } else {
      report_parameter(diags, key_path, "unknown page parameter '" + key + "'", key);
      return std::nullopt;
    }
  }

  if (page.empty() || (offset_keys && keyset_keys)) {
    diags
      .report_error(
        path, page.empty() ? "empty page parameters match neither offset nor keyset pagination"
                           : "page parameters mix offset and keyset pagination")
      .with_kind(DiagnosticKind::AmbiguousOrInvalidPagination)
      .with_help("use {\"limit\", \"offset\", \"count\"} or {\"limit\", \"after\" | \"before\"}");
    return std::nullopt;
  }
  return keyset_keys ? PaginationFlavor::Keyset : PaginationFlavor::Offset;
}

const Type * resolve_page_shape(
  TypeContext & types, const nlohmann::json * page, const Type * base_shape,
  const PaginationSupport & support, const EnvelopeFactory & offset_envelope,
  const EnvelopeFactory & keyset_envelope, DiagnosticBag & diags, const SelectionPath & path)
{
  if (page == nullptr || page->is_null()) {
    if (!support.required || !support.supported()) {
      return base_shape;
    }
    if (support.mixed()) {
      const Type * const alternatives[] = {
        offset_envelope(base_shape), keyset_envelope(base_shape)};
      return types.get_union_type(alternatives);
    }
    return support.offset ? offset_envelope(base_shape) : keyset_envelope(base_shape);
  }

  const auto flavor = classify_page(*page, support, diags, path);
  if (!flavor) {
    return nullptr;
  }
  switch (*flavor) {
    case PaginationFlavor::Offset:
      return offset_envelope(base_shape);
    case PaginationFlavor::Keyset:
      return keyset_envelope(base_shape);
    case PaginationFlavor::None:
      break;
  }
  return base_shape;
}

// ============================================================================
// Envelopes
// ============================================================================

const Type * make_offset_envelope(TypeContext & types, const Type * results, bool discriminated)
{
  std::vector<ObjectField> fields = {
    member("results", results),
    member("hasMore", types.boolean_type()),
    member("limit", types.integer_type()),
    member("offset", types.integer_type()),
    member("count", types.get_nullable_type(types.integer_type()), true),
  };
  if (discriminated) {
    fields.push_back(member("type", discriminant(types, "offset")));
  }
  return types.get_object_type(gsl::span<const ObjectField>(fields.data(), fields.size()));
}

const Type * make_keyset_envelope(TypeContext & types, const Type * results, bool discriminated)
{
  const Type * cursor = types.get_nullable_type(types.string_type());
  std::vector<ObjectField> fields = {
    member("results", results),
    member("hasMore", types.boolean_type()),
    member("limit", types.integer_type()),
    member("after", cursor),
    member("before", cursor),
    member("previousPage", types.string_type()),
    member("nextPage", types.string_type()),
  };
  if (discriminated) {
    fields.push_back(member("count", types.get_nullable_type(types.integer_type()), true));
    fields.push_back(member("type", discriminant(types, "keyset")));
  }
  return types.get_object_type(gsl::span<const ObjectField>(fields.data(), fields.size()));
}

}  // namespace typed_select
