// typed_select/projection/conformance.cpp - Result value vs. shape checks

#include "typed_select/projection/conformance.hpp"

#include <string>

#include "typed_select/schema/type_utils.hpp"

namespace typed_select
{

namespace
{

void mismatch(
  DiagnosticBag & diags, const SelectionPath & path, const Type * expected,
  const nlohmann::json & value)
{
  diags
    .report_error(
      path, "expected " + to_string(expected) + ", found " + std::string(value.type_name()),
      "does not match the projected shape")
    .with_kind(DiagnosticKind::ShapeMismatch);
}

bool check(
  const Type * shape, const nlohmann::json & value, DiagnosticBag & diags,
  const SelectionPath & path)
{
  switch (shape->kind) {
    case TypeKind::Nullable:
      return value.is_null() || check(shape->base_type, value, diags, path);

    case TypeKind::Array: {
      if (!value.is_array()) {
        mismatch(diags, path, shape, value);
        return false;
      }
      bool ok = true;
      for (size_t i = 0; i < value.size(); ++i) {
        ok = check(shape->element_type, value[i], diags, path.at(i)) && ok;
      }
      return ok;
    }

    case TypeKind::Object: {
      if (!value.is_object()) {
        mismatch(diags, path, shape, value);
        return false;
      }
      bool ok = true;
      for (const auto & field : shape->fields) {
        auto it = value.find(std::string(field.name));
        if (it == value.end()) {
          if (!field.optional) {
            diags
              .report_error(
                path, "missing key '" + std::string(field.name) + "'", "required by the shape")
              .with_kind(DiagnosticKind::ShapeMismatch)
              .with_subject(std::string(field.name));
            ok = false;
          }
          continue;
        }
        ok = check(field.type, *it, diags, path.child(field.name)) && ok;
      }
      for (const auto & [key, _] : value.items()) {
        if (shape->find_field(key) == nullptr) {
          diags
            .report_error(path.child(key), "unexpected key '" + key + "'", "not in the shape")
            .with_kind(DiagnosticKind::ShapeMismatch)
            .with_subject(key);
          ok = false;
        }
      }
      return ok;
    }

    case TypeKind::Union: {
      for (const Type * alternative : shape->alternatives) {
        DiagnosticBag scratch;
        if (check(alternative, value, scratch, path)) {
          return true;
        }
      }
      mismatch(diags, path, shape, value);
      return false;
    }

    default:
      if (!json_matches_type(shape, value)) {
        mismatch(diags, path, shape, value);
        return false;
      }
      return true;
  }
}

}  // namespace

bool check_conformance(
  const Type * shape, const nlohmann::json & value, DiagnosticBag & diags,
  const SelectionPath & path)
{
  return check(shape, value, diags, path);
}

}  // namespace typed_select
