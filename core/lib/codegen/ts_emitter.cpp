// typed_select/codegen/ts_emitter.cpp - TypeScript declarations for shapes
//
#include "typed_select/codegen/ts_emitter.hpp"

#include <fmt/format.h>

#include "typed_select/schema/type_utils.hpp"

namespace typed_select
{

void TsEmitter::add(std::string name, const Type * shape)
{
  entries_.emplace_back(std::move(name), shape);
}

std::string TsEmitter::emit() const
{
  std::string out;
  for (const auto & [name, shape] : entries_) {
    if (!out.empty()) {
      out += '\n';
    }
    out += fmt::format(
      "{}type {} = {};\n", options_.export_types ? "export " : "", name, render(shape, 0));
  }
  return out;
}

std::string TsEmitter::indent(int level) const
{
  return std::string(static_cast<size_t>(level * options_.indent_width), ' ');
}

std::string TsEmitter::render(const Type * shape, int level) const
{
  if (!shape) return "never";

  switch (shape->kind) {
    case TypeKind::Object:
      return render_object(shape, level);

    case TypeKind::Array:
      return "Array<" + render(shape->element_type, level) + ">";

    case TypeKind::Nullable:
      return render(shape->base_type, level) + " | null";

    case TypeKind::Union: {
      std::string out;
      for (size_t i = 0; i < shape->alternatives.size(); ++i) {
        if (i > 0) out += " | ";
        out += render(shape->alternatives[i], level);
      }
      return out;
    }

    default:
      return to_string(shape);
  }
}

std::string TsEmitter::render_object(const Type * shape, int level) const
{
  if (shape->fields.empty()) {
    return "{}";
  }

  std::string out = "{\n";
  for (const auto & f : shape->fields) {
    out += fmt::format(
      "{}{}{}: {};\n", indent(level + 1), property_key(f.name), f.optional ? "?" : "",
      render(f.type, level + 1));
  }
  out += indent(level) + "}";
  return out;
}

}  // namespace typed_select
