// typed_select/codegen/ts_emitter.hpp - TypeScript declarations for shapes
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "typed_select/schema/type.hpp"

namespace typed_select
{

struct TsEmitOptions
{
  int indent_width = 2;
  bool export_types = true;
};

/**
 * Collects named shapes and renders them as `type` declarations.
 *
 * Objects are rendered one member per line; everything else inline:
 *
 *   export type TodoRow = {
 *     id: string;
 *     author: {
 *       name: string;
 *     } | null;
 *   };
 */
class TsEmitter
{
public:
  explicit TsEmitter(TsEmitOptions options = {}) : options_(options) {}

  void add(std::string name, const Type * shape);

  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  /// Render every declaration, in insertion order
  [[nodiscard]] std::string emit() const;

  /// Render a single type expression at the given nesting level
  [[nodiscard]] std::string render(const Type * shape, int level = 0) const;

private:
  [[nodiscard]] std::string render_object(const Type * shape, int level) const;
  [[nodiscard]] std::string indent(int level) const;

  TsEmitOptions options_;
  std::vector<std::pair<std::string, const Type *>> entries_;
};

}  // namespace typed_select
