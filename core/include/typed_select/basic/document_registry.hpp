// typed_select/basic/document_registry.hpp - Documents referenced by diagnostics
//
// Diagnostics locate problems with a SelectionPath whose root names the
// document it points into ("selection", "page", "result", ...). The registry
// maps those root names back to the parsed JSON so that printers can show
// the offending fragment.
//
#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "typed_select/basic/selection_path.hpp"

namespace typed_select
{

/**
 * A JSON document plus the file it was read from (if any).
 */
struct Document
{
  nlohmann::json value;
  std::filesystem::path file_path;
};

/**
 * Owns the documents a request was built from, keyed by path root name.
 */
class DocumentRegistry
{
public:
  DocumentRegistry() = default;

  /// Register (or replace) the document for a root name
  void add(std::string_view root, nlohmann::json value, std::filesystem::path file_path = {});

  [[nodiscard]] const Document * find(std::string_view root) const;

  /// Node at `path`, or nullptr if the root is unknown or the path does not exist
  [[nodiscard]] const nlohmann::json * resolve(const SelectionPath & path) const;

  /// Compact dump of the node at `path`, truncated to `max_width` characters
  [[nodiscard]] std::optional<std::string> fragment(
    const SelectionPath & path, size_t max_width = 72) const;

  /// Display name for the document (file name relative to cwd, or the root name)
  [[nodiscard]] std::string display_name(std::string_view root) const;

  [[nodiscard]] bool empty() const noexcept { return documents_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return documents_.size(); }

private:
  std::map<std::string, Document, std::less<>> documents_;
};

}  // namespace typed_select
