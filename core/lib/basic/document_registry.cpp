// typed_select/basic/document_registry.cpp - DocumentRegistry implementation
//
#include "typed_select/basic/document_registry.hpp"

#include <system_error>
#include <utility>

namespace typed_select
{

void DocumentRegistry::add(
  std::string_view root, nlohmann::json value, std::filesystem::path file_path)
{
  Document doc;
  doc.value = std::move(value);
  doc.file_path = std::move(file_path);
  documents_.insert_or_assign(std::string(root), std::move(doc));
}

const Document * DocumentRegistry::find(std::string_view root) const
{
  auto it = documents_.find(root);
  return it != documents_.end() ? &it->second : nullptr;
}

const nlohmann::json * DocumentRegistry::resolve(const SelectionPath & path) const
{
  const Document * doc = find(path.root());
  if (doc == nullptr) {
    return nullptr;
  }

  // Walk segment by segment; json_pointer lookups throw on missing members.
  const nlohmann::json * node = &doc->value;
  for (const auto & seg : path.segments()) {
    if (seg.is_index()) {
      if (!node->is_array() || seg.index >= node->size()) {
        return nullptr;
      }
      node = &(*node)[seg.index];
    } else {
      if (!node->is_object()) {
        return nullptr;
      }
      auto it = node->find(seg.key);
      if (it == node->end()) {
        return nullptr;
      }
      node = &*it;
    }
  }
  return node;
}

std::optional<std::string> DocumentRegistry::fragment(
  const SelectionPath & path, size_t max_width) const
{
  const nlohmann::json * node = resolve(path);
  if (node == nullptr) {
    return std::nullopt;
  }

  std::string text = node->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (text.size() > max_width && max_width > 3) {
    text.resize(max_width - 3);
    text += "...";
  }
  return text;
}

std::string DocumentRegistry::display_name(std::string_view root) const
{
  const Document * doc = find(root);
  if (doc == nullptr || doc->file_path.empty()) {
    return std::string(root);
  }

  // Relative path for cleaner output
  std::error_code ec;
  auto rel_path = std::filesystem::relative(doc->file_path, std::filesystem::current_path(), ec);
  return ec ? doc->file_path.string() : rel_path.string();
}

}  // namespace typed_select
