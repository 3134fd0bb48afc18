// typed_select/basic/selection_path.hpp - Locations inside JSON documents
//
// A SelectionPath names a node inside a client document (selection, page
// parameters, result value, schema dump) by a root name followed by object
// keys and list indices, e.g. `selection[1].author[0]`.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace typed_select
{

// ============================================================================
// Path Segment
// ============================================================================

struct PathSegment
{
  enum class Kind : uint8_t {
    Key,    ///< Object member
    Index,  ///< List element
  };

  Kind kind = Kind::Key;
  std::string key;
  size_t index = 0;

  [[nodiscard]] bool is_key() const noexcept { return kind == Kind::Key; }
  [[nodiscard]] bool is_index() const noexcept { return kind == Kind::Index; }

  bool operator==(const PathSegment & other) const
  {
    return kind == other.kind && key == other.key && index == other.index;
  }
};

// ============================================================================
// Selection Path
// ============================================================================

/**
 * Immutable path into a JSON document.
 *
 * Paths are small and built incrementally while walking a document, so
 * child()/at() return a new path rather than mutating in place.
 */
class SelectionPath
{
public:
  /// Root name used for client selections
  static constexpr std::string_view k_selection_root = "selection";

  SelectionPath() : root_(k_selection_root) {}
  explicit SelectionPath(std::string_view root) : root_(root) {}

  /// Path to member `key` of the node at this path
  [[nodiscard]] SelectionPath child(std::string_view key) const;

  /// Path to element `index` of the list at this path
  [[nodiscard]] SelectionPath at(size_t index) const;

  [[nodiscard]] std::string_view root() const noexcept { return root_; }
  [[nodiscard]] const std::vector<PathSegment> & segments() const noexcept { return segments_; }
  /// Human-readable form: `selection[1].author[0]`
  [[nodiscard]] std::string to_string() const;

  bool operator==(const SelectionPath & other) const
  {
    return root_ == other.root_ && segments_ == other.segments_;
  }
  bool operator!=(const SelectionPath & other) const { return !(*this == other); }

private:
  std::string root_;
  std::vector<PathSegment> segments_;
};

}  // namespace typed_select
