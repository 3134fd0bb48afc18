// typed_select/basic/selection_path.cpp - SelectionPath implementation
//
#include "typed_select/basic/selection_path.hpp"

#include <cctype>
#include <utility>

namespace typed_select
{

namespace
{

/// Keys that can be written as `.key` without quoting
bool is_plain_key(std::string_view key)
{
  if (key.empty()) {
    return false;
  }
  for (const char c : key) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_' && c != '-') {
      return false;
    }
  }
  return true;
}

}  // namespace

SelectionPath SelectionPath::child(std::string_view key) const
{
  SelectionPath out = *this;
  PathSegment seg;
  seg.kind = PathSegment::Kind::Key;
  seg.key = std::string(key);
  out.segments_.push_back(std::move(seg));
  return out;
}

SelectionPath SelectionPath::at(size_t index) const
{
  SelectionPath out = *this;
  PathSegment seg;
  seg.kind = PathSegment::Kind::Index;
  seg.index = index;
  out.segments_.push_back(std::move(seg));
  return out;
}

std::string SelectionPath::to_string() const
{
  std::string out = root_;
  for (const auto & seg : segments_) {
    if (seg.is_index()) {
      out += '[';
      out += std::to_string(seg.index);
      out += ']';
    } else if (is_plain_key(seg.key)) {
      out += '.';
      out += seg.key;
    } else {
      out += "[\"";
      out += seg.key;
      out += "\"]";
    }
  }
  return out;
}

}  // namespace typed_select
