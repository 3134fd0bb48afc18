// typed_select/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any class hierarchy that implements the `classof` static
// method pattern (FieldSpec and its categories).
//
// Usage:
//   if (isa<RelationshipField>(field)) { ... }
//   auto * rel = cast<RelationshipField>(field);           // asserts on failure
//   if (auto * calc = dyn_cast<CalculationField>(field)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>

namespace typed_select
{

namespace detail
{

/// Check if T has a classof static method
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

/**
 * Check if a node is of type T.
 *
 * @return true if node is of type T, false otherwise (including if node is null)
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

/**
 * Cast a node to type T. The node must be non-null and of type T.
 */
template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(static_cast<const From *>(node)) && "Invalid cast");
  return static_cast<T *>(node);
}

/**
 * Safely cast a node to type T, returning nullptr on failure.
 */
template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node)) ? static_cast<T *>(node) : nullptr;
}

}  // namespace typed_select
