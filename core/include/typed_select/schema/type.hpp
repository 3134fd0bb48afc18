// typed_select/schema/type.hpp - Scalar and shape type representation
//
// Represents both the declared scalar types of schema fields and the
// projected output shapes (objects, arrays, nullables, unions).
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace typed_select
{

struct Type;

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of type.
 */
enum class TypeKind {
  // Scalar types
  String,
  Integer,
  Float,
  Decimal,
  Boolean,
  Date,
  DateTime,
  Time,
  Uuid,
  Json,  ///< Free-form JSON object
  Any,

  // Literal set
  Literal,  ///< "a" | "b" | ...

  // Wrappers
  Array,     ///< Array<T>
  Nullable,  ///< T | null

  // Structured shapes
  Object,  ///< { key: T; ... }
  Union,   ///< A | B
};

/**
 * One member of an Object type.
 */
struct ObjectField
{
  std::string_view name;
  const Type * type = nullptr;

  /// Key may be absent from the value
  bool optional = false;

  /// Arguments the field was computed with (Object type), or nullptr
  const Type * args = nullptr;
};

// ============================================================================
// Type
// ============================================================================

/**
 * Type representation.
 *
 * Types are immutable and owned by a TypeContext; composite types are
 * interned per context, so pointer equality implies structural equality
 * within one context. Use same_type() to compare across contexts.
 */
struct Type
{
  TypeKind kind;

  /// For Array: element type
  const Type * element_type = nullptr;

  /// For Nullable: base type
  const Type * base_type = nullptr;

  /// For Literal: allowed values, in declaration order
  gsl::span<const std::string_view> literals;

  /// For Object: members, in insertion order
  gsl::span<const ObjectField> fields;

  /// For Union: alternatives
  gsl::span<const Type * const> alternatives;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_scalar() const noexcept { return kind <= TypeKind::Literal; }
  [[nodiscard]] bool is_literal() const noexcept { return kind == TypeKind::Literal; }
  [[nodiscard]] bool is_array() const noexcept { return kind == TypeKind::Array; }
  [[nodiscard]] bool is_nullable() const noexcept { return kind == TypeKind::Nullable; }
  [[nodiscard]] bool is_object() const noexcept { return kind == TypeKind::Object; }
  [[nodiscard]] bool is_union() const noexcept { return kind == TypeKind::Union; }

  /// Find an Object member by name
  [[nodiscard]] const ObjectField * find_field(std::string_view name) const noexcept
  {
    for (const auto & f : fields) {
      if (f.name == name) {
        return &f;
      }
    }
    return nullptr;
  }

  /// Check whether a Literal type admits `value`
  [[nodiscard]] bool has_literal(std::string_view value) const noexcept
  {
    for (const auto lit : literals) {
      if (lit == value) {
        return true;
      }
    }
    return false;
  }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Type context for interning and managing types.
 *
 * Provides singleton instances for scalar types and creates interned
 * composite types on demand. All memory is released with the context.
 *
 * Names stored in Object/Literal types are interned by the context.
 */
class TypeContext
{
public:
  /// Default initial arena size (16KB)
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit TypeContext(size_t initial_buffer_size = k_default_buffer_size);

  // Non-copyable and non-movable (PMR resources are not movable)
  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;
  TypeContext(TypeContext &&) = delete;
  TypeContext & operator=(TypeContext &&) = delete;

  // ===========================================================================
  // Scalar Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * string_type() const noexcept { return &string_; }
  [[nodiscard]] const Type * integer_type() const noexcept { return &integer_; }
  [[nodiscard]] const Type * float_type() const noexcept { return &float_; }
  [[nodiscard]] const Type * decimal_type() const noexcept { return &decimal_; }
  [[nodiscard]] const Type * boolean_type() const noexcept { return &boolean_; }
  [[nodiscard]] const Type * date_type() const noexcept { return &date_; }
  [[nodiscard]] const Type * datetime_type() const noexcept { return &datetime_; }
  [[nodiscard]] const Type * time_type() const noexcept { return &time_; }
  [[nodiscard]] const Type * uuid_type() const noexcept { return &uuid_; }
  [[nodiscard]] const Type * json_type() const noexcept { return &json_; }
  [[nodiscard]] const Type * any_type() const noexcept { return &any_; }

  // ===========================================================================
  // Composite Type Creation (Interned)
  // ===========================================================================

  /// Get literal set type: "a" | "b"
  const Type * get_literal_type(gsl::span<const std::string_view> values);

  /// Get array type: Array<T>
  const Type * get_array_type(const Type * element_type);

  /// Get nullable type: T | null
  const Type * get_nullable_type(const Type * base_type);

  /// Get object type: { a: T; b?: U }
  const Type * get_object_type(gsl::span<const ObjectField> fields);

  /// Get union type: A | B (a single alternative is returned as-is)
  const Type * get_union_type(gsl::span<const Type * const> alternatives);

  // ===========================================================================
  // Lookup / Interning
  // ===========================================================================

  /// Look up a scalar type by its schema name (e.g. "string", "utc_datetime")
  /// Returns nullptr if not a scalar type name
  [[nodiscard]] const Type * lookup_scalar(std::string_view name) const;

  /// Intern a string and return a view that lives as long as the context
  std::string_view intern(std::string_view s);

private:
  template <typename T>
  gsl::span<const T> copy_to_arena(gsl::span<const T> src)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena elements are never destroyed");
    if (src.empty()) {
      return {};
    }
    void * const mem = arena_.allocate(sizeof(T) * src.size(), alignof(T));
    T * const out = static_cast<T *>(mem);
    for (size_t i = 0; i < src.size(); ++i) {
      new (out + i) T(src[i]);
    }
    return gsl::span<const T>(out, src.size());
  }

  // Scalar singletons
  Type string_, integer_, float_, decimal_, boolean_;
  Type date_, datetime_, time_, uuid_;
  Type json_, any_;

  // Arena for composite types and their member arrays
  std::pmr::monotonic_buffer_resource arena_;
  // NOTE: pointers to interned composite types are handed out widely.
  // We must use a container with stable element addresses.
  std::pmr::deque<Type> composite_types_{&arena_};
  std::pmr::unordered_set<std::pmr::string> string_pool_{&arena_};
};

}  // namespace typed_select
