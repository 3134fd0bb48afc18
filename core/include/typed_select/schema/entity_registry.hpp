// typed_select/schema/entity_registry.hpp - Registry of TypedEntities and actions
//
// Entities are declared first and filled in afterwards so that cyclic
// graphs (self-referencing relationships) can be described. finalize()
// resolves references, checks schema invariants and freezes the registry;
// afterwards it is read-only and safe to share between threads.
//
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <memory_resource>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "typed_select/basic/diagnostic.hpp"
#include "typed_select/schema/entity.hpp"
#include "typed_select/schema/type.hpp"

namespace typed_select
{

// ============================================================================
// Actions
// ============================================================================

enum class ActionKind : uint8_t {
  Read,
  Get,
  Create,
  Update,
  Destroy,
};

[[nodiscard]] std::string_view to_string(ActionKind kind) noexcept;

/// Parse "read" | "get" | "create" | "update" | "destroy"
[[nodiscard]] std::optional<ActionKind> parse_action_kind(std::string_view text) noexcept;

/**
 * Pagination flavors supported by a read action.
 */
struct PaginationSupport
{
  bool offset = false;
  bool keyset = false;

  /// Results are always paginated, even without page parameters
  bool required = false;

  [[nodiscard]] bool supported() const noexcept { return offset || keyset; }
  [[nodiscard]] bool mixed() const noexcept { return offset && keyset; }
};

/**
 * An action exposed to clients, returning records of `entity`.
 */
struct ActionSpec
{
  std::string_view name;
  std::string_view entity_name;
  const TypedEntity * entity = nullptr;
  ActionKind kind = ActionKind::Read;
  PaginationSupport pagination;
};

// ============================================================================
// Entity Registry
// ============================================================================

class EntityRegistry
{
public:
  /// Root name of diagnostic paths for schema problems
  static constexpr std::string_view k_schema_root = "schema";

  EntityRegistry();

  // Non-copyable and non-movable (entities point into the arena)
  EntityRegistry(const EntityRegistry &) = delete;
  EntityRegistry & operator=(const EntityRegistry &) = delete;
  EntityRegistry(EntityRegistry &&) = delete;
  EntityRegistry & operator=(EntityRegistry &&) = delete;

  // ===========================================================================
  // Declaration (before finalize)
  // ===========================================================================

  TypedEntity & declare_resource(std::string_view name);
  TypedEntity & declare_typed_map(std::string_view name);
  TypedEntity & declare_union(std::string_view name, std::string_view tag_field);

  void add_primitive(TypedEntity & entity, std::string_view name, const Type * type);

  void add_relationship(
    TypedEntity & entity, std::string_view name, std::string_view target, FieldFlags flags = {});

  /**
   * Add a calculation returning an entity.
   *
   * @param args Declared arguments, or std::nullopt when the calculation
   *             takes no argument payload at all
   */
  void add_entity_calculation(
    TypedEntity & entity, std::string_view name, std::string_view target,
    std::optional<std::vector<ArgSpec>> args, FieldFlags flags = {});

  /// Add a calculation returning a scalar (must declare an ArgSpec)
  void add_scalar_calculation(
    TypedEntity & entity, std::string_view name, const Type * return_type,
    std::optional<std::vector<ArgSpec>> args, FieldFlags flags = {});

  void add_nested_map(
    TypedEntity & entity, std::string_view name, std::string_view target, FieldFlags flags = {});

  void add_union_field(
    TypedEntity & entity, std::string_view name, std::string_view target, FieldFlags flags = {});

  /// Add a union member whose value is a Resource or TypedMap
  void add_variant(TypedEntity & union_entity, std::string_view tag, std::string_view entity_name);

  /// Add a union member whose value is a scalar
  void add_primitive_member(TypedEntity & union_entity, std::string_view tag, const Type * type);

  ActionSpec & add_action(
    std::string_view name, std::string_view entity_name, ActionKind kind,
    PaginationSupport pagination = {});

  /**
   * Resolve references, check invariants and freeze the registry.
   *
   * Reports every violation found; the registry is frozen only when
   * there are none.
   *
   * @return true if the registry is now frozen
   */
  bool finalize(DiagnosticBag & diags);

  [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }

  // ===========================================================================
  // Lookup
  // ===========================================================================

  // Lookups require a finalized registry and throw std::logic_error before
  // finalize() has succeeded, since field targets are unresolved until then.

  /// Look up an entity; nullptr when unknown
  [[nodiscard]] const TypedEntity * lookup(std::string_view name) const;

  /// Look up an entity that must exist (throws std::logic_error otherwise)
  [[nodiscard]] const TypedEntity & resolve(std::string_view name) const;

  [[nodiscard]] const ActionSpec * lookup_action(std::string_view name) const;
  [[nodiscard]] const ActionSpec & resolve_action(std::string_view name) const;

  [[nodiscard]] std::vector<const TypedEntity *> entities() const;
  [[nodiscard]] std::vector<const ActionSpec *> actions() const;
  [[nodiscard]] size_t size() const noexcept { return index_.size(); }

  /// Type context owning the declared scalar types and interned names
  [[nodiscard]] TypeContext & types() noexcept { return types_; }
  [[nodiscard]] const TypeContext & types() const noexcept { return types_; }

private:
  TypedEntity & declare(EntityKind kind, std::string_view name);
  void ensure_mutable(std::string_view operation) const;
  void add_complex(TypedEntity & entity, FieldSpec * field);
  static void add_primitive_entry(TypedEntity & entity, PrimitiveField field);

  template <typename T>
  T * create_field(std::string_view name, std::string_view target, FieldFlags flags)
  {
    static_assert(
      std::is_trivially_destructible_v<T>, "FieldSpec must be trivially destructible");
    void * const mem = field_arena_.allocate(sizeof(T), alignof(T));
    T * const field = new (mem) T();
    field->name = types_.intern(name);
    field->target_name = target.empty() ? std::string_view{} : types_.intern(target);
    field->flags = flags;
    return field;
  }

  gsl::span<const ArgSpec> copy_args(const std::vector<ArgSpec> & args);
  void require_frozen(std::string_view name) const;

  // Finalization passes
  void check_duplicates(DiagnosticBag & diags) const;
  void check_fields(TypedEntity & entity, DiagnosticBag & diags);
  void check_union(TypedEntity & entity, DiagnosticBag & diags);
  void check_actions(DiagnosticBag & diags);

  TypeContext types_;
  std::pmr::monotonic_buffer_resource field_arena_{4096};

  // NOTE: entities are referenced by pointer; deque keeps addresses stable.
  std::deque<TypedEntity> entities_;
  std::deque<ActionSpec> actions_;
  NameMap<TypedEntity *> index_;
  NameMap<ActionSpec *> action_index_;

  // Complex fields in declaration order, with their owner (for finalize)
  std::vector<std::pair<TypedEntity *, FieldSpec *>> fields_;

  std::vector<std::string_view> duplicate_entities_;
  std::vector<std::string_view> duplicate_actions_;

  bool frozen_ = false;
};

// ============================================================================
// Process-wide registry
// ============================================================================

/**
 * Install the process-wide registry. Must be called once, with a frozen
 * registry, before any global_registry() call.
 *
 * @throws std::logic_error if already installed or not frozen
 */
void install_global_registry(std::unique_ptr<EntityRegistry> registry);

/**
 * The process-wide registry.
 *
 * @throws std::logic_error if none has been installed
 */
[[nodiscard]] const EntityRegistry & global_registry();

/// Whether install_global_registry() has completed
[[nodiscard]] bool has_global_registry() noexcept;

}  // namespace typed_select
