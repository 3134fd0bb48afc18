// typed_select/schema/entity_registry.cpp - EntityRegistry implementation
//
#include "typed_select/schema/entity_registry.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

#include "typed_select/basic/casting.hpp"

namespace typed_select
{

std::string_view to_string(ActionKind kind) noexcept
{
  switch (kind) {
    case ActionKind::Read:
      return "read";
    case ActionKind::Get:
      return "get";
    case ActionKind::Create:
      return "create";
    case ActionKind::Update:
      return "update";
    case ActionKind::Destroy:
      return "destroy";
  }
  return "read";
}

std::optional<ActionKind> parse_action_kind(std::string_view text) noexcept
{
  if (text == "read") return ActionKind::Read;
  if (text == "get") return ActionKind::Get;
  if (text == "create") return ActionKind::Create;
  if (text == "update") return ActionKind::Update;
  if (text == "destroy") return ActionKind::Destroy;
  return std::nullopt;
}

namespace
{

SelectionPath schema_path(std::string_view entity)
{
  return SelectionPath(EntityRegistry::k_schema_root).child(entity);
}

SelectionPath schema_path(std::string_view entity, std::string_view field)
{
  return schema_path(entity).child(field);
}

std::string quoted(std::string_view s) { return "'" + std::string(s) + "'"; }

}  // namespace

// ============================================================================
// Declaration
// ============================================================================

EntityRegistry::EntityRegistry() = default;

void EntityRegistry::ensure_mutable(std::string_view operation) const
{
  if (frozen_) {
    throw std::logic_error(
      "EntityRegistry::" + std::string(operation) + " called after finalize()");
  }
}

TypedEntity & EntityRegistry::declare(EntityKind kind, std::string_view name)
{
  ensure_mutable("declare");
  const std::string_view interned = types_.intern(name);
  TypedEntity & entity = entities_.emplace_back(kind, interned);
  if (!index_.emplace(interned, &entity).second) {
    duplicate_entities_.push_back(interned);
  }
  return entity;
}

TypedEntity & EntityRegistry::declare_resource(std::string_view name)
{
  return declare(EntityKind::Resource, name);
}

TypedEntity & EntityRegistry::declare_typed_map(std::string_view name)
{
  return declare(EntityKind::TypedMap, name);
}

TypedEntity & EntityRegistry::declare_union(std::string_view name, std::string_view tag_field)
{
  TypedEntity & entity = declare(EntityKind::Union, name);
  entity.tag_field_ = types_.intern(tag_field);
  return entity;
}

void EntityRegistry::add_primitive_entry(TypedEntity & entity, PrimitiveField field)
{
  entity.primitive_index_.emplace(field.name, entity.primitives_.size());
  entity.primitives_.push_back(field);
}

void EntityRegistry::add_primitive(TypedEntity & entity, std::string_view name, const Type * type)
{
  ensure_mutable("add_primitive");
  if (entity.is_union()) {
    throw std::logic_error("add_primitive on union; use add_primitive_member");
  }
  add_primitive_entry(entity, PrimitiveField{types_.intern(name), type});
}

void EntityRegistry::add_complex(TypedEntity & entity, FieldSpec * field)
{
  entity.complex_index_.emplace(field->name, entity.complex_.size());
  entity.complex_.push_back(field);
  fields_.emplace_back(&entity, field);
}

gsl::span<const ArgSpec> EntityRegistry::copy_args(const std::vector<ArgSpec> & args)
{
  if (args.empty()) {
    return {};
  }
  void * const mem = field_arena_.allocate(sizeof(ArgSpec) * args.size(), alignof(ArgSpec));
  auto * const out = static_cast<ArgSpec *>(mem);
  for (size_t i = 0; i < args.size(); ++i) {
    new (out + i) ArgSpec{types_.intern(args[i].name), args[i].type, args[i].required};
  }
  return gsl::span<const ArgSpec>(out, args.size());
}

void EntityRegistry::add_relationship(
  TypedEntity & entity, std::string_view name, std::string_view target, FieldFlags flags)
{
  ensure_mutable("add_relationship");
  add_complex(entity, create_field<RelationshipField>(name, target, flags));
}

void EntityRegistry::add_entity_calculation(
  TypedEntity & entity, std::string_view name, std::string_view target,
  std::optional<std::vector<ArgSpec>> args, FieldFlags flags)
{
  ensure_mutable("add_entity_calculation");
  auto * field = create_field<CalculationField>(name, target, flags);
  field->has_arg_spec = args.has_value();
  if (args) {
    field->args = copy_args(*args);
  }
  add_complex(entity, field);
}

void EntityRegistry::add_scalar_calculation(
  TypedEntity & entity, std::string_view name, const Type * return_type,
  std::optional<std::vector<ArgSpec>> args, FieldFlags flags)
{
  ensure_mutable("add_scalar_calculation");
  if (return_type == nullptr) {
    throw std::logic_error("add_scalar_calculation requires a return type");
  }
  auto * field = create_field<CalculationField>(name, {}, flags);
  field->return_type = return_type;
  field->has_arg_spec = args.has_value();
  if (args) {
    field->args = copy_args(*args);
  }
  add_complex(entity, field);
}

void EntityRegistry::add_nested_map(
  TypedEntity & entity, std::string_view name, std::string_view target, FieldFlags flags)
{
  ensure_mutable("add_nested_map");
  add_complex(entity, create_field<NestedMapField>(name, target, flags));
}

void EntityRegistry::add_union_field(
  TypedEntity & entity, std::string_view name, std::string_view target, FieldFlags flags)
{
  ensure_mutable("add_union_field");
  add_complex(entity, create_field<UnionField>(name, target, flags));
}

void EntityRegistry::add_variant(
  TypedEntity & union_entity, std::string_view tag, std::string_view entity_name)
{
  ensure_mutable("add_variant");
  if (!union_entity.is_union()) {
    throw std::logic_error(
      "add_variant called on non-union '" + std::string(union_entity.name()) + "'");
  }
  UnionMember member;
  member.tag = types_.intern(tag);
  member.entity_name = types_.intern(entity_name);
  union_entity.member_index_.emplace(member.tag, union_entity.members_.size());
  union_entity.members_.push_back(member);
}

void EntityRegistry::add_primitive_member(
  TypedEntity & union_entity, std::string_view tag, const Type * type)
{
  ensure_mutable("add_primitive_member");
  if (!union_entity.is_union()) {
    throw std::logic_error(
      "add_primitive_member called on non-union '" + std::string(union_entity.name()) + "'");
  }
  if (type == nullptr) {
    throw std::logic_error("add_primitive_member requires a type");
  }
  UnionMember member;
  member.tag = types_.intern(tag);
  member.type = type;
  union_entity.member_index_.emplace(member.tag, union_entity.members_.size());
  union_entity.members_.push_back(member);
}

ActionSpec & EntityRegistry::add_action(
  std::string_view name, std::string_view entity_name, ActionKind kind,
  PaginationSupport pagination)
{
  ensure_mutable("add_action");
  ActionSpec & action = actions_.emplace_back();
  action.name = types_.intern(name);
  action.entity_name = types_.intern(entity_name);
  action.kind = kind;
  action.pagination = pagination;
  if (!action_index_.emplace(action.name, &action).second) {
    duplicate_actions_.push_back(action.name);
  }
  return action;
}

// ============================================================================
// Finalization
// ============================================================================

bool EntityRegistry::finalize(DiagnosticBag & diags)
{
  if (frozen_) {
    return true;
  }

  DiagnosticBag local;
  check_duplicates(local);
  for (auto & entity : entities_) {
    if (entity.is_union()) {
      check_union(entity, local);
    }
  }
  for (auto & entity : entities_) {
    check_fields(entity, local);
  }
  check_actions(local);

  const bool ok = !local.has_errors();
  diags.merge(std::move(local));
  frozen_ = ok;
  return ok;
}

void EntityRegistry::check_duplicates(DiagnosticBag & diags) const
{
  for (const auto name : duplicate_entities_) {
    diags.report_error(schema_path(name), "entity " + quoted(name) + " is declared more than once")
      .with_kind(DiagnosticKind::DuplicateEntity)
      .with_subject(std::string(name));
  }
  for (const auto name : duplicate_actions_) {
    diags
      .report_error(
        SelectionPath(k_schema_root).child("actions").child(name),
        "action " + quoted(name) + " is declared more than once")
      .with_kind(DiagnosticKind::DuplicateEntity)
      .with_subject(std::string(name));
  }
}

void EntityRegistry::check_fields(TypedEntity & entity, DiagnosticBag & diags)
{
  // Names must be unique across primitive and complex fields
  std::unordered_set<std::string_view> seen;
  for (const auto & p : entity.primitives_) {
    if (!seen.insert(p.name).second) {
      diags
        .report_error(
          schema_path(entity.name(), p.name),
          "field " + quoted(p.name) + " is declared more than once on " + quoted(entity.name()))
        .with_kind(DiagnosticKind::FieldNameConflict)
        .with_subject(std::string(p.name));
    }
  }
  for (const auto * f : entity.complex_) {
    if (!seen.insert(f->name).second) {
      const bool clashes_with_primitive = entity.find_primitive(f->name) != nullptr;
      diags
        .report_error(
          schema_path(entity.name(), f->name),
          clashes_with_primitive
            ? "complex field " + quoted(f->name) + " shadows a primitive field of " +
                quoted(entity.name())
            : "field " + quoted(f->name) + " is declared more than once on " +
                quoted(entity.name()))
        .with_kind(DiagnosticKind::FieldNameConflict)
        .with_subject(std::string(f->name));
    }
  }

  if (entity.is_union() && entity.has_complex_fields()) {
    diags
      .report_error(
        schema_path(entity.name()),
        "union " + quoted(entity.name()) + " cannot declare complex fields")
      .with_kind(DiagnosticKind::InvalidUnion)
      .with_help("declare entity-valued members with add_variant()");
  }

  for (auto & [owner, field] : fields_) {
    if (owner != &entity) {
      continue;
    }
    const SelectionPath path = schema_path(entity.name(), field->name);

    if (auto * calc = dyn_cast<CalculationField>(field); calc && !calc->returns_entity()) {
      if (!calc->has_arg_spec) {
        diags
          .report_error(
            path, "scalar calculation " + quoted(calc->name) + " takes no arguments")
          .with_kind(DiagnosticKind::InvalidFieldDefinition)
          .with_subject(std::string(calc->name))
          .with_help("argument-free scalar calculations are selected like primitive fields; "
                     "declare it with add_primitive()");
      }
      continue;
    }

    const auto it = index_.find(field->target_name);
    if (it == index_.end()) {
      diags
        .report_error(
          path, std::string(to_string(field->get_category())) + " " + quoted(field->name) +
                  " references unknown entity " + quoted(field->target_name))
        .with_kind(DiagnosticKind::DanglingReference)
        .with_subject(std::string(field->target_name));
      continue;
    }

    const TypedEntity * target = it->second;
    field->target = target;

    const char * expected = nullptr;
    if (isa<RelationshipField>(field) && !target->is_resource()) {
      expected = "a resource";
    } else if (isa<NestedMapField>(field) && !target->is_typed_map()) {
      expected = "a typed map";
    } else if (isa<UnionField>(field) && !target->is_union()) {
      expected = "a union";
    }
    if (expected != nullptr) {
      diags
        .report_error(
          path, std::string(to_string(field->get_category())) + " " + quoted(field->name) +
                  " must target " + expected + ", but " + quoted(target->name()) + " is a " +
                  std::string(to_string(target->kind())))
        .with_kind(DiagnosticKind::InvalidFieldDefinition)
        .with_subject(std::string(field->name));
    }
  }
}

void EntityRegistry::check_union(TypedEntity & entity, DiagnosticBag & diags)
{
  const SelectionPath path = schema_path(entity.name());

  if (entity.tag_field_.empty()) {
    diags.report_error(path, "union " + quoted(entity.name()) + " has no tag field")
      .with_kind(DiagnosticKind::InvalidUnion);
  }
  if (entity.members_.empty()) {
    diags.report_error(path, "union " + quoted(entity.name()) + " declares no members")
      .with_kind(DiagnosticKind::InvalidUnion);
  }

  std::unordered_set<std::string_view> tags;
  std::vector<std::string_view> tag_values;
  for (auto & member : entity.members_) {
    const SelectionPath member_path = path.child(member.tag);

    if (!tags.insert(member.tag).second) {
      diags
        .report_error(
          member_path,
          "tag " + quoted(member.tag) + " is declared more than once on " + quoted(entity.name()))
        .with_kind(DiagnosticKind::InvalidUnion)
        .with_subject(std::string(member.tag));
      continue;
    }
    if (member.tag == entity.tag_field_) {
      diags
        .report_error(
          member_path, "member tag " + quoted(member.tag) + " collides with the tag field")
        .with_kind(DiagnosticKind::InvalidUnion)
        .with_subject(std::string(member.tag));
      continue;
    }
    tag_values.push_back(member.tag);

    if (!member.is_variant()) {
      continue;
    }
    const auto it = index_.find(member.entity_name);
    if (it == index_.end()) {
      diags
        .report_error(
          member_path,
          "variant " + quoted(member.tag) + " references unknown entity " +
            quoted(member.entity_name))
        .with_kind(DiagnosticKind::DanglingReference)
        .with_subject(std::string(member.entity_name));
      continue;
    }
    if (it->second->is_union()) {
      diags
        .report_error(
          member_path, "variant " + quoted(member.tag) + " must be a resource or typed map, but " +
                         quoted(member.entity_name) + " is a union")
        .with_kind(DiagnosticKind::InvalidUnion)
        .with_subject(std::string(member.tag));
      continue;
    }
    member.entity = it->second;
  }

  // Primitive view of the union: tag field, then primitive members
  entity.primitives_.clear();
  entity.primitive_index_.clear();
  if (!entity.tag_field_.empty()) {
    add_primitive_entry(
      entity, PrimitiveField{entity.tag_field_, types_.get_literal_type(tag_values)});
  }
  for (const auto & member : entity.members_) {
    if (!member.is_variant() && member.tag != entity.tag_field_) {
      add_primitive_entry(entity, PrimitiveField{member.tag, member.type});
    }
  }
}

void EntityRegistry::check_actions(DiagnosticBag & diags)
{
  for (auto & action : actions_) {
    const SelectionPath path = SelectionPath(k_schema_root).child("actions").child(action.name);

    const auto it = index_.find(action.entity_name);
    if (it == index_.end()) {
      diags
        .report_error(
          path, "action " + quoted(action.name) + " references unknown entity " +
                  quoted(action.entity_name))
        .with_kind(DiagnosticKind::DanglingReference)
        .with_subject(std::string(action.entity_name));
      continue;
    }
    if (!it->second->is_resource()) {
      diags
        .report_error(
          path, "action " + quoted(action.name) + " must return a resource, but " +
                  quoted(action.entity_name) + " is a " +
                  std::string(to_string(it->second->kind())))
        .with_kind(DiagnosticKind::InvalidFieldDefinition)
        .with_subject(std::string(action.name));
      continue;
    }
    action.entity = it->second;

    if (action.pagination.supported() && action.kind != ActionKind::Read) {
      diags
        .report_error(
          path, "pagination is only supported on read actions, but " + quoted(action.name) +
                  " is a " + std::string(to_string(action.kind)) + " action")
        .with_kind(DiagnosticKind::InvalidFieldDefinition)
        .with_subject(std::string(action.name));
    }
    if (action.pagination.required && !action.pagination.supported()) {
      diags
        .report_error(
          path, "action " + quoted(action.name) + " requires pagination but supports no flavor")
        .with_kind(DiagnosticKind::InvalidFieldDefinition)
        .with_subject(std::string(action.name));
    }
  }
}

// ============================================================================
// Lookup
// ============================================================================

void EntityRegistry::require_frozen(std::string_view name) const
{
  if (!frozen_) {
    throw std::logic_error(
      "lookup of '" + std::string(name) + "' before the entity registry was finalized");
  }
}

const TypedEntity * EntityRegistry::lookup(std::string_view name) const
{
  require_frozen(name);
  auto it = index_.find(name);
  return it != index_.end() ? it->second : nullptr;
}

const TypedEntity & EntityRegistry::resolve(std::string_view name) const
{
  const TypedEntity * entity = lookup(name);
  if (entity == nullptr) {
    throw std::logic_error("unknown entity '" + std::string(name) + "'");
  }
  return *entity;
}

const ActionSpec * EntityRegistry::lookup_action(std::string_view name) const
{
  require_frozen(name);
  auto it = action_index_.find(name);
  return it != action_index_.end() ? it->second : nullptr;
}

const ActionSpec & EntityRegistry::resolve_action(std::string_view name) const
{
  const ActionSpec * action = lookup_action(name);
  if (action == nullptr) {
    throw std::logic_error("unknown action '" + std::string(name) + "'");
  }
  return *action;
}

std::vector<const TypedEntity *> EntityRegistry::entities() const
{
  std::vector<const TypedEntity *> out;
  out.reserve(entities_.size());
  for (const auto & e : entities_) {
    // Skip shadowed duplicates
    auto it = index_.find(e.name());
    if (it != index_.end() && it->second == &e) {
      out.push_back(&e);
    }
  }
  return out;
}

std::vector<const ActionSpec *> EntityRegistry::actions() const
{
  std::vector<const ActionSpec *> out;
  out.reserve(actions_.size());
  for (const auto & a : actions_) {
    auto it = action_index_.find(a.name);
    if (it != action_index_.end() && it->second == &a) {
      out.push_back(&a);
    }
  }
  return out;
}

// ============================================================================
// Process-wide registry
// ============================================================================

namespace
{

std::mutex g_install_mutex;
std::unique_ptr<EntityRegistry> g_owned_registry;
std::atomic<const EntityRegistry *> g_global_registry{nullptr};

}  // namespace

void install_global_registry(std::unique_ptr<EntityRegistry> registry)
{
  if (!registry || !registry->is_frozen()) {
    throw std::logic_error("install_global_registry requires a finalized registry");
  }

  const std::lock_guard<std::mutex> lock(g_install_mutex);
  if (g_owned_registry) {
    throw std::logic_error("global entity registry is already installed");
  }
  g_owned_registry = std::move(registry);
  g_global_registry.store(g_owned_registry.get(), std::memory_order_release);
}

const EntityRegistry & global_registry()
{
  const EntityRegistry * registry = g_global_registry.load(std::memory_order_acquire);
  if (registry == nullptr) {
    throw std::logic_error("global entity registry has not been installed");
  }
  return *registry;
}

bool has_global_registry() noexcept
{
  return g_global_registry.load(std::memory_order_acquire) != nullptr;
}

}  // namespace typed_select
