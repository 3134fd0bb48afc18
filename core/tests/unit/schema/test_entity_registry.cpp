// tests/unit/schema/test_entity_registry.cpp - Unit tests for EntityRegistry
//
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "typed_select/basic/casting.hpp"
#include "typed_select/schema/entity_registry.hpp"
#include "typed_select/schema/type_utils.hpp"
#include "typed_select/test_support/schema_helpers.hpp"

using namespace typed_select;
using test_support::kinds_of;
using test_support::make_sample_registry;

// ============================================================================
// Sample schema
// ============================================================================

TEST(EntityRegistryTest, SampleSchemaFinalizes)
{
  DiagnosticBag diags;
  auto registry = make_sample_registry(&diags);
  EXPECT_TRUE(diags.empty());
  EXPECT_TRUE(registry->is_frozen());

  const TypedEntity & todo = registry->resolve("Todo");
  EXPECT_TRUE(todo.is_resource());
  EXPECT_EQ(todo.primitive_fields().size(), 5U);
  EXPECT_EQ(todo.complex_fields().size(), 8U);

  const FieldSpec * author = todo.find_complex("author");
  ASSERT_NE(author, nullptr);
  EXPECT_TRUE(isa<RelationshipField>(author));
  EXPECT_EQ(author->target, registry->lookup("User"));
  EXPECT_TRUE(author->is_nullable());

  const auto * summary = dyn_cast<CalculationField>(todo.find_complex("summary"));
  ASSERT_NE(summary, nullptr);
  EXPECT_FALSE(summary->returns_entity());
  EXPECT_TRUE(summary->requires_args());
  ASSERT_NE(summary->find_arg("maxLength"), nullptr);

  const auto * related = dyn_cast<CalculationField>(todo.find_complex("related"));
  ASSERT_NE(related, nullptr);
  EXPECT_FALSE(related->has_arg_spec);
  EXPECT_TRUE(related->returns_entity());
}

TEST(EntityRegistryTest, UnionPrimitivesAreTagFieldAndPrimitiveMembers)
{
  auto registry = make_sample_registry();
  const TypedEntity & content = registry->resolve("Content");

  ASSERT_TRUE(content.is_union());
  EXPECT_EQ(content.tag_field(), "type");
  ASSERT_EQ(content.primitive_fields().size(), 2U);

  const PrimitiveField & tag = content.primitive_fields()[0];
  EXPECT_EQ(tag.name, "type");
  EXPECT_EQ(to_string(tag.type), "\"text\" | \"image\" | \"note\"");

  const PrimitiveField & note = content.primitive_fields()[1];
  EXPECT_EQ(note.name, "note");
  EXPECT_EQ(note.type, registry->types().string_type());

  ASSERT_NE(content.find_variant("text"), nullptr);
  EXPECT_EQ(content.find_variant("text")->entity, registry->lookup("TextContent"));
  EXPECT_EQ(content.find_variant("note"), nullptr);
  EXPECT_NE(content.find_member("note"), nullptr);
}

TEST(EntityRegistryTest, ActionsResolveTheirEntity)
{
  auto registry = make_sample_registry();
  const ActionSpec & list = registry->resolve_action("listTodos");
  EXPECT_EQ(list.entity, registry->lookup("Todo"));
  EXPECT_TRUE(list.pagination.mixed());
  EXPECT_EQ(registry->lookup_action("nope"), nullptr);
  EXPECT_EQ(registry->actions().size(), 7U);
}

TEST(EntityRegistryTest, ResolveUnknownIsProgrammerError)
{
  auto registry = make_sample_registry();
  EXPECT_EQ(registry->lookup("Nope"), nullptr);
  EXPECT_THROW((void)registry->resolve("Nope"), std::logic_error);
  EXPECT_THROW((void)registry->resolve_action("nope"), std::logic_error);
}

TEST(EntityRegistryTest, MutationAfterFreezeThrows)
{
  auto registry = make_sample_registry();
  EXPECT_THROW(registry->declare_resource("Late"), std::logic_error);
  EXPECT_THROW(registry->add_action("late", "Todo", ActionKind::Get), std::logic_error);
}

TEST(EntityRegistryTest, LookupBeforeFinalizeThrows)
{
  EntityRegistry r;
  TypedEntity & todo = r.declare_resource("Todo");
  r.declare_resource("User");
  r.add_relationship(todo, "owner", "User", {});
  r.add_action("listTodos", "Todo", ActionKind::Read);

  EXPECT_THROW((void)r.lookup("Todo"), std::logic_error);
  EXPECT_THROW((void)r.resolve("Todo"), std::logic_error);
  EXPECT_THROW((void)r.lookup_action("listTodos"), std::logic_error);
  EXPECT_EQ(r.entities().size(), 2U);

  // A failed finalize leaves the registry unusable as well
  r.add_relationship(todo, "ghost", "Nowhere", {});
  DiagnosticBag diags;
  EXPECT_FALSE(r.finalize(diags));
  EXPECT_THROW((void)r.lookup("User"), std::logic_error);
}

// ============================================================================
// Invariant violations
// ============================================================================

TEST(EntityRegistryTest, DuplicateEntityIsReported)
{
  EntityRegistry r;
  r.declare_resource("User");
  r.declare_typed_map("User");

  DiagnosticBag diags;
  EXPECT_FALSE(r.finalize(diags));
  EXPECT_FALSE(r.is_frozen());
  EXPECT_TRUE(diags.contains(DiagnosticKind::DuplicateEntity));
}

TEST(EntityRegistryTest, ComplexFieldShadowingPrimitiveIsReported)
{
  EntityRegistry r;
  TypedEntity & user = r.declare_resource("User");
  r.add_primitive(user, "manager", r.types().string_type());
  r.add_relationship(user, "manager", "User");

  DiagnosticBag diags;
  EXPECT_FALSE(r.finalize(diags));
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].kind, DiagnosticKind::FieldNameConflict);
  EXPECT_EQ(diags.all()[0].subject, "manager");
}

TEST(EntityRegistryTest, DanglingReferencesAreReported)
{
  EntityRegistry r;
  TypedEntity & todo = r.declare_resource("Todo");
  r.add_primitive(todo, "id", r.types().uuid_type());
  r.add_relationship(todo, "owner", "Ghost");
  r.add_action("listGhosts", "Ghost", ActionKind::Read);

  DiagnosticBag diags;
  EXPECT_FALSE(r.finalize(diags));
  EXPECT_EQ(
    kinds_of(diags),
    (std::vector<DiagnosticKind>{
      DiagnosticKind::DanglingReference, DiagnosticKind::DanglingReference}));
}

TEST(EntityRegistryTest, TargetKindsAreChecked)
{
  EntityRegistry r;
  TypedEntity & user = r.declare_resource("User");
  TypedEntity & meta = r.declare_typed_map("Meta");
  r.add_primitive(meta, "k", r.types().string_type());
  r.add_primitive(user, "id", r.types().uuid_type());
  r.add_nested_map(user, "profile", "User");    // must be a typed map
  r.add_relationship(user, "settings", "Meta");  // must be a resource
  r.add_union_field(user, "body", "Meta");       // must be a union

  DiagnosticBag diags;
  EXPECT_FALSE(r.finalize(diags));
  EXPECT_EQ(diags.errors().size(), 3U);
  for (const auto & d : diags) {
    EXPECT_EQ(d.kind, DiagnosticKind::InvalidFieldDefinition);
  }
}

TEST(EntityRegistryTest, ArgumentFreeScalarCalculationIsRejected)
{
  EntityRegistry r;
  TypedEntity & user = r.declare_resource("User");
  r.add_scalar_calculation(user, "fullName", r.types().string_type(), std::nullopt);

  DiagnosticBag diags;
  EXPECT_FALSE(r.finalize(diags));
  ASSERT_NE(diags.first_error(), nullptr);
  EXPECT_EQ(diags.first_error()->kind, DiagnosticKind::InvalidFieldDefinition);
  EXPECT_TRUE(diags.first_error()->help_message.has_value());
}

TEST(EntityRegistryTest, UnionInvariants)
{
  EntityRegistry r;
  TypedEntity & text = r.declare_typed_map("Text");
  r.add_primitive(text, "body", r.types().string_type());
  TypedEntity & inner = r.declare_union("Inner", "kind");
  r.add_variant(inner, "text", "Text");

  TypedEntity & outer = r.declare_union("Outer", "kind");
  r.add_variant(outer, "text", "Text");
  r.add_variant(outer, "text", "Text");     // duplicate tag
  r.add_variant(outer, "nested", "Inner");  // union variant
  r.add_primitive_member(outer, "kind", r.types().string_type());  // collides with tag field

  DiagnosticBag diags;
  EXPECT_FALSE(r.finalize(diags));
  EXPECT_EQ(diags.errors().size(), 3U);
  for (const auto & d : diags) {
    EXPECT_EQ(d.kind, DiagnosticKind::InvalidUnion);
  }
}

TEST(EntityRegistryTest, UnionRejectsPrimitiveDeclaration)
{
  EntityRegistry r;
  TypedEntity & u = r.declare_union("U", "type");
  EXPECT_THROW(r.add_primitive(u, "x", r.types().string_type()), std::logic_error);

  TypedEntity & res = r.declare_resource("R");
  EXPECT_THROW(r.add_variant(res, "a", "R"), std::logic_error);
}

TEST(EntityRegistryTest, PaginationOnlyOnReadActions)
{
  EntityRegistry r;
  TypedEntity & user = r.declare_resource("User");
  r.add_primitive(user, "id", r.types().uuid_type());
  r.add_action("getUser", "User", ActionKind::Get, {true, false, false});
  r.add_action("listUsers", "User", ActionKind::Read, {false, false, true});

  DiagnosticBag diags;
  EXPECT_FALSE(r.finalize(diags));
  EXPECT_EQ(diags.errors().size(), 2U);
  EXPECT_TRUE(diags.contains(DiagnosticKind::InvalidFieldDefinition));
}

TEST(EntityRegistryTest, CyclicSchemaIsAccepted)
{
  EntityRegistry r;
  TypedEntity & node = r.declare_resource("Node");
  r.add_primitive(node, "id", r.types().integer_type());
  r.add_relationship(node, "parent", "Node", {false, true});
  r.add_relationship(node, "children", "Node", {true, false});

  DiagnosticBag diags;
  EXPECT_TRUE(r.finalize(diags));
  EXPECT_EQ(r.resolve("Node").find_complex("parent")->target, &r.resolve("Node"));
}

// ============================================================================
// Process-wide registry
// ============================================================================

TEST(GlobalRegistryTest, InstallOnceAndReadFromThreads)
{
  EXPECT_THROW(install_global_registry(std::make_unique<EntityRegistry>()), std::logic_error);

  if (!has_global_registry()) {
    EXPECT_THROW((void)global_registry(), std::logic_error);
    install_global_registry(make_sample_registry());
  }
  EXPECT_THROW(install_global_registry(make_sample_registry()), std::logic_error);

  std::vector<std::thread> readers;
  std::vector<int> found(4, 0);
  for (size_t i = 0; i < found.size(); ++i) {
    readers.emplace_back([&found, i] { found[i] = global_registry().lookup("Todo") != nullptr; });
  }
  for (auto & t : readers) {
    t.join();
  }
  for (const int f : found) {
    EXPECT_EQ(f, 1);
  }
}
