// tests/unit/projection/test_projector.cpp - Unit tests for Projector
//
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "typed_select/projection/projector.hpp"
#include "typed_select/schema/type_utils.hpp"
#include "typed_select/selection/selection_validator.hpp"
#include "typed_select/test_support/schema_helpers.hpp"

using namespace typed_select;
using test_support::json_of;
using test_support::make_sample_registry;

namespace
{

class ProjectorTest : public ::testing::Test
{
protected:
  void SetUp() override { registry_ = make_sample_registry(); }

  /// Validate, project and render as a one-line TypeScript type
  std::string shape_of(std::string_view entity_name, std::string_view selection)
  {
    return to_string(project(entity_name, selection));
  }

  const Type * project(std::string_view entity_name, std::string_view selection)
  {
    const TypedEntity & entity = registry_->resolve(entity_name);
    const nlohmann::json parsed = json_of(selection);

    ValidationOptions options;
    options.allow_duplicate_fields = true;
    DiagnosticBag diags;
    SelectionValidator validator(&diags, options);
    EXPECT_TRUE(validator.validate(entity, parsed)) << selection;

    Projector projector(shapes_);
    return projector.project(entity, parsed);
  }

  std::unique_ptr<EntityRegistry> registry_;
  TypeContext shapes_;
};

}  // namespace

// ============================================================================
// Primitives
// ============================================================================

TEST_F(ProjectorTest, PrimitivesKeepSelectionOrder)
{
  EXPECT_EQ(
    shape_of("Todo", R"(["title", "id", "status", "tags"])"),
    "{ title: string; id: string; status: \"open\" | \"done\"; tags: Array<string> }");
}

TEST_F(ProjectorTest, NullablePrimitiveStaysNullable)
{
  EXPECT_EQ(shape_of("User", R"(["email"])"), "{ email: string | null }");
}

TEST_F(ProjectorTest, ScalarLeavesAreBorrowedFromSchema)
{
  const Type * shape = project("Todo", R"(["id"])");
  ASSERT_EQ(shape->fields.size(), 1U);
  EXPECT_EQ(shape->fields[0].type, registry_->types().uuid_type());
}

// ============================================================================
// Complex fields
// ============================================================================

TEST_F(ProjectorTest, RelationshipWrapping)
{
  EXPECT_EQ(
    shape_of("Todo", R"(["id", {"author": ["name"]}])"),
    "{ id: string; author: { name: string } | null }");
  EXPECT_EQ(
    shape_of("Todo", R"([{"comments": ["body", {"author": ["name"]}]}])"),
    "{ comments: Array<{ body: string; author: { name: string } }> }");
}

TEST_F(ProjectorTest, NestedMaps)
{
  EXPECT_EQ(
    shape_of("Shape", R"(["id", {"sides": ["a", "c"]}])"),
    "{ id: string; sides: Array<{ a: number; c: number }> }");
  EXPECT_EQ(
    shape_of("Todo", R"([{"metadata": ["priority"]}])"),
    "{ metadata: { priority: number } | null }");
  EXPECT_EQ(
    shape_of("Todo", R"([{"history": ["done", {"checkedBy": ["id"]}]}])"),
    "{ history: Array<{ done: boolean; checkedBy: { id: string } | null }> }");
}

TEST_F(ProjectorTest, NullableArrayOfEmbeddedValues)
{
  EXPECT_EQ(
    shape_of("Shape", R"([{"faces": ["a", "c"]}])"),
    "{ faces: Array<{ a: number; c: number }> | null }");
  EXPECT_EQ(
    shape_of("Shape", R"([{"labels": ["type", {"text": ["body"]}]}])"),
    "{ labels: Array<{ type: \"text\" | \"image\" | \"note\"; text: { body: string } | null }> "
    "| null }");
}

TEST_F(ProjectorTest, CyclicSchemaFollowsSelectionOnly)
{
  EXPECT_EQ(
    shape_of("Todo", R"([{"comments": [{"todo": [{"comments": ["id"]}]}]}])"),
    "{ comments: Array<{ todo: { comments: Array<{ id: string }> } }> }");
}

// ============================================================================
// Calculations
// ============================================================================

TEST_F(ProjectorTest, ScalarCalculationCarriesArguments)
{
  const Type * shape = project("Todo", R"([{"summary": {"args": {"maxLength": 10}}}])");
  EXPECT_EQ(to_string(shape), "{ summary: string }");

  const ObjectField * summary = shape->find_field("summary");
  ASSERT_NE(summary, nullptr);
  ASSERT_NE(summary->args, nullptr);
  EXPECT_EQ(to_string(summary->args), "{ maxLength: number }");
}

TEST_F(ProjectorTest, EntityCalculations)
{
  EXPECT_EQ(
    shape_of("Todo", R"([{"self": {"args": {"prefix": "x"}, "fields": ["title"]}}])"),
    "{ self: { title: string } }");
  EXPECT_EQ(shape_of("Todo", R"([{"related": ["id"]}])"), "{ related: Array<{ id: string }> }");
  EXPECT_EQ(
    shape_of("Todo", R"([{"related": {"fields": ["id"]}}])"), "{ related: Array<{ id: string }> }");

  const Type * shape = project("Todo", R"([{"self": {"fields": ["id"]}}])");
  EXPECT_EQ(shape->find_field("self")->args, nullptr);
}

// ============================================================================
// Unions
// ============================================================================

TEST_F(ProjectorTest, UnionTagIsAlwaysPresent)
{
  EXPECT_EQ(shape_of("Content", R"(["type"])"), "{ type: \"text\" | \"image\" | \"note\" }");
}

TEST_F(ProjectorTest, UnionMembersAreNullable)
{
  EXPECT_EQ(shape_of("Content", R"([{"text": ["body"]}])"), "{ text: { body: string } | null }");
  EXPECT_EQ(
    shape_of("Content", R"(["type", "note", {"image": ["url", "caption"]}])"),
    "{ type: \"text\" | \"image\" | \"note\"; note: string | null; "
    "image: { url: string; caption: string | null } | null }");
}

TEST_F(ProjectorTest, UnionFieldWrapping)
{
  EXPECT_EQ(
    shape_of("Todo", R"([{"content": ["type"]}])"),
    "{ content: Array<{ type: \"text\" | \"image\" | \"note\" }> }");
}

// ============================================================================
// Merging
// ============================================================================

TEST_F(ProjectorTest, RepeatedFieldsAreMerged)
{
  EXPECT_EQ(
    shape_of("Todo", R"(["id", {"author": ["name"]}, "id", {"author": ["email"]}])"),
    "{ id: string; author: { name: string; email: string | null } | null }");
}

TEST_F(ProjectorTest, RepeatedCalculationKeepsItsArguments)
{
  const Type * shape = project(
    "Todo", R"([{"self": {"args": {"prefix": "x"}, "fields": ["id"]}},
                {"self": {"args": {"prefix": "x"}, "fields": ["title"]}}])");
  EXPECT_EQ(to_string(shape), "{ self: { id: string; title: string } }");

  const ObjectField * self = shape->find_field("self");
  ASSERT_NE(self, nullptr);
  EXPECT_EQ(to_string(self->args), "{ prefix: string }");
}

TEST_F(ProjectorTest, UnionVariantSelectionsMerge)
{
  EXPECT_EQ(
    shape_of("Content", R"([{"text": ["body"]}, {"text": ["wordCount"]}])"),
    "{ text: { body: string; wordCount: number } | null }");
}

TEST_F(ProjectorTest, ProjectionIsDeterministic)
{
  const Type * a = project("Todo", R"(["id", {"author": ["name"]}])");
  const Type * b = project("Todo", R"(["id", {"author": ["name"]}])");
  EXPECT_EQ(a, b);
}

// ============================================================================
// Misuse
// ============================================================================

TEST_F(ProjectorTest, UnvalidatedInputIsRejected)
{
  Projector projector(shapes_);
  const TypedEntity & todo = registry_->resolve("Todo");
  EXPECT_THROW((void)projector.project(todo, json_of(R"({"id": 1})")), std::logic_error);
  EXPECT_THROW((void)projector.project(todo, json_of(R"(["nope"])")), std::logic_error);
  EXPECT_THROW((void)projector.project(todo, json_of(R"([{"ghost": ["id"]}])")), std::logic_error);
}
