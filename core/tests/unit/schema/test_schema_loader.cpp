// tests/unit/schema/test_schema_loader.cpp - JSON schema dump loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "typed_select/basic/casting.hpp"
#include "typed_select/schema/schema_loader.hpp"
#include "typed_select/schema/type_utils.hpp"
#include "typed_select/test_support/schema_helpers.hpp"

using namespace typed_select;
using test_support::json_of;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

TEST(SchemaLoaderTest, LoadsEntitiesFieldsAndActions)
{
  EntityRegistry registry;
  DiagnosticBag diags;
  const bool ok = load_schema_document(registry, json_of(R"({
    "entities": [
      {"name": "User", "kind": "resource",
       "primitives": [{"name": "id", "type": "uuid"},
                      {"name": "nick", "type": "string", "nullable": true}]},
      {"name": "Todo", "kind": "resource",
       "primitives": [{"name": "id", "type": "uuid"},
                      {"name": "status", "type": "enum", "values": ["open", "done"]},
                      {"name": "tags", "type": "string", "array": true}],
       "fields": [{"name": "owner", "category": "relationship", "target": "User", "nullable": true},
                  {"name": "score", "category": "calculation", "returns": {"type": "float"},
                   "args": [{"name": "weight", "type": "integer", "required": true}]}]}
    ],
    "actions": [
      {"name": "listTodos", "entity": "Todo", "kind": "read",
       "pagination": {"offset": true, "keyset": true, "required": true}}
    ]
  })"), diags);

  ASSERT_TRUE(ok);
  ASSERT_TRUE(registry.finalize(diags));
  EXPECT_TRUE(diags.empty());

  const TypedEntity & todo = registry.resolve("Todo");
  EXPECT_EQ(to_string(todo.find_primitive("status")->type), "\"open\" | \"done\"");
  EXPECT_EQ(to_string(todo.find_primitive("tags")->type), "Array<string>");
  EXPECT_EQ(to_string(registry.resolve("User").find_primitive("nick")->type), "string | null");

  const FieldSpec * owner = todo.find_complex("owner");
  ASSERT_NE(owner, nullptr);
  EXPECT_TRUE(isa<RelationshipField>(owner));
  EXPECT_TRUE(owner->is_nullable());

  const auto * score = dyn_cast<CalculationField>(todo.find_complex("score"));
  ASSERT_NE(score, nullptr);
  EXPECT_EQ(score->return_type, registry.types().float_type());
  ASSERT_NE(score->find_arg("weight"), nullptr);
  EXPECT_TRUE(score->find_arg("weight")->required);

  const ActionSpec & list = registry.resolve_action("listTodos");
  EXPECT_EQ(list.kind, ActionKind::Read);
  EXPECT_TRUE(list.pagination.mixed());
  EXPECT_TRUE(list.pagination.required);
}

TEST(SchemaLoaderTest, LoadsUnionVariantsAndPrimitiveMembers)
{
  EntityRegistry registry;
  DiagnosticBag diags;
  ASSERT_TRUE(load_schema_document(registry, json_of(R"({
    "entities": [
      {"name": "Text", "kind": "typed_map", "primitives": [{"name": "body", "type": "string"}]},
      {"name": "Content", "kind": "union", "tag_field": "type",
       "variants": [{"tag": "text", "entity": "Text"}, {"tag": "count", "type": "integer"}]}
    ]
  })"), diags));
  ASSERT_TRUE(registry.finalize(diags));

  const TypedEntity & content = registry.resolve("Content");
  ASSERT_TRUE(content.is_union());
  EXPECT_NE(content.find_variant("text"), nullptr);
  ASSERT_NE(content.find_primitive("count"), nullptr);
  EXPECT_EQ(content.find_primitive("count")->type, registry.types().integer_type());
}

TEST(SchemaLoaderTest, UnknownScalarTypeIsReported)
{
  EntityRegistry registry;
  DiagnosticBag diags;
  EXPECT_FALSE(load_schema_document(registry, json_of(R"({
    "entities": [{"name": "User", "kind": "resource",
                  "primitives": [{"name": "id", "type": "money"}]}]
  })"), diags));

  ASSERT_EQ(diags.size(), 1U);
  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.kind, DiagnosticKind::UnknownScalarType);
  EXPECT_EQ(d.subject, "money");
  EXPECT_EQ(d.primary_path().to_string(), "schema.entities[0].primitives[0].type");
  EXPECT_TRUE(d.help_message.has_value());
}

TEST(SchemaLoaderTest, MalformedEntriesAreReported)
{
  EntityRegistry registry;
  DiagnosticBag diags;
  EXPECT_FALSE(load_schema_document(registry, json_of(R"({
    "entities": [
      {"kind": "resource"},
      {"name": "A", "kind": "view"},
      {"name": "B", "kind": "resource",
       "fields": [{"name": "x", "category": "embedding", "target": "A"}]},
      {"name": "U", "kind": "union", "tag_field": "t", "variants": [],
       "primitives": [{"name": "x", "type": "string"}]}
    ],
    "actions": [{"name": "go", "entity": "B", "kind": "launch"}]
  })"), diags));

  EXPECT_EQ(diags.errors().size(), 5U);
  for (const auto & d : diags) {
    EXPECT_EQ(d.kind, DiagnosticKind::InvalidSchemaDocument);
  }
}

TEST(SchemaLoaderTest, EnumNeedsValues)
{
  TypeContext types;
  DiagnosticBag diags;
  EXPECT_EQ(
    parse_scalar_type(types, json_of(R"({"type": "enum"})"), SelectionPath("schema"), diags),
    nullptr);
  EXPECT_TRUE(diags.contains(DiagnosticKind::InvalidSchemaDocument));
}

TEST(SchemaLoaderTest, ArrayThenNullableWrapping)
{
  TypeContext types;
  DiagnosticBag diags;
  const Type * t = parse_scalar_type(
    types, json_of(R"({"type": "date", "array": true, "nullable": true})"), SelectionPath("schema"),
    diags);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->kind, TypeKind::Nullable);
  EXPECT_EQ(t->base_type->kind, TypeKind::Array);
  EXPECT_EQ(t->base_type->element_type, types.date_type());
}

TEST(SchemaLoaderTest, LoadSchemaFileReportsIoAndSyntaxErrors)
{
  const TempDir tmp(std::filesystem::temp_directory_path() / "typed_select_schema_loader");

  EntityRegistry registry;
  DiagnosticBag diags;
  EXPECT_FALSE(load_schema_file(registry, tmp.path / "missing.json", diags));
  EXPECT_TRUE(diags.contains(DiagnosticKind::InvalidSchemaDocument));

  const auto broken = tmp.path / "broken.json";
  {
    std::ofstream out(broken);
    out << "{\"entities\": [";
  }
  DiagnosticBag syntax;
  EXPECT_FALSE(load_schema_file(registry, broken, syntax));
  ASSERT_NE(syntax.first_error(), nullptr);
  EXPECT_NE(syntax.first_error()->message.find("failed to parse"), std::string::npos);
}

TEST(SchemaLoaderTest, DocumentsAccumulateBeforeFinalize)
{
  EntityRegistry registry;
  DiagnosticBag diags;
  ASSERT_TRUE(load_schema_document(registry, json_of(R"({
    "entities": [{"name": "Todo", "kind": "resource",
                  "primitives": [{"name": "id", "type": "uuid"}],
                  "fields": [{"name": "owner", "category": "relationship", "target": "User"}]}]
  })"), diags));
  ASSERT_TRUE(load_schema_document(registry, json_of(R"({
    "entities": [{"name": "User", "kind": "resource",
                  "primitives": [{"name": "id", "type": "uuid"}]}]
  })"), diags));

  EXPECT_TRUE(registry.finalize(diags));
  EXPECT_EQ(registry.resolve("Todo").find_complex("owner")->target, registry.lookup("User"));
}
