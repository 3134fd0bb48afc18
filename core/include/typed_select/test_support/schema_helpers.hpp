// typed_select/test_support/schema_helpers.hpp - helpers for unit/integration tests
//
// Builds a small todo-list schema exercising every field category:
//
//   User      resource   id, name, email?
//   Todo      resource   id, title, completed, status, tags[]
//                        author -> User?            (relationship)
//                        comments -> Comment[]      (relationship)
//                        metadata -> TodoMetadata?  (flat nested map)
//                        history -> Checklist[]     (nested map with complex fields)
//                        content -> Content[]       (union field)
//                        self(prefix?) -> Todo      (entity calculation)
//                        summary(maxLength) -> string
//                        related -> Todo[]          (entity calculation, no args)
//   Comment   resource   id, body; author -> User, todo -> Todo
//   Shape     resource   id; sides -> Dimensions[], faces -> Dimensions[]?,
//                        labels -> Content[]?
//   Content   union      type: text | image | note
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "typed_select/basic/diagnostic.hpp"
#include "typed_select/schema/entity_registry.hpp"
#include "typed_select/schema/type_utils.hpp"

namespace typed_select::test_support
{

[[nodiscard]] inline std::unique_ptr<EntityRegistry> make_sample_registry(
  DiagnosticBag * diags_out = nullptr)
{
  auto registry = std::make_unique<EntityRegistry>();
  EntityRegistry & r = *registry;
  TypeContext & t = r.types();

  TypedEntity & user = r.declare_resource("User");
  r.add_primitive(user, "id", t.uuid_type());
  r.add_primitive(user, "name", t.string_type());
  r.add_primitive(user, "email", t.get_nullable_type(t.string_type()));

  TypedEntity & todo = r.declare_resource("Todo");
  const std::string_view statuses[] = {"open", "done"};
  r.add_primitive(todo, "id", t.uuid_type());
  r.add_primitive(todo, "title", t.string_type());
  r.add_primitive(todo, "completed", t.boolean_type());
  r.add_primitive(todo, "status", t.get_literal_type(statuses));
  r.add_primitive(todo, "tags", t.get_array_type(t.string_type()));
  r.add_relationship(todo, "author", "User", {false, true});
  r.add_relationship(todo, "comments", "Comment", {true, false});
  r.add_nested_map(todo, "metadata", "TodoMetadata", {false, true});
  r.add_nested_map(todo, "history", "Checklist", {true, false});
  r.add_union_field(todo, "content", "Content", {true, false});
  r.add_entity_calculation(
    todo, "self", "Todo", std::vector<ArgSpec>{{"prefix", t.string_type(), false}});
  r.add_scalar_calculation(
    todo, "summary", t.string_type(), std::vector<ArgSpec>{{"maxLength", t.integer_type(), true}});
  r.add_entity_calculation(todo, "related", "Todo", std::nullopt, {true, false});

  TypedEntity & comment = r.declare_resource("Comment");
  r.add_primitive(comment, "id", t.uuid_type());
  r.add_primitive(comment, "body", t.string_type());
  r.add_relationship(comment, "author", "User");
  r.add_relationship(comment, "todo", "Todo");

  TypedEntity & metadata = r.declare_typed_map("TodoMetadata");
  r.add_primitive(metadata, "priority", t.integer_type());
  r.add_primitive(metadata, "category", t.string_type());
  r.add_primitive(metadata, "dueAt", t.get_nullable_type(t.datetime_type()));

  TypedEntity & checklist = r.declare_typed_map("Checklist");
  r.add_primitive(checklist, "label", t.string_type());
  r.add_primitive(checklist, "done", t.boolean_type());
  r.add_relationship(checklist, "checkedBy", "User", {false, true});

  TypedEntity & dimensions = r.declare_typed_map("Dimensions");
  r.add_primitive(dimensions, "a", t.float_type());
  r.add_primitive(dimensions, "b", t.float_type());
  r.add_primitive(dimensions, "c", t.float_type());

  TypedEntity & shape = r.declare_resource("Shape");
  r.add_primitive(shape, "id", t.uuid_type());
  r.add_nested_map(shape, "sides", "Dimensions", {true, false});
  r.add_nested_map(shape, "faces", "Dimensions", {true, true});
  r.add_union_field(shape, "labels", "Content", {true, true});

  TypedEntity & text = r.declare_typed_map("TextContent");
  r.add_primitive(text, "body", t.string_type());
  r.add_primitive(text, "wordCount", t.integer_type());

  TypedEntity & image = r.declare_typed_map("ImageContent");
  r.add_primitive(image, "url", t.string_type());
  r.add_primitive(image, "caption", t.get_nullable_type(t.string_type()));

  TypedEntity & content = r.declare_union("Content", "type");
  r.add_variant(content, "text", "TextContent");
  r.add_variant(content, "image", "ImageContent");
  r.add_primitive_member(content, "note", t.string_type());

  r.add_action("listTodos", "Todo", ActionKind::Read, {true, true, false});
  r.add_action("listTodosOffset", "Todo", ActionKind::Read, {true, false, false});
  r.add_action("listTodosKeyset", "Todo", ActionKind::Read, {false, true, false});
  r.add_action("listTodosRequired", "Todo", ActionKind::Read, {true, true, true});
  r.add_action("listUsers", "User", ActionKind::Read);
  r.add_action("getTodo", "Todo", ActionKind::Get);
  r.add_action("createTodo", "Todo", ActionKind::Create);

  DiagnosticBag local;
  r.finalize(diags_out != nullptr ? *diags_out : local);
  return registry;
}

/// Parse JSON text (test inputs are trusted)
[[nodiscard]] inline nlohmann::json json_of(std::string_view text)
{
  return nlohmann::json::parse(text);
}

/// Kinds of all diagnostics in a bag, in report order
[[nodiscard]] inline std::vector<DiagnosticKind> kinds_of(const DiagnosticBag & diags)
{
  std::vector<DiagnosticKind> out;
  for (const auto & d : diags) {
    out.push_back(d.kind);
  }
  return out;
}

}  // namespace typed_select::test_support
