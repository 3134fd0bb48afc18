// tests/unit/selection/test_selection_validator.cpp - Unit tests for SelectionValidator
//
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "typed_select/selection/selection_validator.hpp"
#include "typed_select/test_support/schema_helpers.hpp"

using namespace typed_select;
using test_support::json_of;
using test_support::make_sample_registry;

namespace
{

class SelectionValidatorTest : public ::testing::Test
{
protected:
  void SetUp() override { registry_ = make_sample_registry(); }

  const TypedEntity & entity(std::string_view name) const { return registry_->resolve(name); }

  /// Validate and return the single expected diagnostic (nullptr if valid)
  const Diagnostic * check(
    std::string_view entity_name, std::string_view selection, ValidationOptions options = {})
  {
    diags_ = DiagnosticBag();
    SelectionValidator validator(&diags_, options);
    const bool ok = validator.validate(entity(entity_name), json_of(selection));
    EXPECT_EQ(ok, !validator.has_errors());
    if (ok) {
      EXPECT_TRUE(diags_.empty());
      return nullptr;
    }
    EXPECT_EQ(diags_.size(), 1U) << "validation must stop at the first error";
    return diags_.first_error();
  }

  std::unique_ptr<EntityRegistry> registry_;
  DiagnosticBag diags_;
};

}  // namespace

// ============================================================================
// Accepted selections
// ============================================================================

TEST_F(SelectionValidatorTest, AcceptsPrimitivesAndRelationships)
{
  EXPECT_EQ(check("Todo", R"(["id", "title", {"author": ["name", "email"]}])"), nullptr);
  EXPECT_EQ(
    check("Todo", R"([{"comments": ["body", {"author": ["id"]}, {"todo": ["id"]}]}])"), nullptr);
}

TEST_F(SelectionValidatorTest, AcceptsNestedMapsAndUnions)
{
  EXPECT_EQ(check("Todo", R"([{"metadata": ["priority", "dueAt"]}])"), nullptr);
  EXPECT_EQ(check("Todo", R"([{"history": ["label", {"checkedBy": ["name"]}]}])"), nullptr);
  EXPECT_EQ(
    check("Todo", R"([{"content": ["type", "note", {"text": ["body"]}, {"image": ["url"]}]}])"),
    nullptr);
  EXPECT_EQ(check("Content", R"(["type", {"text": ["wordCount"]}])"), nullptr);
}

TEST_F(SelectionValidatorTest, AcceptsCalculationForms)
{
  EXPECT_EQ(check("Todo", R"([{"summary": {"args": {"maxLength": 80}}}])"), nullptr);
  EXPECT_EQ(check("Todo", R"([{"self": {"fields": ["id"]}}])"), nullptr);
  EXPECT_EQ(
    check("Todo", R"([{"self": {"args": {"prefix": "re: "}, "fields": ["id"]}}])"), nullptr);
  EXPECT_EQ(check("Todo", R"([{"related": ["id"]}])"), nullptr);
  EXPECT_EQ(check("Todo", R"([{"related": {"fields": ["title"]}}])"), nullptr);
}

TEST_F(SelectionValidatorTest, AcceptsCyclicSelectionWithinDepth)
{
  EXPECT_EQ(
    check("Todo", R"([{"comments": [{"todo": [{"comments": [{"todo": ["id"]}]}]}]}])"), nullptr);
}

// ============================================================================
// Format errors
// ============================================================================

TEST_F(SelectionValidatorTest, RootMustBeNonEmptyList)
{
  const Diagnostic * d = check("Todo", R"({"id": true})");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidSelectionFormat);
  EXPECT_EQ(d->primary_path().to_string(), "selection");

  d = check("Todo", "[]");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::EmptySelection);
}

TEST_F(SelectionValidatorTest, ElementsMustBeNamesOrObjects)
{
  const Diagnostic * d = check("Todo", R"(["id", 42])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidSelectionFormat);
  EXPECT_EQ(d->primary_path().to_string(), "selection[1]");

  d = check("Todo", R"(["id", {}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::EmptySelection);
}

TEST_F(SelectionValidatorTest, RelationshipValueMustBeList)
{
  const Diagnostic * d = check("Todo", R"([{"author": "name"}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidSelectionFormat);
  EXPECT_EQ(d->primary_path().to_string(), "selection[0].author");

  d = check("Todo", R"([{"author": []}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::EmptySelection);
}

// ============================================================================
// Unknown fields
// ============================================================================

TEST_F(SelectionValidatorTest, UnknownPrimitiveReportsPathAndSubject)
{
  const Diagnostic * d = check("Todo", R"(["id", {"comments": ["body", "bdy"]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::UnknownPrimitiveField);
  EXPECT_EQ(d->subject, "bdy");
  EXPECT_EQ(d->primary_path().to_string(), "selection[1].comments[1]");
}

TEST_F(SelectionValidatorTest, ComplexFieldNamedAsStringGetsHelp)
{
  const Diagnostic * d = check("Todo", R"(["author"])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::UnknownPrimitiveField);
  ASSERT_TRUE(d->help_message.has_value());
  EXPECT_NE(d->help_message->find("{\"author\": [...]}"), std::string::npos);
}

TEST_F(SelectionValidatorTest, UnknownComplexField)
{
  const Diagnostic * d = check("Todo", R"([{"owner": ["id"]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::UnknownComplexField);
  EXPECT_EQ(d->subject, "owner");

  d = check("Todo", R"([{"title": ["x"]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::UnknownComplexField);
  ASSERT_TRUE(d->help_message.has_value());
}

TEST_F(SelectionValidatorTest, FlatNestedMapRejectsNestedObjects)
{
  const Diagnostic * d = check("Todo", R"([{"metadata": ["priority", {"category": ["x"]}]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::UnknownComplexField);
  EXPECT_EQ(d->primary_path().to_string(), "selection[0].metadata[1].category");
  ASSERT_TRUE(d->help_message.has_value());

  d = check("Shape", R"([{"sides": ["a", "d"]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::UnknownPrimitiveField);
  EXPECT_EQ(d->subject, "d");
}

// ============================================================================
// Calculations
// ============================================================================

TEST_F(SelectionValidatorTest, RequiredArgumentsMustBePresent)
{
  const Diagnostic * d = check("Todo", R"([{"summary": {}}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::MissingCalculationArgs);

  d = check("Todo", R"([{"summary": {"args": {}}}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::MissingCalculationArgs);
  EXPECT_EQ(d->subject, "maxLength");
  EXPECT_EQ(d->code, "E1004");
}

TEST_F(SelectionValidatorTest, ArgumentsAreTypeChecked)
{
  const Diagnostic * d = check("Todo", R"([{"summary": {"args": {"maxLength": "long"}}}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidCalculationArgs);
  EXPECT_EQ(d->primary_path().to_string(), "selection[0].summary.args.maxLength");

  d = check("Todo", R"([{"summary": {"args": {"maxLength": 3, "locale": "en"}}}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidCalculationArgs);
  EXPECT_EQ(d->subject, "locale");
}

TEST_F(SelectionValidatorTest, CalculationShapeErrors)
{
  const Diagnostic * d = check("Todo", R"([{"summary": ["x"]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidSelectionFormat);

  d = check("Todo", R"([{"summary": {"args": {"maxLength": 3}, "fields": ["x"]}}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidFieldSelection);

  d = check("Todo", R"([{"self": {"args": {}}}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::EmptySelection);

  d = check("Todo", R"([{"self": {"fields": ["id"], "limit": 3}}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidCalculationArgs);

  d = check("Todo", R"([{"related": {"args": {}, "fields": ["id"]}}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidCalculationArgs);
}

// ============================================================================
// Unions
// ============================================================================

TEST_F(SelectionValidatorTest, UnknownUnionMember)
{
  const Diagnostic * d = check("Todo", R"([{"content": ["type", "video"]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidUnionVariant);
  EXPECT_EQ(d->subject, "video");

  d = check("Todo", R"([{"content": [{"video": ["url"]}]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidUnionVariant);
}

TEST_F(SelectionValidatorTest, UnionMemberSelectedInWrongForm)
{
  const Diagnostic * d = check("Todo", R"([{"content": ["text"]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidFieldSelection);

  d = check("Todo", R"([{"content": [{"note": ["x"]}]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidFieldSelection);

  d = check("Todo", R"([{"content": [{"text": ["url"]}]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::UnknownPrimitiveField);
  EXPECT_EQ(d->primary_path().to_string(), "selection[0].content[0].text[0]");
}

// ============================================================================
// Options
// ============================================================================

TEST_F(SelectionValidatorTest, DuplicatesRejectedUnlessAllowed)
{
  const Diagnostic * d = check("Todo", R"(["id", "title", "id"])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::DuplicateField);
  EXPECT_EQ(d->primary_path().to_string(), "selection[2]");

  d = check("Todo", R"([{"author": ["name"]}, {"author": ["email"]}])");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::DuplicateField);

  ValidationOptions lenient;
  lenient.allow_duplicate_fields = true;
  EXPECT_EQ(
    check("Todo", R"(["id", "id", {"author": ["name"]}, {"author": ["email"]}])", lenient),
    nullptr);
}

TEST_F(SelectionValidatorTest, RepeatedCalculationNeedsSameArguments)
{
  ValidationOptions lenient;
  lenient.allow_duplicate_fields = true;

  EXPECT_EQ(
    check(
      "Todo",
      R"([{"summary": {"args": {"maxLength": 5}}}, {"summary": {"args": {"maxLength": 5}}}])",
      lenient),
    nullptr);

  const Diagnostic * d = check(
    "Todo", R"([{"summary": {"args": {"maxLength": 5}}}, {"summary": {"args": {"maxLength": 9}}}])",
    lenient);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidCalculationArgs);
  EXPECT_EQ(d->subject, "summary");
  EXPECT_EQ(d->primary_path().to_string(), "selection[1].summary");

  // Repeated parents merge too, so their calculations must agree
  d = check(
    "Comment",
    R"([{"todo": [{"self": {"args": {"prefix": "a"}, "fields": ["id"]}}]},
        {"todo": [{"self": {"fields": ["title"]}}]}])",
    lenient);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::InvalidCalculationArgs);
  EXPECT_EQ(d->primary_path().to_string(), "selection[1].todo[0].self");
}

TEST_F(SelectionValidatorTest, RecursionDepthIsBounded)
{
  ValidationOptions shallow;
  shallow.max_depth = 3;

  EXPECT_EQ(check("Todo", R"([{"comments": [{"todo": ["id"]}]}])", shallow), nullptr);

  const Diagnostic * d =
    check("Todo", R"([{"comments": [{"todo": [{"author": ["id"]}]}]}])", shallow);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, DiagnosticKind::RecursionDepthExceeded);
  EXPECT_EQ(d->primary_path().to_string(), "selection[0].comments[0].todo[0].author");
}

TEST_F(SelectionValidatorTest, WorksWithoutDiagnosticBag)
{
  SelectionValidator validator;
  EXPECT_FALSE(validator.validate(entity("Todo"), json_of(R"(["nope"])")));
  EXPECT_TRUE(validator.has_errors());
}

TEST(SelectionValidatorStandaloneTest, UnfinalizedEntityIsProgrammerError)
{
  EntityRegistry r;
  TypedEntity & todo = r.declare_resource("Todo");
  r.add_primitive(todo, "id", r.types().uuid_type());
  r.declare_resource("User");
  r.add_relationship(todo, "owner", "User", {});

  SelectionValidator validator;
  EXPECT_TRUE(validator.validate(todo, json_of(R"(["id"])")));
  EXPECT_THROW(
    (void)validator.validate(todo, json_of(R"([{"owner": ["id"]}])")), std::logic_error);
}
