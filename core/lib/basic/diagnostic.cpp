// typed_select/basic/diagnostic.cpp - Diagnostic implementation
#include "typed_select/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace typed_select
{

std::string_view diagnostic_code(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::None:
      return "";
    case DiagnosticKind::UnknownPrimitiveField:
      return "E1001";
    case DiagnosticKind::UnknownComplexField:
      return "E1002";
    case DiagnosticKind::InvalidUnionVariant:
      return "E1003";
    case DiagnosticKind::MissingCalculationArgs:
      return "E1004";
    case DiagnosticKind::InvalidCalculationArgs:
      return "E1005";
    case DiagnosticKind::InvalidFieldSelection:
      return "E1006";
    case DiagnosticKind::InvalidSelectionFormat:
      return "E1007";
    case DiagnosticKind::EmptySelection:
      return "E1008";
    case DiagnosticKind::DuplicateField:
      return "E1009";
    case DiagnosticKind::RecursionDepthExceeded:
      return "E1010";
    case DiagnosticKind::AmbiguousOrInvalidPagination:
      return "E1101";
    case DiagnosticKind::InvalidPaginationParameter:
      return "E1102";
    case DiagnosticKind::DuplicateEntity:
      return "E2001";
    case DiagnosticKind::DanglingReference:
      return "E2002";
    case DiagnosticKind::FieldNameConflict:
      return "E2003";
    case DiagnosticKind::InvalidUnion:
      return "E2004";
    case DiagnosticKind::InvalidFieldDefinition:
      return "E2005";
    case DiagnosticKind::InvalidSchemaDocument:
      return "E2006";
    case DiagnosticKind::UnknownScalarType:
      return "E2007";
    case DiagnosticKind::ShapeMismatch:
      return "E3001";
  }
  return "";
}

std::string_view to_string(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::None:
      return "None";
    case DiagnosticKind::UnknownPrimitiveField:
      return "UnknownPrimitiveField";
    case DiagnosticKind::UnknownComplexField:
      return "UnknownComplexField";
    case DiagnosticKind::InvalidUnionVariant:
      return "InvalidUnionVariant";
    case DiagnosticKind::MissingCalculationArgs:
      return "MissingCalculationArgs";
    case DiagnosticKind::InvalidCalculationArgs:
      return "InvalidCalculationArgs";
    case DiagnosticKind::InvalidFieldSelection:
      return "InvalidFieldSelection";
    case DiagnosticKind::InvalidSelectionFormat:
      return "InvalidSelectionFormat";
    case DiagnosticKind::EmptySelection:
      return "EmptySelection";
    case DiagnosticKind::DuplicateField:
      return "DuplicateField";
    case DiagnosticKind::RecursionDepthExceeded:
      return "RecursionDepthExceeded";
    case DiagnosticKind::AmbiguousOrInvalidPagination:
      return "AmbiguousOrInvalidPagination";
    case DiagnosticKind::InvalidPaginationParameter:
      return "InvalidPaginationParameter";
    case DiagnosticKind::DuplicateEntity:
      return "DuplicateEntity";
    case DiagnosticKind::DanglingReference:
      return "DanglingReference";
    case DiagnosticKind::FieldNameConflict:
      return "FieldNameConflict";
    case DiagnosticKind::InvalidUnion:
      return "InvalidUnion";
    case DiagnosticKind::InvalidFieldDefinition:
      return "InvalidFieldDefinition";
    case DiagnosticKind::InvalidSchemaDocument:
      return "InvalidSchemaDocument";
    case DiagnosticKind::UnknownScalarType:
      return "UnknownScalarType";
    case DiagnosticKind::ShapeMismatch:
      return "ShapeMismatch";
  }
  return "Unknown";
}

const Label * Diagnostic::primary_label() const noexcept
{
  return labels.empty() ? nullptr : &labels.front();
}

SelectionPath Diagnostic::primary_path() const
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->path;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_kind(DiagnosticKind kind)
{
  diagnostic_.kind = kind;
  diagnostic_.code = std::string(diagnostic_code(kind));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_subject(std::string subject)
{
  diagnostic_.subject = std::move(subject);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

Diagnostic make_diagnostic(
  Severity severity, SelectionPath path, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{std::move(path), std::move(label_message)});
  return d;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report_error(
  SelectionPath path, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(
             Severity::Error, std::move(path), std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SelectionPath path, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(
             Severity::Warning, std::move(path), std::move(message), std::move(label_message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

const Diagnostic * DiagnosticBag::first_error() const noexcept
{
  for (const auto & d : diagnostics_) {
    if (d.severity == Severity::Error) {
      return &d;
    }
  }
  return nullptr;
}

bool DiagnosticBag::contains(DiagnosticKind kind) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [kind](const Diagnostic & d) {
    return d.kind == kind;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace typed_select
