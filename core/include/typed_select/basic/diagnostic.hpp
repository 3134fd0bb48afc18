// typed_select/basic/diagnostic.hpp - Diagnostic types for schema/selection checks
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "typed_select/basic/selection_path.hpp"

namespace typed_select
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

/**
 * Machine-readable diagnostic category.
 *
 * Every kind maps to a stable code (see diagnostic_code()).
 */
enum class DiagnosticKind : uint8_t {
  None,

  // Selection validation (E10xx)
  UnknownPrimitiveField,
  UnknownComplexField,
  InvalidUnionVariant,
  MissingCalculationArgs,
  InvalidCalculationArgs,
  InvalidFieldSelection,
  InvalidSelectionFormat,
  EmptySelection,
  DuplicateField,
  RecursionDepthExceeded,

  // Pagination (E11xx)
  AmbiguousOrInvalidPagination,
  InvalidPaginationParameter,

  // Schema registration (E20xx)
  DuplicateEntity,
  DanglingReference,
  FieldNameConflict,
  InvalidUnion,
  InvalidFieldDefinition,
  InvalidSchemaDocument,
  UnknownScalarType,

  // Result conformance (E30xx)
  ShapeMismatch,
};

/// Stable code for a kind, e.g. "E1001" (empty for None)
[[nodiscard]] std::string_view diagnostic_code(DiagnosticKind kind) noexcept;

/// Kind name, e.g. "UnknownPrimitiveField"
[[nodiscard]] std::string_view to_string(DiagnosticKind kind) noexcept;

/// Location of the offending node, with an optional marker message
struct Label
{
  SelectionPath path;
  std::string message;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagnosticKind kind = DiagnosticKind::None;
  std::string code;     // e.g., "E1001"
  std::string message;  // Main message

  /// Offending field name, variant tag or argument (may be empty)
  std::string subject;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SelectionPath primary_path() const;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  /// Set the kind and its stable code
  DiagnosticBuilder & with_kind(DiagnosticKind kind);

  DiagnosticBuilder & with_subject(std::string subject);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(
    SelectionPath path, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SelectionPath path, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// First error diagnostic, or nullptr
  [[nodiscard]] const Diagnostic * first_error() const noexcept;

  /// Whether any diagnostic of the given kind was reported
  [[nodiscard]] bool contains(DiagnosticKind kind) const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace typed_select
