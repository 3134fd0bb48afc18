// typed_select/basic/diagnostic_printer.hpp
//
// Prints diagnostics with the offending document fragment and a marker,
// in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "typed_select/basic/diagnostic.hpp"
#include "typed_select/basic/document_registry.hpp"

namespace typed_select
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E1001]: unknown primitive field 'titel' on 'Todo'
 *     --> selection.json: selection[1]
 *      |
 *      | "titel"
 *      | ^^^^^^^ not a primitive field of 'Todo'
 *      |
 *      = help: complex fields are selected as {"name": [...]}
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * Fragments are resolved via the DocumentRegistry and the label paths.
   */
  void print(const Diagnostic & diag, const DocumentRegistry & documents);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags, const DocumentRegistry & documents);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const DocumentRegistry & documents);

  void print_fragment(std::string_view fragment, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace typed_select
