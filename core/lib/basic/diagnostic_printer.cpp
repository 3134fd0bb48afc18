// typed_select/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "typed_select/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace typed_select
{

namespace
{

std::string_view severity_name(Severity s)
{
  return s == Severity::Error ? "error" : "warning";
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const DocumentRegistry & documents)
{
  const SelectionPath primary_path = diag.primary_path();

  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file: path ===
  const std::string doc_name = documents.display_name(primary_path.root());
  if (doc_name != primary_path.root()) {
    fmt::print(os_, "{} {}: {}\n", gutter_arrow(), doc_name, primary_path.to_string());
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), primary_path.to_string());
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  // === Labels (document fragments) ===
  for (const auto & label : diag.labels) {
    print_label_context(label, documents);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const DocumentRegistry & documents)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  // Errors before warnings; report order otherwise (stable)
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.severity == Severity::Error && b.severity != Severity::Error;
    });

  for (const auto & d : sorted_diags) {
    print(d, documents);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold
        << (diag.severity == Severity::Error ? rang::fg::red : rang::fg::yellow);
    os_ << severity_name(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_name(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_name(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const DocumentRegistry & documents)
{
  const auto fragment = documents.fragment(label.path);
  if (!fragment) {
    // Nothing to point at - keep the message as a note
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }
  print_fragment(*fragment, label.message);
}

void DiagnosticPrinter::print_fragment(std::string_view fragment, std::string_view label_message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      | " << rang::style::reset
        << rang::fg::reset;
  } else {
    fmt::print(os_, "      | ");
  }
  fmt::print(os_, "{}\n", fragment);

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      | " << rang::style::reset
        << rang::fg::reset;
  } else {
    fmt::print(os_, "      | ");
  }

  const std::string markers(std::max<size_t>(fragment.size(), 1), '^');

  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
  }
  fmt::print(os_, "{}", markers);
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "   -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace typed_select
