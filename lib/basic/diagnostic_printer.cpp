// schema_dsl/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "schema_dsl/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace schema_dsl
{

namespace
{

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
  }
  return rang::fg::red;
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  print_header(diag);

  const SourceRange primary = diag.primary_range();
  const std::string filename = source.display_name();
  if (primary.is_valid()) {
    const LineColumn lc = source.line_column(primary.begin());
    fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, lc.line, lc.column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label(label, source);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile & source)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().begin() < b->primary_range().begin();
  });

  for (const auto * d : sorted) {
    print(*d, source);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.error_count();
  const size_t warnings = diags.warning_count();
  if (errors == 0 && warnings == 0) {
    return;
  }
  fmt::print(
    os_, "{} error{}, {} warning{}\n", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  const std::string code = diag.code.empty() ? std::string{} : fmt::format("[{}]", diag.code);

  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << name << code << rang::fg::reset
        << ": " << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}{}: {}\n", name, code, diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label, const SourceFile & source)
{
  if (!label.range.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const LineColumn start = source.line_column(label.range.begin());
  const LineColumn end = source.line_column(label.range.end());
  if (!start.is_valid()) {
    return;
  }

  const uint32_t end_col =
    (end.line == start.line && end.column > start.column) ? end.column : start.column + 1;
  print_source_line(source, start.line - 1, start.column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.line(line_index);
  if (line.empty()) {
    return;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  // Marker prefix mirrors the tab expansion of the source line.
  std::string prefix;
  for (uint32_t col = 1; col < start_col && col - 1 < line.size(); ++col) {
    prefix += line[col - 1] == '\t' ? "    " : " ";
  }

  const size_t marker_len = end_col > start_col ? end_col - start_col : 1;
  const char marker_char = style == LabelStyle::Primary ? '^' : '-';
  std::string marker(marker_len, marker_char);
  if (!label_message.empty()) {
    marker += ' ';
    marker += label_message;
  }

  fmt::print(os_, "      | {}", prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
    os_ << marker << rang::style::reset << rang::fg::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", marker);
  }
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? "\033[1;36m  -->\033[0m" : "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? "\033[1;36m      |\033[0m" : "      |";
}

}  // namespace schema_dsl
