// schema_dsl/basic/diagnostic_printer.hpp
//
// Renders diagnostics with source context:
//
//   error[S001]: Duplicate model name 'user'. Model names must be unique.
//     --> schema.sdl:9:7
//      |
//    9 | model user {
//      |       ^^^^ duplicate definition
//      |
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/basic/source_file.hpp"

namespace schema_dsl
{

class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Prints every diagnostic ordered by primary location; unlocated ones last.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

  /// One-line summary such as "2 errors, 1 warning".
  void print_summary(const DiagnosticBag & diags);

private:
  void print_header(const Diagnostic & diag);
  void print_label(const Label & label, const SourceFile & source);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace schema_dsl
