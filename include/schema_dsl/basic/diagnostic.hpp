// schema_dsl/basic/diagnostic.hpp - Diagnostics collected by every pipeline stage
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "schema_dsl/basic/source_file.hpp"

namespace schema_dsl
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
};

enum class LabelStyle : uint8_t {
  Primary,    // the offending token or node
  Secondary,  // related location (e.g. an earlier declaration)
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/**
 * One reported problem.
 *
 * Code prefixes identify the stage: L (lexer), P (parser), S (semantic
 * analysis), G (SQL generation). Warnings use the x1xx range of a stage.
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }

  /// Range of the first primary label; invalid when the diagnostic has no location.
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder; the diagnostic is committed to its bag on destruction.
 *
 *   diags.report_error(range, "Unknown decorator '@foo'").with_code("P004");
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool committed_ = false;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/// Diagnostics of one compilation, in report order.
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const { return error_count() > 0; }
  [[nodiscard]] size_t error_count() const { return count(Severity::Error); }
  [[nodiscard]] size_t warning_count() const { return count(Severity::Warning); }

  /// Diagnostics carrying the given code, in report order.
  [[nodiscard]] std::vector<Diagnostic> with_code(std::string_view code) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  [[nodiscard]] size_t count(Severity severity) const;

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace schema_dsl
