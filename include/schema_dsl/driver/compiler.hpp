// schema_dsl/driver/compiler.hpp - Compiler driver
//
// Single entry point for the check/build pipeline.
// Used by the CLI; the migrate command reuses it to obtain the desired schema.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/project/project_config.hpp"
#include "schema_dsl/syntax/frontend.hpp"

namespace schema_dsl
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Syntax and semantic analysis only
  Build,  ///< Check plus the generated type header
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Check;

  /// Type header path (overrides project config). Without either, the
  /// header is written beside the schema as `<stem>_types.hpp`.
  std::optional<std::filesystem::path> types_output;

  /// Namespace of the generated types (overrides project config)
  std::optional<std::string> types_namespace;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Source, AST and diagnostics of the compiled schema. Always set.
  std::unique_ptr<ParsedUnit> unit;

  /// Generated files (only populated for Build mode)
  std::vector<std::filesystem::path> generated_files;

  [[nodiscard]] const DiagnosticBag & diagnostics() const { return unit->diags; }
  [[nodiscard]] const Schema * schema() const { return unit->schema; }
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the pipeline:
 * 1. Lexing and parsing (an input without tokens is an error)
 * 2. Semantic analysis
 * 3. Type header generation (Build mode only)
 *
 * Each stage runs only when the previous one reported no errors.
 */
class Compiler
{
public:
  /// Compile schema text held in memory. `path` is used for display only.
  [[nodiscard]] static CompileResult compile_source(
    std::string text, const std::filesystem::path & path, const CompileOptions & options);

  [[nodiscard]] static CompileResult compile_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /// Compile `compiler.schema` of a project (sdc.yaml).
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

private:
  static bool run_semantic_analysis(ParsedUnit & unit);

  static bool generate_types(
    ParsedUnit & unit, const std::filesystem::path & output_path, const std::string & ns);
};

}  // namespace schema_dsl
