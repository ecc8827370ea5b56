// schema_dsl/sema/schema_analyzer.hpp - Naming and uniqueness checks
#pragma once

#include <string_view>

#include "schema_dsl/ast/ast.hpp"
#include "schema_dsl/basic/diagnostic.hpp"

namespace schema_dsl
{

/// `^[a-z0-9]+(_[a-z0-9]+)*$`
[[nodiscard]] bool is_snake_case(std::string_view name) noexcept;

/**
 * Validates a parsed schema without modifying it.
 *
 * Errors (any one aborts the run before SQL generation):
 *   S001 duplicate model name (reported at the later declaration)
 *   S002 model name not snake_case
 *   S003 duplicate field name within a model
 *   S004 field name not snake_case
 *
 * Warnings (accepted input is unchanged):
 *   S101 relation to a type that is neither primitive nor a declared model
 *   S102 foreign key naming a field that does not exist
 *   S103 @@unique naming an unknown field
 *
 * Every problem is reported; the pass never stops at the first one.
 */
class SchemaAnalyzer
{
public:
  explicit SchemaAnalyzer(DiagnosticBag & diags) : diags_(diags) {}

  /// Returns true when no error was reported by this pass.
  bool analyze(const Schema & schema);

private:
  void check_model_names(const Schema & schema);
  void check_fields(const ModelDecl & model);
  void check_relations(const Schema & schema, const ModelDecl & model);
  void check_composite_uniques(const ModelDecl & model);

  DiagnosticBag & diags_;
};

}  // namespace schema_dsl
