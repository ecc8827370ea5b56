// schema_dsl/codegen/sql_generator.hpp - DDL generation and schema diffing
#pragma once

#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "schema_dsl/ast/ast.hpp"
#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/codegen/dialect.hpp"

namespace schema_dsl
{

/// Ordered SQL statements taking the previous schema to the current one.
struct MigrationPlan
{
  static constexpr std::string_view k_no_changes = "-- No changes detected.";

  std::vector<std::string> statements;

  [[nodiscard]] bool empty() const noexcept { return statements.empty(); }

  /// `BEGIN;` + statements + `COMMIT;`, or k_no_changes for an empty plan.
  [[nodiscard]] std::string render() const;
};

/**
 * Translates a schema into dialect-specific DDL.
 *
 * Without a previous schema every model is created (dependency ordered)
 * followed by one join table per many-to-many pair. With a previous schema
 * only the differences are emitted: new tables, dropped tables and per
 * column ADD / DROP / ALTER statements.
 *
 * Errors (generation yields no plan):
 *   G001 default literal does not match the column type
 *   G002 autoincrement() on a column that is not an int primary key
 *   G003 function default with no translation for the dialect
 *   G004 many-to-many participant without a primary key
 *
 * Warnings:
 *   G101 foreign-key cycle between models (declaration order is kept)
 *   G102 many-to-many join table that needs manual migration
 */
class SqlGenerator
{
public:
  SqlGenerator(const Schema & current, Dialect dialect, DiagnosticBag & diags)
  : current_(current), dialect_(dialect), diags_(diags)
  {
  }

  /// Returns nullopt when an error was reported.
  [[nodiscard]] std::optional<MigrationPlan> generate(const Schema * previous = nullptr);

  [[nodiscard]] Dialect dialect() const noexcept { return dialect_; }

  /// `name TYPE [PRIMARY KEY ...] [UNIQUE] [DEFAULT x] [NOT NULL]`
  [[nodiscard]] std::string column_definition(const FieldDecl & field) const;

  /// Dialect type of a column, with array storage applied.
  [[nodiscard]] std::string storage_type(const FieldDecl & field) const;

  /// Rendered DEFAULT expression; nullopt for no default or autoincrement.
  [[nodiscard]] std::optional<std::string> default_sql(const FieldDecl & field) const;

  [[nodiscard]] std::string create_table(const ModelDecl & model) const;

  /// Models ordered so referenced tables come before referencing ones.
  [[nodiscard]] std::vector<const ModelDecl *> creation_order(
    gsl::span<const ModelDecl * const> models, bool report_cycles = true);

private:
  struct JoinTable
  {
    const ModelDecl * a = nullptr;
    const ModelDecl * b = nullptr;
    std::string name;
    const FieldDecl * declared_by = nullptr;
  };

  bool validate();
  void validate_default(const ModelDecl & model, const FieldDecl & field);

  [[nodiscard]] std::string column_definition(const FieldDecl & field, bool inline_key) const;
  [[nodiscard]] std::vector<JoinTable> join_tables() const;
  [[nodiscard]] std::optional<std::string> create_join_table(const JoinTable & join);

  void generate_fresh(MigrationPlan & plan);
  void generate_diff(const Schema & previous, MigrationPlan & plan);
  void diff_model(const ModelDecl & prev, const ModelDecl & curr, MigrationPlan & plan) const;
  void diff_column(
    const ModelDecl & model, const FieldDecl & prev, const FieldDecl & curr,
    MigrationPlan & plan) const;

  const Schema & current_;
  Dialect dialect_;
  DiagnosticBag & diags_;
};

}  // namespace schema_dsl
