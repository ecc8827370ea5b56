// schema_dsl/migrate/migrator.hpp - Introspect, diff and apply
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "schema_dsl/ast/ast.hpp"
#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/db/connection.hpp"
#include "schema_dsl/db/connection_url.hpp"

namespace schema_dsl
{

struct MigrationResult
{
  bool success = false;
  /// True when statements were executed against the database.
  bool applied = false;
  std::string error;
  /// Rendered script (also reported on failure).
  std::string script;

  static MigrationResult ok(std::string script, bool applied)
  {
    MigrationResult r;
    r.success = true;
    r.applied = applied;
    r.script = std::move(script);
    return r;
  }

  static MigrationResult fail(std::string msg, std::string script = {})
  {
    MigrationResult r;
    r.error = std::move(msg);
    r.script = std::move(script);
    return r;
  }
};

struct MigratorOptions
{
  /// Render the script without executing it.
  bool dry_run = false;
};

/// Reads the connection string from environment variable `env_name`.
[[nodiscard]] db::ConnectionUrlResult connection_url_from_env(std::string_view env_name);

/**
 * Brings a live database in line with a desired schema.
 *
 * The current database schema is introspected and diffed against `desired`.
 * Statements run one at a time inside a single transaction; comment
 * statements are logged, not executed. Any failure rolls the transaction
 * back and is reported together with the full script.
 */
class Migrator
{
public:
  Migrator(db::Connection & conn, DiagnosticBag & diags) : conn_(conn), diags_(diags) {}

  [[nodiscard]] MigrationResult migrate(const Schema & desired, const MigratorOptions & options = {});

private:
  [[nodiscard]] MigrationResult apply(const std::vector<std::string> & statements, std::string script);

  db::Connection & conn_;
  DiagnosticBag & diags_;
};

}  // namespace schema_dsl
