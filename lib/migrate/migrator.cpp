// schema_dsl/migrate/migrator.cpp
#include "schema_dsl/migrate/migrator.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <utility>

#include "schema_dsl/ast/ast_context.hpp"
#include "schema_dsl/codegen/sql_generator.hpp"
#include "schema_dsl/migrate/introspector.hpp"

namespace schema_dsl
{

db::ConnectionUrlResult connection_url_from_env(std::string_view env_name)
{
  const std::string name(env_name);
  const char * value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return db::ConnectionUrlResult::fail(
      fmt::format("environment variable {} is not set; it must hold the database URL", name));
  }
  return db::parse_connection_url(value);
}

MigrationResult Migrator::migrate(const Schema & desired, const MigratorOptions & options)
{
  AstContext live_ast;
  Schema * live = nullptr;
  try {
    live = Introspector(conn_).introspect(live_ast);
  } catch (const db::DatabaseError & e) {
    return MigrationResult::fail(fmt::format("introspection failed: {}", e.what()));
  }

  SqlGenerator generator(desired, conn_.dialect(), diags_);
  auto plan = generator.generate(live->empty() ? nullptr : live);
  if (!plan) {
    return MigrationResult::fail("migration script could not be generated");
  }

  std::string script = plan->render();
  if (plan->empty()) {
    spdlog::info("database schema is up to date");
    return MigrationResult::ok(std::move(script), false);
  }
  if (options.dry_run) {
    spdlog::info("dry run: {} statement(s) not applied", plan->statements.size());
    return MigrationResult::ok(std::move(script), false);
  }

  return apply(plan->statements, std::move(script));
}

MigrationResult Migrator::apply(const std::vector<std::string> & statements, std::string script)
{
  try {
    conn_.begin();
    for (const std::string & statement : statements) {
      if (statement.rfind("--", 0) == 0) {
        spdlog::warn("{}", statement);
        continue;
      }
      spdlog::debug("executing: {}", statement);
      conn_.execute(statement);
    }
    conn_.commit();
  } catch (const db::DatabaseError & e) {
    spdlog::error("migration failed, rolling back: {}", e.what());
    try {
      conn_.rollback();
    } catch (const db::DatabaseError & rollback_error) {
      spdlog::error("rollback failed: {}", rollback_error.what());
    }
    return MigrationResult::fail(e.what(), std::move(script));
  }

  spdlog::info("applied {} statement(s)", statements.size());
  return MigrationResult::ok(std::move(script), true);
}

}  // namespace schema_dsl
