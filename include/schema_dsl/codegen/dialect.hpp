// schema_dsl/codegen/dialect.hpp - Target SQL engine families and their tables
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "schema_dsl/ast/ast_enums.hpp"

namespace schema_dsl
{

enum class Dialect : uint8_t {
  Postgres,
  MySql,
  Sqlite,
  Generic,
};

inline constexpr size_t k_dialect_count = 4;

[[nodiscard]] constexpr std::string_view to_string(Dialect d) noexcept
{
  switch (d) {
    case Dialect::Postgres:
      return "postgres";
    case Dialect::MySql:
      return "mysql";
    case Dialect::Sqlite:
      return "sqlite";
    case Dialect::Generic:
      return "generic";
  }
  return "generic";
}

/// Accepts "postgres", "postgresql", "mysql", "sqlite" and "generic".
[[nodiscard]] std::optional<Dialect> parse_dialect(std::string_view name) noexcept;

// ============================================================================
// Type and default-function tables
// ============================================================================

namespace dialect_tables
{

using DialectRow = std::array<std::string_view, k_dialect_count>;

// Rows indexed by ScalarType, columns by Dialect.
inline constexpr std::array<DialectRow, k_scalar_type_count> k_scalar_types = {{
  // postgres        mysql            sqlite       generic
  {"INTEGER", "INT", "INTEGER", "INTEGER"},                  // int
  {"VARCHAR(255)", "VARCHAR(255)", "TEXT", "VARCHAR(255)"},  // string
  {"REAL", "FLOAT", "REAL", "FLOAT"},                        // float
  {"BOOLEAN", "TINYINT(1)", "BOOLEAN", "BOOLEAN"},           // boolean
  {"JSONB", "JSON", "TEXT", "TEXT"},                         // json
  {"TIMESTAMP", "DATETIME", "DATETIME", "DATETIME"},         // datetime
  {"DATE", "DATE", "DATE", "DATE"},                          // date
}};

static_assert(static_cast<size_t>(ScalarType::Date) + 1 == k_scalar_type_count);
static_assert(static_cast<size_t>(Dialect::Generic) + 1 == k_dialect_count);

// Rows indexed by DefaultFunction. Empty entries have no translation.
// Autoincrement is rendered as identity syntax on the column, never as DEFAULT.
inline constexpr std::array<DialectRow, k_default_function_count> k_default_functions = {{
  {"", "", "", ""},                                                         // autoincrement
  {"gen_random_uuid()", "(UUID())", "(HEX(RANDOMBLOB(16)))", ""},           // uuid
  {"CURRENT_TIMESTAMP", "NOW()", "(DATETIME('now'))", "CURRENT_TIMESTAMP"},  // now
}};

static_assert(static_cast<size_t>(DefaultFunction::Now) + 1 == k_default_function_count);

}  // namespace dialect_tables

[[nodiscard]] constexpr std::string_view sql_type(ScalarType t, Dialect d) noexcept
{
  return dialect_tables::k_scalar_types[static_cast<size_t>(t)][static_cast<size_t>(d)];
}

/// SQL expression for a function default, or nullopt when the dialect has none.
[[nodiscard]] constexpr std::optional<std::string_view> default_function_sql(
  DefaultFunction f, Dialect d) noexcept
{
  const std::string_view sql =
    dialect_tables::k_default_functions[static_cast<size_t>(f)][static_cast<size_t>(d)];
  if (sql.empty()) {
    return std::nullopt;
  }
  return sql;
}

}  // namespace schema_dsl
