// schema_dsl/codegen/dialect.cpp
#include "schema_dsl/codegen/dialect.hpp"

namespace schema_dsl
{

std::optional<Dialect> parse_dialect(std::string_view name) noexcept
{
  if (name == "postgres" || name == "postgresql") return Dialect::Postgres;
  if (name == "mysql") return Dialect::MySql;
  if (name == "sqlite") return Dialect::Sqlite;
  if (name == "generic") return Dialect::Generic;
  return std::nullopt;
}

}  // namespace schema_dsl
