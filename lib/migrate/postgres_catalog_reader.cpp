// schema_dsl/migrate/postgres_catalog_reader.cpp
#include <spdlog/spdlog.h>

#include <utility>

#include "schema_dsl/migrate/catalog.hpp"

namespace schema_dsl
{

namespace
{

constexpr const char * k_columns_query =
  "SELECT c.table_name, c.column_name, c.data_type, c.udt_name, c.is_nullable, "
  "c.column_default, c.is_identity "
  "FROM information_schema.columns c "
  "JOIN information_schema.tables t "
  "ON t.table_schema = c.table_schema AND t.table_name = c.table_name "
  "WHERE c.table_schema = 'public' AND t.table_type = 'BASE TABLE' "
  "ORDER BY c.table_name, c.ordinal_position";

constexpr const char * k_constraints_query =
  "SELECT con.conname, con.contype, con.conrelid::regclass::text AS table_name, "
  "pg_get_constraintdef(con.oid) AS definition "
  "FROM pg_constraint con "
  "WHERE con.connamespace = 'public'::regnamespace "
  "ORDER BY table_name, con.conname";

}  // namespace

CatalogSnapshot PostgresCatalogReader::read(db::Connection & conn) const
{
  using catalog_detail::parenthesized_columns;
  using catalog_detail::to_lower;
  using catalog_detail::unquote_identifier;

  CatalogSnapshot snapshot;

  const db::ResultSet columns = conn.query(k_columns_query);
  for (size_t i = 0; i < columns.size(); ++i) {
    CatalogColumn column;
    column.name = columns.get_or(i, "column_name", "");
    column.native_type = to_lower(columns.get_or(i, "data_type", ""));
    if (column.native_type == "array") {
      // udt_name of an array is the element type prefixed with '_'.
      const std::string udt = columns.get_or(i, "udt_name", "");
      column.is_array = true;
      column.element_type = to_lower(udt.empty() || udt[0] != '_' ? udt : udt.substr(1));
    }
    column.nullable = columns.get_or(i, "is_nullable", "YES") != "NO";
    column.default_expr = columns.get(i, "column_default");
    column.is_identity = columns.get_or(i, "is_identity", "NO") == "YES";

    snapshot.table(columns.get_or(i, "table_name", "")).columns.push_back(std::move(column));
  }

  const db::ResultSet constraints = conn.query(k_constraints_query);
  for (size_t i = 0; i < constraints.size(); ++i) {
    const std::string table_name = unquote_identifier(constraints.get_or(i, "table_name", ""));
    const std::string type = constraints.get_or(i, "contype", "");
    const std::string definition = constraints.get_or(i, "definition", "");

    if (snapshot.find_table(table_name) == nullptr) {
      continue;
    }
    CatalogTable & table = snapshot.table(table_name);

    if (type == "p") {
      table.primary_key = parenthesized_columns(definition);
    } else if (type == "u") {
      table.unique_constraints.push_back(parenthesized_columns(definition));
    } else if (type == "f") {
      if (auto fk = catalog_detail::parse_foreign_key_definition(definition)) {
        table.foreign_keys.push_back(std::move(*fk));
      } else {
        spdlog::warn("ignoring unreadable foreign key on '{}': {}", table_name, definition);
      }
    }
  }

  spdlog::debug("read {} table(s) from postgres catalog", snapshot.tables.size());
  return snapshot;
}

}  // namespace schema_dsl
