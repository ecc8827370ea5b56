// schema_dsl/migrate/mysql_catalog_reader.cpp
#include <spdlog/spdlog.h>

#include <map>
#include <utility>

#include "schema_dsl/migrate/catalog.hpp"

namespace schema_dsl
{

namespace
{

constexpr const char * k_columns_query =
  "SELECT c.TABLE_NAME AS table_name, c.COLUMN_NAME AS column_name, c.DATA_TYPE AS data_type, "
  "c.COLUMN_TYPE AS column_type, c.IS_NULLABLE AS is_nullable, "
  "c.COLUMN_DEFAULT AS column_default, c.EXTRA AS extra "
  "FROM information_schema.COLUMNS c "
  "JOIN information_schema.TABLES t "
  "ON t.TABLE_SCHEMA = c.TABLE_SCHEMA AND t.TABLE_NAME = c.TABLE_NAME "
  "WHERE c.TABLE_SCHEMA = DATABASE() AND t.TABLE_TYPE = 'BASE TABLE' "
  "ORDER BY c.TABLE_NAME, c.ORDINAL_POSITION";

constexpr const char * k_constraints_query =
  "SELECT tc.TABLE_NAME AS table_name, tc.CONSTRAINT_NAME AS constraint_name, "
  "tc.CONSTRAINT_TYPE AS constraint_type, kcu.COLUMN_NAME AS column_name, "
  "kcu.REFERENCED_TABLE_NAME AS referenced_table, "
  "kcu.REFERENCED_COLUMN_NAME AS referenced_column "
  "FROM information_schema.TABLE_CONSTRAINTS tc "
  "JOIN information_schema.KEY_COLUMN_USAGE kcu "
  "ON kcu.CONSTRAINT_SCHEMA = tc.CONSTRAINT_SCHEMA AND kcu.TABLE_NAME = tc.TABLE_NAME "
  "AND kcu.CONSTRAINT_NAME = tc.CONSTRAINT_NAME "
  "WHERE tc.TABLE_SCHEMA = DATABASE() "
  "ORDER BY tc.TABLE_NAME, tc.CONSTRAINT_NAME, kcu.ORDINAL_POSITION";

struct ConstraintRows
{
  std::string type;
  std::vector<std::string> columns;
  std::string referenced_table;
  std::vector<std::string> referenced_columns;
};

}  // namespace

CatalogSnapshot MySqlCatalogReader::read(db::Connection & conn) const
{
  using catalog_detail::to_lower;

  CatalogSnapshot snapshot;

  const db::ResultSet columns = conn.query(k_columns_query);
  for (size_t i = 0; i < columns.size(); ++i) {
    CatalogColumn column;
    column.name = columns.get_or(i, "column_name", "");
    // COLUMN_TYPE keeps the display width that marks booleans: tinyint(1).
    const std::string column_type = to_lower(columns.get_or(i, "column_type", ""));
    column.native_type =
      column_type == "tinyint(1)" ? column_type : to_lower(columns.get_or(i, "data_type", ""));
    column.nullable = columns.get_or(i, "is_nullable", "YES") != "NO";
    column.default_expr = columns.get(i, "column_default");
    column.is_identity =
      to_lower(columns.get_or(i, "extra", "")).find("auto_increment") != std::string::npos;

    snapshot.table(columns.get_or(i, "table_name", "")).columns.push_back(std::move(column));
  }

  // One row per constraint column; regroup by (table, constraint).
  std::map<std::pair<std::string, std::string>, ConstraintRows> grouped;
  const db::ResultSet constraints = conn.query(k_constraints_query);
  for (size_t i = 0; i < constraints.size(); ++i) {
    auto & entry = grouped[{
      constraints.get_or(i, "table_name", ""), constraints.get_or(i, "constraint_name", "")}];
    entry.type = constraints.get_or(i, "constraint_type", "");
    entry.columns.push_back(constraints.get_or(i, "column_name", ""));
    if (auto ref = constraints.get(i, "referenced_table")) {
      entry.referenced_table = std::move(*ref);
      entry.referenced_columns.push_back(constraints.get_or(i, "referenced_column", ""));
    }
  }

  for (auto & [key, rows] : grouped) {
    if (snapshot.find_table(key.first) == nullptr) {
      continue;
    }
    CatalogTable & table = snapshot.table(key.first);
    if (rows.type == "PRIMARY KEY") {
      table.primary_key = std::move(rows.columns);
    } else if (rows.type == "UNIQUE") {
      table.unique_constraints.push_back(std::move(rows.columns));
    } else if (rows.type == "FOREIGN KEY" && !rows.referenced_table.empty()) {
      CatalogForeignKey fk;
      fk.columns = std::move(rows.columns);
      fk.referenced_table = std::move(rows.referenced_table);
      fk.referenced_columns = std::move(rows.referenced_columns);
      table.foreign_keys.push_back(std::move(fk));
    }
  }

  spdlog::debug("read {} table(s) from mysql catalog", snapshot.tables.size());
  return snapshot;
}

}  // namespace schema_dsl
