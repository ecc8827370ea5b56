// schema_dsl/migrate/catalog.hpp - Dialect-neutral view of a live database catalog
//
// Catalog readers translate each engine's system tables into a
// CatalogSnapshot; build_schema() then turns the snapshot into a Schema AST.
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "schema_dsl/codegen/dialect.hpp"
#include "schema_dsl/db/connection.hpp"

namespace schema_dsl
{

// ============================================================================
// Snapshot
// ============================================================================

struct CatalogColumn
{
  std::string name;
  /// Declared type, lower-cased (`character varying`, `varchar(255)`, ...).
  std::string native_type;
  bool is_array = false;
  /// Element type of an array column.
  std::string element_type;
  bool nullable = true;
  /// Default expression exactly as the catalog reports it.
  std::optional<std::string> default_expr;
  /// Sequence, identity or AUTOINCREMENT backed column.
  bool is_identity = false;
};

struct CatalogForeignKey
{
  std::vector<std::string> columns;
  std::string referenced_table;
  std::vector<std::string> referenced_columns;
};

struct CatalogTable
{
  std::string name;
  /// Physical column order.
  std::vector<CatalogColumn> columns;
  std::vector<std::string> primary_key;
  std::vector<std::vector<std::string>> unique_constraints;
  std::vector<CatalogForeignKey> foreign_keys;

  [[nodiscard]] CatalogColumn * find_column(std::string_view column_name);
  [[nodiscard]] const CatalogColumn * find_column(std::string_view column_name) const;
};

struct CatalogSnapshot
{
  std::vector<CatalogTable> tables;

  /// Returns the table named `table_name`, appending it when absent.
  CatalogTable & table(std::string_view table_name);

  [[nodiscard]] const CatalogTable * find_table(std::string_view table_name) const;
};

// ============================================================================
// Readers
// ============================================================================

/// Reads the catalog of one engine family. Throws db::DatabaseError.
class CatalogReader
{
public:
  CatalogReader() = default;
  virtual ~CatalogReader() = default;

  CatalogReader(const CatalogReader &) = delete;
  CatalogReader & operator=(const CatalogReader &) = delete;

  [[nodiscard]] virtual CatalogSnapshot read(db::Connection & conn) const = 0;
};

/// information_schema.columns + pg_constraint of the `public` schema.
class PostgresCatalogReader final : public CatalogReader
{
public:
  [[nodiscard]] CatalogSnapshot read(db::Connection & conn) const override;
};

/// information_schema of the connection's current database.
class MySqlCatalogReader final : public CatalogReader
{
public:
  [[nodiscard]] CatalogSnapshot read(db::Connection & conn) const override;
};

/// sqlite_master plus PRAGMA table_info / index_list / index_info /
/// foreign_key_list.
class SqliteCatalogReader final : public CatalogReader
{
public:
  [[nodiscard]] CatalogSnapshot read(db::Connection & conn) const override;
};

/// Reader for `dialect`; nullptr for Dialect::Generic.
[[nodiscard]] std::unique_ptr<CatalogReader> make_catalog_reader(Dialect dialect);

// ============================================================================
// Helpers shared by the readers
// ============================================================================

namespace catalog_detail
{

[[nodiscard]] std::string to_lower(std::string_view text);

/// Removes surrounding double quotes or backticks from an identifier.
[[nodiscard]] std::string unquote_identifier(std::string_view text);

/// Column list of the first parenthesized group: `UNIQUE (a, "b")` -> {a, b}.
[[nodiscard]] std::vector<std::string> parenthesized_columns(std::string_view definition);

/// Parses `FOREIGN KEY (a) REFERENCES t(id) ...`; nullopt when malformed.
[[nodiscard]] std::optional<CatalogForeignKey> parse_foreign_key_definition(
  std::string_view definition);

}  // namespace catalog_detail

}  // namespace schema_dsl
