// schema_dsl/db/connection.hpp - Minimal database connection interface
//
// The introspector and migrator talk to a live database only through this
// interface. Results are materialized as text; NULL cells are nullopt.
//
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "schema_dsl/codegen/dialect.hpp"

namespace schema_dsl::db
{

/// Raised by connections for any driver-level failure.
class DatabaseError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

using Row = std::vector<std::optional<std::string>>;

struct ResultSet
{
  std::vector<std::string> columns;
  std::vector<Row> rows;

  [[nodiscard]] bool empty() const noexcept { return rows.empty(); }
  [[nodiscard]] size_t size() const noexcept { return rows.size(); }

  [[nodiscard]] std::optional<size_t> column_index(std::string_view name) const noexcept;

  /// Cell value by column name; nullopt for NULL or an unknown column.
  [[nodiscard]] std::optional<std::string> get(size_t row, std::string_view column) const;

  /// Cell value, or `fallback` for NULL or an unknown column.
  [[nodiscard]] std::string get_or(size_t row, std::string_view column, std::string fallback) const;
};

class Connection
{
public:
  Connection() = default;
  virtual ~Connection() = default;

  Connection(const Connection &) = delete;
  Connection & operator=(const Connection &) = delete;
  Connection(Connection &&) = delete;
  Connection & operator=(Connection &&) = delete;

  [[nodiscard]] virtual Dialect dialect() const noexcept = 0;

  /// Run a statement returning rows. Throws DatabaseError.
  virtual ResultSet query(const std::string & sql) = 0;

  /// Run a statement without a result. Throws DatabaseError.
  virtual void execute(const std::string & sql) = 0;

  virtual void begin() { execute("BEGIN"); }
  virtual void commit() { execute("COMMIT"); }
  virtual void rollback() { execute("ROLLBACK"); }
};

}  // namespace schema_dsl::db
