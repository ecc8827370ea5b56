// schema_dsl/db/sqlite_connection.hpp - Connection backed by libsqlite3
#pragma once

#include <string>

#include "schema_dsl/db/connection.hpp"

struct sqlite3;

namespace schema_dsl::db
{

/**
 * Owns one sqlite3 handle for its lifetime.
 *
 * `path` is a database file (created when missing) or ":memory:".
 * Foreign key enforcement is switched on when the handle is opened.
 */
class SqliteConnection final : public Connection
{
public:
  explicit SqliteConnection(const std::string & path);
  ~SqliteConnection() override;

  [[nodiscard]] Dialect dialect() const noexcept override { return Dialect::Sqlite; }

  ResultSet query(const std::string & sql) override;
  void execute(const std::string & sql) override;

  [[nodiscard]] const std::string & path() const noexcept { return path_; }

private:
  [[noreturn]] void fail(const std::string & context) const;

  sqlite3 * db_ = nullptr;
  std::string path_;
};

}  // namespace schema_dsl::db
