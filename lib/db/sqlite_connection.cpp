// schema_dsl/db/sqlite_connection.cpp
#include "schema_dsl/db/sqlite_connection.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <utility>

namespace schema_dsl::db
{

namespace
{

/// Finalizes a prepared statement on scope exit.
class StatementGuard
{
public:
  explicit StatementGuard(sqlite3_stmt * stmt) : stmt_(stmt) {}
  ~StatementGuard() { sqlite3_finalize(stmt_); }

  StatementGuard(const StatementGuard &) = delete;
  StatementGuard & operator=(const StatementGuard &) = delete;

  [[nodiscard]] sqlite3_stmt * get() const noexcept { return stmt_; }

private:
  sqlite3_stmt * stmt_;
};

}  // namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(const std::string & path) : path_(path)
{
  const int rc = sqlite3_open_v2(
    path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    const std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw DatabaseError(fmt::format("cannot open sqlite database '{}': {}", path, message));
  }
  sqlite3_busy_timeout(db_, 5000);

  if (sqlite3_exec(db_, "PRAGMA foreign_keys = ON", nullptr, nullptr, nullptr) != SQLITE_OK) {
    const std::string message = sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw DatabaseError(fmt::format("cannot enable foreign keys on '{}': {}", path, message));
  }
  spdlog::debug("opened sqlite database '{}'", path);
}

SqliteConnection::~SqliteConnection()
{
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void SqliteConnection::fail(const std::string & context) const
{
  throw DatabaseError(fmt::format("{}: {}", context, sqlite3_errmsg(db_)));
}

ResultSet SqliteConnection::query(const std::string & sql)
{
  sqlite3_stmt * raw = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr) !=
      SQLITE_OK) {
    fail(fmt::format("cannot prepare '{}'", sql));
  }
  const StatementGuard stmt(raw);

  ResultSet result;
  const int column_count = sqlite3_column_count(stmt.get());
  result.columns.reserve(static_cast<size_t>(column_count));
  for (int i = 0; i < column_count; ++i) {
    result.columns.emplace_back(sqlite3_column_name(stmt.get(), i));
  }

  while (true) {
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      fail(fmt::format("query failed '{}'", sql));
    }

    Row row;
    row.reserve(static_cast<size_t>(column_count));
    for (int i = 0; i < column_count; ++i) {
      if (sqlite3_column_type(stmt.get(), i) == SQLITE_NULL) {
        row.emplace_back(std::nullopt);
        continue;
      }
      const auto * text = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), i));
      const int bytes = sqlite3_column_bytes(stmt.get(), i);
      row.emplace_back(std::string(text, static_cast<size_t>(bytes)));
    }
    result.rows.push_back(std::move(row));
  }

  spdlog::trace("sqlite query returned {} row(s): {}", result.rows.size(), sql);
  return result;
}

void SqliteConnection::execute(const std::string & sql)
{
  char * error = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
  if (rc != SQLITE_OK) {
    std::string message = error ? error : sqlite3_errstr(rc);
    sqlite3_free(error);
    throw DatabaseError(fmt::format("statement failed: {}\n  {}", message, sql));
  }
  spdlog::trace("sqlite executed: {}", sql);
}

}  // namespace schema_dsl::db
