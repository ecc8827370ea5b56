// schema_dsl/db/postgres_connection.cpp
#include "schema_dsl/db/postgres_connection.hpp"

#include <fmt/core.h>
#include <libpq-fe.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace schema_dsl::db
{

namespace
{

/// Clears a PGresult on scope exit.
class ResultGuard
{
public:
  explicit ResultGuard(PGresult * result) : result_(result) {}
  ~ResultGuard() { PQclear(result_); }

  ResultGuard(const ResultGuard &) = delete;
  ResultGuard & operator=(const ResultGuard &) = delete;

  [[nodiscard]] PGresult * get() const noexcept { return result_; }

private:
  PGresult * result_;
};

/// libpq messages end with a newline.
std::string trimmed_message(const char * message)
{
  std::string text = message != nullptr ? message : "";
  while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
    text.pop_back();
  }
  return text;
}

}  // namespace

// ============================================================================
// PostgresConnection
// ============================================================================

PostgresConnection::PostgresConnection(const std::string & conninfo)
: conn_(PQconnectdb(conninfo.c_str()))
{
  if (conn_ == nullptr) {
    throw DatabaseError("cannot connect to postgres: out of memory");
  }
  if (PQstatus(conn_) != CONNECTION_OK) {
    const std::string message = trimmed_message(PQerrorMessage(conn_));
    PQfinish(conn_);
    conn_ = nullptr;
    throw DatabaseError(fmt::format("cannot connect to postgres: {}", message));
  }
  // Keep server notices (e.g. "relation already exists, skipping") off stderr.
  PQsetNoticeProcessor(
    conn_,
    [](void *, const char * message) { spdlog::debug("postgres: {}", trimmed_message(message)); },
    nullptr);
  spdlog::debug(
    "connected to postgres database '{}' on {}", PQdb(conn_),
    PQhost(conn_) != nullptr ? PQhost(conn_) : "local socket");
}

PostgresConnection::~PostgresConnection()
{
  if (conn_ != nullptr) {
    PQfinish(conn_);
  }
}

PGresult * PostgresConnection::run(const std::string & sql)
{
  PGresult * result = PQexec(conn_, sql.c_str());
  const ExecStatusType status = PQresultStatus(result);
  if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
    const std::string message = trimmed_message(
      result != nullptr ? PQresultErrorMessage(result) : PQerrorMessage(conn_));
    PQclear(result);
    throw DatabaseError(fmt::format("statement failed: {}\n  {}", message, sql));
  }
  return result;
}

ResultSet PostgresConnection::query(const std::string & sql)
{
  const ResultGuard pg(run(sql));

  ResultSet result;
  const int column_count = PQnfields(pg.get());
  const int row_count = PQntuples(pg.get());
  result.columns.reserve(static_cast<size_t>(column_count));
  for (int c = 0; c < column_count; ++c) {
    result.columns.emplace_back(PQfname(pg.get(), c));
  }

  result.rows.reserve(static_cast<size_t>(row_count));
  for (int r = 0; r < row_count; ++r) {
    Row row;
    row.reserve(static_cast<size_t>(column_count));
    for (int c = 0; c < column_count; ++c) {
      if (PQgetisnull(pg.get(), r, c)) {
        row.emplace_back(std::nullopt);
        continue;
      }
      row.emplace_back(std::string(
        PQgetvalue(pg.get(), r, c), static_cast<size_t>(PQgetlength(pg.get(), r, c))));
    }
    result.rows.push_back(std::move(row));
  }

  spdlog::trace("postgres query returned {} row(s): {}", result.rows.size(), sql);
  return result;
}

void PostgresConnection::execute(const std::string & sql)
{
  const ResultGuard pg(run(sql));
  spdlog::trace("postgres executed: {}", sql);
}

}  // namespace schema_dsl::db
