// schema_dsl/db/mysql_connection.cpp
#include "schema_dsl/db/mysql_connection.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace schema_dsl::db
{

namespace
{

/// Frees a MYSQL_RES on scope exit.
class ResultGuard
{
public:
  explicit ResultGuard(MYSQL_RES * result) : result_(result) {}
  ~ResultGuard() { mysql_free_result(result_); }

  ResultGuard(const ResultGuard &) = delete;
  ResultGuard & operator=(const ResultGuard &) = delete;

  [[nodiscard]] MYSQL_RES * get() const noexcept { return result_; }

private:
  MYSQL_RES * result_;
};

const char * or_null(const std::string & text) { return text.empty() ? nullptr : text.c_str(); }

}  // namespace

// ============================================================================
// MySqlConnection
// ============================================================================

MySqlConnection::MySqlConnection(const ConnectionUrl & url) : mysql_(mysql_init(nullptr))
{
  if (mysql_ == nullptr) {
    throw DatabaseError("cannot connect to mysql: out of memory");
  }
  mysql_options(mysql_, MYSQL_SET_CHARSET_NAME, "utf8mb4");

  if (mysql_real_connect(
        mysql_, or_null(url.host), or_null(url.user), or_null(url.password),
        or_null(url.database), url.port, nullptr, 0) == nullptr) {
    const std::string message = mysql_error(mysql_);
    mysql_close(mysql_);
    mysql_ = nullptr;
    throw DatabaseError(fmt::format("cannot connect to mysql: {}", message));
  }
  spdlog::debug(
    "connected to mysql database '{}' on {}", url.database,
    url.host.empty() ? "local socket" : url.host);
}

MySqlConnection::~MySqlConnection()
{
  if (mysql_ != nullptr) {
    mysql_close(mysql_);
  }
}

void MySqlConnection::fail(const std::string & sql) const
{
  throw DatabaseError(fmt::format("statement failed: {}\n  {}", mysql_error(mysql_), sql));
}

ResultSet MySqlConnection::query(const std::string & sql)
{
  if (mysql_real_query(mysql_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
    fail(sql);
  }

  ResultSet result;
  MYSQL_RES * raw = mysql_store_result(mysql_);
  if (raw == nullptr) {
    // No result set: either the statement returns none or fetching it failed.
    if (mysql_field_count(mysql_) != 0) {
      fail(sql);
    }
    return result;
  }
  const ResultGuard stored(raw);

  const unsigned int column_count = mysql_num_fields(stored.get());
  const MYSQL_FIELD * fields = mysql_fetch_fields(stored.get());
  result.columns.reserve(column_count);
  for (unsigned int c = 0; c < column_count; ++c) {
    result.columns.emplace_back(fields[c].name);
  }

  while (MYSQL_ROW values = mysql_fetch_row(stored.get())) {
    const unsigned long * lengths = mysql_fetch_lengths(stored.get());
    Row row;
    row.reserve(column_count);
    for (unsigned int c = 0; c < column_count; ++c) {
      if (values[c] == nullptr) {
        row.emplace_back(std::nullopt);
        continue;
      }
      row.emplace_back(std::string(values[c], lengths[c]));
    }
    result.rows.push_back(std::move(row));
  }

  spdlog::trace("mysql query returned {} row(s): {}", result.rows.size(), sql);
  return result;
}

void MySqlConnection::execute(const std::string & sql)
{
  if (mysql_real_query(mysql_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
    fail(sql);
  }
  // Drain a result set if the statement produced one.
  if (MYSQL_RES * raw = mysql_store_result(mysql_)) {
    mysql_free_result(raw);
  }
  spdlog::trace("mysql executed: {}", sql);
}

}  // namespace schema_dsl::db
