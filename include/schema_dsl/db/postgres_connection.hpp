// schema_dsl/db/postgres_connection.hpp - Connection backed by libpq
#pragma once

#include <string>

#include "schema_dsl/db/connection.hpp"

struct pg_conn;
struct pg_result;

namespace schema_dsl::db
{

/**
 * Owns one libpq connection for its lifetime.
 *
 * `conninfo` is anything PQconnectdb accepts, including the
 * postgres:// and postgresql:// URI forms.
 */
class PostgresConnection final : public Connection
{
public:
  explicit PostgresConnection(const std::string & conninfo);
  ~PostgresConnection() override;

  [[nodiscard]] Dialect dialect() const noexcept override { return Dialect::Postgres; }

  ResultSet query(const std::string & sql) override;
  void execute(const std::string & sql) override;

private:
  /// Runs `sql`; throws unless the result status is command-ok or tuples-ok.
  pg_result * run(const std::string & sql);

  pg_conn * conn_ = nullptr;
};

}  // namespace schema_dsl::db
