// schema_dsl/db/mysql_connection.hpp - Connection backed by libmysqlclient
#pragma once

#include <mysql.h>

#include <string>

#include "schema_dsl/db/connection.hpp"
#include "schema_dsl/db/connection_url.hpp"

namespace schema_dsl::db
{

/**
 * Owns one MySQL client handle for its lifetime.
 *
 * Connects with the user, password, host, port and database parsed from a
 * mysql:// URL. An empty host means the local socket.
 */
class MySqlConnection final : public Connection
{
public:
  explicit MySqlConnection(const ConnectionUrl & url);
  ~MySqlConnection() override;

  [[nodiscard]] Dialect dialect() const noexcept override { return Dialect::MySql; }

  ResultSet query(const std::string & sql) override;
  void execute(const std::string & sql) override;

  void begin() override { execute("START TRANSACTION"); }

private:
  [[noreturn]] void fail(const std::string & sql) const;

  MYSQL * mysql_ = nullptr;
};

}  // namespace schema_dsl::db
