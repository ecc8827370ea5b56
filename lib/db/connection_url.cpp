// schema_dsl/db/connection_url.cpp
#include "schema_dsl/db/connection_url.hpp"

#include <fmt/core.h>

#include <charconv>
#include <optional>
#include <system_error>

#include "schema_dsl/db/postgres_connection.hpp"
#include "schema_dsl/db/sqlite_connection.hpp"

#ifdef SCHEMA_DSL_HAVE_MYSQL
#include "schema_dsl/db/mysql_connection.hpp"
#endif

namespace schema_dsl::db
{

namespace
{

bool starts_with(std::string_view text, std::string_view prefix)
{
  return text.substr(0, prefix.size()) == prefix;
}

std::string_view trim(std::string_view text)
{
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

int hex_value(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<std::string> percent_decode(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out.push_back(text[i]);
      continue;
    }
    if (i + 2 >= text.size()) {
      return std::nullopt;
    }
    const int hi = hex_value(text[i + 1]);
    const int lo = hex_value(text[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }
  return out;
}

/// Splits `user:password@host:port/database?options` (the part after the
/// scheme) into `parsed`. Returns an error message, empty on success.
std::string parse_server_components(std::string_view rest, ConnectionUrl & parsed)
{
  rest = rest.substr(0, rest.find('?'));

  std::string_view authority = rest;
  const auto slash = rest.find('/');
  if (slash != std::string_view::npos) {
    authority = rest.substr(0, slash);
    auto database = percent_decode(rest.substr(slash + 1));
    if (!database) {
      return "malformed percent-encoding in database name";
    }
    parsed.database = std::move(*database);
  }

  const auto at = authority.rfind('@');
  if (at != std::string_view::npos) {
    const std::string_view credentials = authority.substr(0, at);
    authority = authority.substr(at + 1);

    const auto colon = credentials.find(':');
    auto user = percent_decode(credentials.substr(0, colon));
    auto password = percent_decode(
      colon == std::string_view::npos ? std::string_view{} : credentials.substr(colon + 1));
    if (!user || !password) {
      return "malformed percent-encoding in credentials";
    }
    parsed.user = std::move(*user);
    parsed.password = std::move(*password);
  }

  // Bracketed IPv6 literal: [::1]:5432
  std::string_view host = authority;
  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return "unterminated '[' in host";
    }
    host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        return fmt::format("unexpected text after host '{}'", host);
      }
      port = authority.substr(close + 2);
    }
  } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
  }
  parsed.host = std::string(host);

  if (!port.empty()) {
    unsigned value = 0;
    const auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc{} || end != port.data() + port.size() || value == 0 || value > 65535) {
      return fmt::format("invalid port '{}'", port);
    }
    parsed.port = static_cast<uint16_t>(value);
  }
  return {};
}

}  // namespace

ConnectionUrlResult parse_connection_url(std::string_view text)
{
  const std::string_view url = trim(text);
  if (url.empty()) {
    return ConnectionUrlResult::fail("connection string is empty");
  }

  ConnectionUrl parsed;
  parsed.url = std::string(url);

  if (url == "sqlite::memory:") {
    parsed.dialect = Dialect::Sqlite;
    parsed.sqlite_path = ":memory:";
    return ConnectionUrlResult::ok(std::move(parsed));
  }

  if (starts_with(url, "sqlite://")) {
    const std::string_view path = url.substr(std::string_view("sqlite://").size());
    if (path.empty()) {
      return ConnectionUrlResult::fail("sqlite connection string has no database path");
    }
    parsed.dialect = Dialect::Sqlite;
    parsed.sqlite_path = std::string(path);
    return ConnectionUrlResult::ok(std::move(parsed));
  }

  const auto scheme_end = url.find("://");
  if (starts_with(url, "postgres://") || starts_with(url, "postgresql://")) {
    parsed.dialect = Dialect::Postgres;
  } else if (starts_with(url, "mysql://")) {
    parsed.dialect = Dialect::MySql;
  }
  if (parsed.dialect != Dialect::Generic) {
    std::string error = parse_server_components(url.substr(scheme_end + 3), parsed);
    if (!error.empty()) {
      return ConnectionUrlResult::fail(fmt::format("{} in '{}'", error, url));
    }
    return ConnectionUrlResult::ok(std::move(parsed));
  }

  return ConnectionUrlResult::fail(fmt::format(
    "unrecognized connection scheme '{}' (expected postgres, postgresql, mysql or sqlite)",
    scheme_end == std::string_view::npos ? url : url.substr(0, scheme_end)));
}

std::unique_ptr<Connection> open_connection(const ConnectionUrl & url)
{
  switch (url.dialect) {
    case Dialect::Sqlite:
      return std::make_unique<SqliteConnection>(url.sqlite_path);
    case Dialect::Postgres:
      return std::make_unique<PostgresConnection>(url.url);
    case Dialect::MySql:
#ifdef SCHEMA_DSL_HAVE_MYSQL
      return std::make_unique<MySqlConnection>(url);
#else
      throw DatabaseError(
        "this build has no MySQL client (configure with libmysqlclient installed); "
        "use `sdc sql` to produce the migration script");
#endif
    case Dialect::Generic:
      break;
  }
  throw DatabaseError("a generic connection string names no database to connect to");
}

}  // namespace schema_dsl::db
