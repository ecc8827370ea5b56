// schema_dsl/migrate/sqlite_catalog_reader.cpp
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <string_view>
#include <utility>
#include <vector>

#include "schema_dsl/migrate/catalog.hpp"

namespace schema_dsl
{

namespace
{

constexpr const char * k_tables_query =
  "SELECT name, sql FROM sqlite_master "
  "WHERE type = 'table' AND name NOT LIKE 'sqlite_%' ORDER BY name";

std::string quote_identifier(std::string_view name)
{
  std::string out = "\"";
  for (const char c : name) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::string pragma(std::string_view name, std::string_view argument)
{
  return fmt::format("PRAGMA {}({})", name, quote_identifier(argument));
}

bool is_word_char(char c)
{
  return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '$';
}

/// Top-level comma separated definitions inside the outer parentheses of a
/// CREATE TABLE statement. Commas nested in parentheses or quotes do not split.
std::vector<std::string_view> table_definitions(std::string_view create_sql)
{
  std::vector<std::string_view> definitions;
  const auto open = create_sql.find('(');
  if (open == std::string_view::npos) {
    return definitions;
  }

  int depth = 0;
  char quote = '\0';
  size_t start = open + 1;
  for (size_t i = open + 1; i < create_sql.size(); ++i) {
    const char c = create_sql[i];
    if (quote != '\0') {
      if (c == quote) quote = '\0';
      continue;
    }
    if (c == '\'' || c == '"' || c == '`') {
      quote = c;
    } else if (c == '[') {
      quote = ']';
    } else if (c == '(') {
      ++depth;
    } else if (c == ')' && depth > 0) {
      --depth;
    } else if ((c == ',' && depth == 0) || c == ')') {
      definitions.push_back(create_sql.substr(start, i - start));
      if (c == ')') {
        break;
      }
      start = i + 1;
    }
  }
  return definitions;
}

/// Whether the definition of `column` in `create_sql` carries AUTOINCREMENT.
/// `create_sql` and `column` are lower-cased.
bool declares_autoincrement(std::string_view create_sql, std::string_view column)
{
  for (std::string_view definition : table_definitions(create_sql)) {
    const auto first = definition.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
      continue;
    }
    definition.remove_prefix(first);

    std::string_view name;
    if (definition.front() == '"' || definition.front() == '`' || definition.front() == '[') {
      const char close = definition.front() == '[' ? ']' : definition.front();
      const auto end = definition.find(close, 1);
      if (end == std::string_view::npos) {
        continue;
      }
      name = definition.substr(1, end - 1);
    } else {
      size_t end = 0;
      while (end < definition.size() && is_word_char(definition[end])) {
        ++end;
      }
      name = definition.substr(0, end);
    }
    if (name != column) {
      continue;
    }

    constexpr std::string_view k_keyword = "autoincrement";
    for (auto at = definition.find(k_keyword, name.size()); at != std::string_view::npos;
         at = definition.find(k_keyword, at + 1)) {
      const size_t after = at + k_keyword.size();
      if (!is_word_char(definition[at - 1]) &&
          (after == definition.size() || !is_word_char(definition[after]))) {
        return true;
      }
    }
    return false;
  }
  return false;
}

int to_int(const std::optional<std::string> & text)
{
  if (!text || text->empty()) {
    return 0;
  }
  return std::stoi(*text);
}

}  // namespace

CatalogSnapshot SqliteCatalogReader::read(db::Connection & conn) const
{
  using catalog_detail::to_lower;

  CatalogSnapshot snapshot;

  const db::ResultSet tables = conn.query(k_tables_query);
  for (size_t t = 0; t < tables.size(); ++t) {
    CatalogTable table;
    table.name = tables.get_or(t, "name", "");
    const std::string create_sql = to_lower(tables.get_or(t, "sql", ""));

    // cid, name, type, notnull, dflt_value, pk (1-based position in the key)
    const db::ResultSet info = conn.query(pragma("table_info", table.name));
    std::vector<std::pair<int, std::string>> key_columns;
    for (size_t i = 0; i < info.size(); ++i) {
      CatalogColumn column;
      column.name = info.get_or(i, "name", "");
      column.native_type = to_lower(info.get_or(i, "type", ""));
      column.nullable = to_int(info.get(i, "notnull")) == 0;
      column.default_expr = info.get(i, "dflt_value");
      if (const int key_pos = to_int(info.get(i, "pk")); key_pos > 0) {
        key_columns.emplace_back(key_pos, column.name);
      }
      table.columns.push_back(std::move(column));
    }
    std::sort(key_columns.begin(), key_columns.end());
    for (auto & [pos, name] : key_columns) {
      table.primary_key.push_back(std::move(name));
    }

    // AUTOINCREMENT is only legal on a single INTEGER PRIMARY KEY column.
    if (table.primary_key.size() == 1 &&
        declares_autoincrement(create_sql, to_lower(table.primary_key.front()))) {
      if (CatalogColumn * key = table.find_column(table.primary_key.front())) {
        key->is_identity = true;
      }
    }

    // seq, name, unique, origin, partial
    const db::ResultSet indexes = conn.query(pragma("index_list", table.name));
    for (size_t i = 0; i < indexes.size(); ++i) {
      if (indexes.get_or(i, "origin", "") != "u" || to_int(indexes.get(i, "unique")) == 0) {
        continue;
      }
      // seqno, cid, name
      const db::ResultSet index_info =
        conn.query(pragma("index_info", indexes.get_or(i, "name", "")));
      std::vector<std::pair<int, std::string>> ordered;
      for (size_t c = 0; c < index_info.size(); ++c) {
        ordered.emplace_back(to_int(index_info.get(c, "seqno")), index_info.get_or(c, "name", ""));
      }
      std::sort(ordered.begin(), ordered.end());
      std::vector<std::string> unique;
      for (auto & [seq, name] : ordered) {
        unique.push_back(std::move(name));
      }
      table.unique_constraints.push_back(std::move(unique));
    }

    // id, seq, table, from, to, on_update, on_delete, match
    const db::ResultSet fks = conn.query(pragma("foreign_key_list", table.name));
    std::map<int, CatalogForeignKey> by_id;
    for (size_t i = 0; i < fks.size(); ++i) {
      CatalogForeignKey & fk = by_id[to_int(fks.get(i, "id"))];
      fk.referenced_table = fks.get_or(i, "table", "");
      fk.columns.push_back(fks.get_or(i, "from", ""));
      fk.referenced_columns.push_back(fks.get_or(i, "to", ""));
    }
    for (auto & [id, fk] : by_id) {
      table.foreign_keys.push_back(std::move(fk));
    }

    snapshot.tables.push_back(std::move(table));
  }

  spdlog::debug("read {} table(s) from sqlite catalog", snapshot.tables.size());
  return snapshot;
}

}  // namespace schema_dsl
