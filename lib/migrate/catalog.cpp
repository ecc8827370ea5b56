// schema_dsl/migrate/catalog.cpp
#include "schema_dsl/migrate/catalog.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace schema_dsl
{

CatalogColumn * CatalogTable::find_column(std::string_view column_name)
{
  const auto it = std::find_if(columns.begin(), columns.end(), [&](const CatalogColumn & c) {
    return c.name == column_name;
  });
  return it != columns.end() ? &*it : nullptr;
}

const CatalogColumn * CatalogTable::find_column(std::string_view column_name) const
{
  const auto it = std::find_if(columns.begin(), columns.end(), [&](const CatalogColumn & c) {
    return c.name == column_name;
  });
  return it != columns.end() ? &*it : nullptr;
}

CatalogTable & CatalogSnapshot::table(std::string_view table_name)
{
  const auto it = std::find_if(tables.begin(), tables.end(), [&](const CatalogTable & t) {
    return t.name == table_name;
  });
  if (it != tables.end()) {
    return *it;
  }
  CatalogTable & added = tables.emplace_back();
  added.name = std::string(table_name);
  return added;
}

const CatalogTable * CatalogSnapshot::find_table(std::string_view table_name) const
{
  const auto it = std::find_if(tables.begin(), tables.end(), [&](const CatalogTable & t) {
    return t.name == table_name;
  });
  return it != tables.end() ? &*it : nullptr;
}

std::unique_ptr<CatalogReader> make_catalog_reader(Dialect dialect)
{
  switch (dialect) {
    case Dialect::Postgres:
      return std::make_unique<PostgresCatalogReader>();
    case Dialect::MySql:
      return std::make_unique<MySqlCatalogReader>();
    case Dialect::Sqlite:
      return std::make_unique<SqliteCatalogReader>();
    case Dialect::Generic:
      break;
  }
  return nullptr;
}

namespace catalog_detail
{

std::string to_lower(std::string_view text)
{
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string unquote_identifier(std::string_view text)
{
  const auto first = text.find_first_not_of(" \t");
  const auto last = text.find_last_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  text = text.substr(first, last - first + 1);
  if (text.size() >= 2 && (text.front() == '"' || text.front() == '`') &&
      text.back() == text.front()) {
    text = text.substr(1, text.size() - 2);
  }
  return std::string(text);
}

std::vector<std::string> parenthesized_columns(std::string_view definition)
{
  std::vector<std::string> columns;
  const auto open = definition.find('(');
  if (open == std::string_view::npos) {
    return columns;
  }
  const auto close = definition.find(')', open);
  if (close == std::string_view::npos) {
    return columns;
  }

  std::string_view list = definition.substr(open + 1, close - open - 1);
  while (!list.empty()) {
    const auto comma = list.find(',');
    std::string name = unquote_identifier(list.substr(0, comma));
    if (!name.empty()) {
      columns.push_back(std::move(name));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    list.remove_prefix(comma + 1);
  }
  return columns;
}

std::optional<CatalogForeignKey> parse_foreign_key_definition(std::string_view definition)
{
  constexpr std::string_view k_references = "REFERENCES";
  const auto ref = definition.find(k_references);
  if (ref == std::string_view::npos) {
    return std::nullopt;
  }

  CatalogForeignKey fk;
  fk.columns = parenthesized_columns(definition.substr(0, ref));

  std::string_view target = definition.substr(ref + k_references.size());
  const auto open = target.find('(');
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  fk.referenced_table = unquote_identifier(target.substr(0, open));
  // Schema-qualified names keep only the table part.
  if (const auto dot = fk.referenced_table.rfind('.'); dot != std::string::npos) {
    fk.referenced_table = unquote_identifier(fk.referenced_table.substr(dot + 1));
  }
  fk.referenced_columns = parenthesized_columns(target);

  if (fk.columns.empty() || fk.referenced_table.empty()) {
    return std::nullopt;
  }
  return fk;
}

}  // namespace catalog_detail

}  // namespace schema_dsl
