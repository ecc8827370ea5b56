// schema_dsl/db/connection.cpp
#include "schema_dsl/db/connection.hpp"

#include <algorithm>
#include <utility>

namespace schema_dsl::db
{

std::optional<size_t> ResultSet::column_index(std::string_view name) const noexcept
{
  const auto it = std::find(columns.begin(), columns.end(), name);
  if (it == columns.end()) {
    return std::nullopt;
  }
  return static_cast<size_t>(it - columns.begin());
}

std::optional<std::string> ResultSet::get(size_t row, std::string_view column) const
{
  const auto idx = column_index(column);
  if (!idx || row >= rows.size() || *idx >= rows[row].size()) {
    return std::nullopt;
  }
  return rows[row][*idx];
}

std::string ResultSet::get_or(size_t row, std::string_view column, std::string fallback) const
{
  auto value = get(row, column);
  return value ? std::move(*value) : std::move(fallback);
}

}  // namespace schema_dsl::db
