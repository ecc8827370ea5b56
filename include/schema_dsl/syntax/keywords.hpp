#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace schema_dsl::syntax
{

inline constexpr std::string_view k_model_keyword = "model";

inline constexpr std::array<std::string_view, 7> k_primitive_types = {
  "int", "string", "float", "boolean", "json", "datetime", "date",
};

// Only @@unique produces a constraint; @@index and @@id are recognized so the
// parser can report them precisely.
inline constexpr std::array<std::string_view, 3> k_composite_attributes = {
  "unique",
  "index",
  "id",
};

[[nodiscard]] constexpr bool is_primitive_type(std::string_view s) noexcept
{
  return std::find(k_primitive_types.begin(), k_primitive_types.end(), s) !=
         k_primitive_types.end();
}

[[nodiscard]] constexpr bool is_composite_attribute(std::string_view s) noexcept
{
  return std::find(k_composite_attributes.begin(), k_composite_attributes.end(), s) !=
         k_composite_attributes.end();
}

}  // namespace schema_dsl::syntax
