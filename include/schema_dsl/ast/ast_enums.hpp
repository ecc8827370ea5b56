// schema_dsl/ast/ast_enums.hpp - Enumerations shared by the AST and its consumers
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace schema_dsl
{

// ============================================================================
// NodeKind
// ============================================================================

enum class NodeKind : uint8_t {
#define SCHEMA_AST_NODE(Class, Kind, Snake) Kind,
#include "schema_dsl/ast/ast_nodes.def"
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define SCHEMA_AST_NODE(Class, Kind, Snake) \
  case NodeKind::Kind:                      \
    return #Snake;
#include "schema_dsl/ast/ast_nodes.def"
  }
  return "unknown";
}

// ============================================================================
// ScalarType - primitive field types
// ============================================================================

enum class ScalarType : uint8_t {
  Int,
  String,
  Float,
  Boolean,
  Json,
  DateTime,
  Date,
};

inline constexpr size_t k_scalar_type_count = 7;

[[nodiscard]] constexpr std::string_view to_string(ScalarType t) noexcept
{
  switch (t) {
    case ScalarType::Int:
      return "int";
    case ScalarType::String:
      return "string";
    case ScalarType::Float:
      return "float";
    case ScalarType::Boolean:
      return "boolean";
    case ScalarType::Json:
      return "json";
    case ScalarType::DateTime:
      return "datetime";
    case ScalarType::Date:
      return "date";
  }
  return "string";
}

[[nodiscard]] std::optional<ScalarType> parse_scalar_type(std::string_view name) noexcept;

// ============================================================================
// RelationKind
// ============================================================================

enum class RelationKind : uint8_t {
  OneToMany,
  ManyToOne,
  OneToOne,
  ManyToMany,
};

[[nodiscard]] constexpr std::string_view to_string(RelationKind k) noexcept
{
  switch (k) {
    case RelationKind::OneToMany:
      return "one_to_many";
    case RelationKind::ManyToOne:
      return "many_to_one";
    case RelationKind::OneToOne:
      return "one_to_one";
    case RelationKind::ManyToMany:
      return "many_to_many";
  }
  return "many_to_one";
}

[[nodiscard]] std::optional<RelationKind> parse_relation_kind(std::string_view name) noexcept;

// ============================================================================
// DefaultFunction - zero-argument generators usable in @default(...)
// ============================================================================

enum class DefaultFunction : uint8_t {
  Autoincrement,
  Uuid,
  Now,
};

inline constexpr size_t k_default_function_count = 3;

[[nodiscard]] constexpr std::string_view to_string(DefaultFunction f) noexcept
{
  switch (f) {
    case DefaultFunction::Autoincrement:
      return "autoincrement";
    case DefaultFunction::Uuid:
      return "uuid";
    case DefaultFunction::Now:
      return "now";
  }
  return "now";
}

[[nodiscard]] std::optional<DefaultFunction> parse_default_function(
  std::string_view name) noexcept;

}  // namespace schema_dsl
