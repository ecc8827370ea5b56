// schema_dsl/ast/ast.cpp - Lookup helpers and enum parsing
#include "schema_dsl/ast/ast.hpp"

#include <algorithm>

namespace schema_dsl
{

std::optional<ScalarType> parse_scalar_type(std::string_view name) noexcept
{
  if (name == "int") return ScalarType::Int;
  if (name == "string") return ScalarType::String;
  if (name == "float") return ScalarType::Float;
  if (name == "boolean") return ScalarType::Boolean;
  if (name == "json") return ScalarType::Json;
  if (name == "datetime") return ScalarType::DateTime;
  if (name == "date") return ScalarType::Date;
  return std::nullopt;
}

std::optional<RelationKind> parse_relation_kind(std::string_view name) noexcept
{
  if (name == "one_to_many") return RelationKind::OneToMany;
  if (name == "many_to_one") return RelationKind::ManyToOne;
  if (name == "one_to_one") return RelationKind::OneToOne;
  if (name == "many_to_many") return RelationKind::ManyToMany;
  return std::nullopt;
}

std::optional<DefaultFunction> parse_default_function(std::string_view name) noexcept
{
  if (name == "autoincrement") return DefaultFunction::Autoincrement;
  if (name == "uuid") return DefaultFunction::Uuid;
  if (name == "now") return DefaultFunction::Now;
  return std::nullopt;
}

const FieldDecl * ModelDecl::find_field(std::string_view field_name) const noexcept
{
  const auto it = std::find_if(fields.begin(), fields.end(), [&](const FieldDecl * f) {
    return f->name == field_name;
  });
  return it != fields.end() ? *it : nullptr;
}

const FieldDecl * ModelDecl::primary_key() const noexcept
{
  const auto it =
    std::find_if(fields.begin(), fields.end(), [](const FieldDecl * f) { return f->is_primary_key; });
  return it != fields.end() ? *it : nullptr;
}

const ModelDecl * Schema::find_model(std::string_view model_name) const noexcept
{
  const auto it = std::find_if(models.begin(), models.end(), [&](const ModelDecl * m) {
    return m->name == model_name;
  });
  return it != models.end() ? *it : nullptr;
}

}  // namespace schema_dsl
