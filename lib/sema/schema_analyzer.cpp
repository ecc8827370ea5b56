// schema_dsl/sema/schema_analyzer.cpp
#include "schema_dsl/sema/schema_analyzer.hpp"

#include <fmt/core.h>

#include <unordered_map>

namespace schema_dsl
{

bool is_snake_case(std::string_view name) noexcept
{
  if (name.empty() || name.front() == '_' || name.back() == '_') {
    return false;
  }
  char prev = '\0';
  for (const char c : name) {
    const bool lower_or_digit = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    if (!lower_or_digit && c != '_') {
      return false;
    }
    if (c == '_' && prev == '_') {
      return false;
    }
    prev = c;
  }
  return true;
}

bool SchemaAnalyzer::analyze(const Schema & schema)
{
  const size_t before = diags_.error_count();

  check_model_names(schema);
  for (const ModelDecl * model : schema.models) {
    check_fields(*model);
    check_relations(schema, *model);
    check_composite_uniques(*model);
  }

  return diags_.error_count() == before;
}

void SchemaAnalyzer::check_model_names(const Schema & schema)
{
  std::unordered_map<std::string_view, const ModelDecl *> seen;

  for (const ModelDecl * model : schema.models) {
    if (auto [it, inserted] = seen.emplace(model->name, model); !inserted) {
      diags_
        .report_error(
          model->name_range,
          fmt::format("Duplicate model name '{}'. Model names must be unique.", model->name),
          "duplicate definition")
        .with_code("S001")
        .with_secondary_label(it->second->name_range, "first defined here");
    }

    if (!is_snake_case(model->name)) {
      diags_
        .report_error(
          model->name_range, fmt::format(
                          "Model name '{}' must be in snake_case (e.g., 'user_profile'). Do not "
                          "use capital letters or hyphens.",
                          model->name))
        .with_code("S002");
    }
  }
}

void SchemaAnalyzer::check_fields(const ModelDecl & model)
{
  std::unordered_map<std::string_view, const FieldDecl *> seen;

  for (const FieldDecl * field : model.fields) {
    if (auto [it, inserted] = seen.emplace(field->name, field); !inserted) {
      diags_
        .report_error(
          field->range,
          fmt::format(
            "Duplicate field name '{}' in model '{}'. Field names must be unique.", field->name,
            model.name),
          "duplicate field")
        .with_code("S003")
        .with_secondary_label(it->second->range, "first defined here");
    }

    if (!is_snake_case(field->name)) {
      diags_
        .report_error(
          field->range, fmt::format(
                          "Field name '{}' in model '{}' must be in snake_case (e.g., "
                          "'first_name'). Do not use capital letters or hyphens.",
                          field->name, model.name))
        .with_code("S004");
    }
  }
}

void SchemaAnalyzer::check_relations(const Schema & schema, const ModelDecl & model)
{
  for (const FieldDecl * field : model.fields) {
    if (!field->relation) {
      continue;
    }

    const ModelDecl * target = field->scalar ? nullptr : schema.find_model(field->type_name);
    if (!field->scalar && target == nullptr) {
      diags_
        .report_warning(
          field->range,
          fmt::format(
            "Relation field '{}.{}' refers to unknown model '{}'", model.name, field->name,
            field->type_name))
        .with_code("S101");
      continue;
    }

    const auto & fk = field->relation->foreign_key;
    if (!fk) {
      continue;
    }

    switch (field->relation->kind) {
      case RelationKind::ManyToOne:
      case RelationKind::OneToOne:
        if (model.find_field(*fk) == nullptr) {
          diags_
            .report_warning(
              field->range, fmt::format(
                              "Foreign key '{}' of '{}.{}' is not a field of model '{}'", *fk,
                              model.name, field->name, model.name))
            .with_code("S102");
        }
        break;
      case RelationKind::OneToMany:
        if (target != nullptr && target->find_field(*fk) == nullptr) {
          diags_
            .report_warning(
              field->range, fmt::format(
                              "Foreign key '{}' of '{}.{}' is not a field of model '{}'", *fk,
                              model.name, field->name, target->name))
            .with_code("S102");
        }
        break;
      case RelationKind::ManyToMany:
        // Names the join table, not a field.
        break;
    }
  }
}

void SchemaAnalyzer::check_composite_uniques(const ModelDecl & model)
{
  for (const CompositeUniqueDecl * unique : model.combined_uniques) {
    for (size_t i = 0; i < unique->fields.size(); ++i) {
      if (model.find_field(unique->fields[i]) == nullptr) {
        diags_
          .report_warning(
            unique->field_ranges[i], fmt::format(
                                       "@@unique refers to unknown field '{}' in model '{}'",
                                       unique->fields[i], model.name))
          .with_code("S103");
      }
    }
  }
}

}  // namespace schema_dsl
