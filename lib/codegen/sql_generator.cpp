// schema_dsl/codegen/sql_generator.cpp - DDL generation and schema diffing
#include "schema_dsl/codegen/sql_generator.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace schema_dsl
{

namespace
{

std::string quote_string(std::string_view text)
{
  std::string out;
  out.reserve(text.size() + 2);
  out += '\'';
  for (const char c : text) {
    if (c == '\'') {
      out += '\'';
    }
    out += c;
  }
  out += '\'';
  return out;
}

std::string render_literal(const LiteralValue & literal)
{
  return std::visit(
    [](const auto & v) -> std::string {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, double>) {
        if (std::trunc(v) == v && std::fabs(v) < 1e15) {
          return fmt::format("{}", static_cast<int64_t>(v));
        }
        return fmt::format("{}", v);
      } else if constexpr (std::is_same_v<T, bool>) {
        return v ? "true" : "false";
      } else {
        return quote_string(v);
      }
    },
    literal.value);
}

bool literal_matches(const LiteralValue & literal, const FieldDecl & field)
{
  const ScalarType type = *field.scalar;
  return std::visit(
    [&](const auto & v) -> bool {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, double>) {
        if (field.is_array) return false;
        return type == ScalarType::Float || (type == ScalarType::Int && std::trunc(v) == v);
      } else if constexpr (std::is_same_v<T, bool>) {
        return !field.is_array && type == ScalarType::Boolean;
      } else {
        // Arrays and json columns take their default as serialized text.
        return field.is_array || type == ScalarType::String || type == ScalarType::Json ||
               type == ScalarType::Date || type == ScalarType::DateTime;
      }
    },
    literal.value);
}

bool is_autoincrement(const FieldDecl & field)
{
  return field.default_value && is_function(*field.default_value, DefaultFunction::Autoincrement);
}

/// Fields that force the referenced table to be created first.
bool is_dependency_edge(const FieldDecl & field)
{
  if (field.scalar || !field.relation) {
    return false;
  }
  return field.relation->kind == RelationKind::ManyToOne ||
         (field.relation->kind == RelationKind::OneToOne && field.relation->foreign_key);
}

bool has_many_to_many(const ModelDecl & model, std::string_view target)
{
  return std::any_of(model.fields.begin(), model.fields.end(), [&](const FieldDecl * f) {
    return f->has_relation(RelationKind::ManyToMany) && f->type_name == target;
  });
}

std::string cycle_message(const std::vector<const ModelDecl *> & cycle)
{
  std::string msg = "Foreign key cycle between models: ";
  for (const ModelDecl * m : cycle) {
    msg += std::string(m->name);
    msg += " -> ";
  }
  msg += std::string(cycle.front()->name);
  return msg;
}

}  // namespace

// ============================================================================
// MigrationPlan
// ============================================================================

std::string MigrationPlan::render() const
{
  if (statements.empty()) {
    return std::string(k_no_changes);
  }
  std::string out = "BEGIN;\n";
  for (size_t i = 0; i < statements.size(); ++i) {
    if (i > 0) out += '\n';
    out += statements[i];
  }
  out += "\nCOMMIT;";
  return out;
}

// ============================================================================
// Column rendering
// ============================================================================

std::string SqlGenerator::storage_type(const FieldDecl & field) const
{
  const ScalarType type = field.scalar.value_or(ScalarType::String);
  std::string base(sql_type(type, dialect_));
  if (!field.is_array || type == ScalarType::Json) {
    return base;
  }
  if (dialect_ == Dialect::Postgres) {
    return base + "[]";
  }
  return std::string(sql_type(ScalarType::Json, dialect_));
}

std::optional<std::string> SqlGenerator::default_sql(const FieldDecl & field) const
{
  if (!field.default_value) {
    return std::nullopt;
  }
  return std::visit(
    [&](const auto & v) -> std::optional<std::string> {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, FunctionCall>) {
        if (v.function == DefaultFunction::Autoincrement) {
          return std::nullopt;
        }
        if (auto sql = default_function_sql(v.function, dialect_)) {
          return std::string(*sql);
        }
        return std::nullopt;
      } else {
        return render_literal(v);
      }
    },
    *field.default_value);
}

std::string SqlGenerator::column_definition(const FieldDecl & field) const
{
  return column_definition(field, true);
}

std::string SqlGenerator::column_definition(const FieldDecl & field, bool inline_key) const
{
  const bool autoincrement = is_autoincrement(field);

  if (inline_key && field.is_primary_key && autoincrement && dialect_ == Dialect::Postgres) {
    return fmt::format("{} SERIAL PRIMARY KEY", field.name);
  }

  std::string def = fmt::format("{} {}", field.name, storage_type(field));

  if (inline_key && field.is_primary_key) {
    def += " PRIMARY KEY";
  }
  if (autoincrement) {
    if (dialect_ == Dialect::MySql) {
      def += " AUTO_INCREMENT";
    } else if (dialect_ == Dialect::Sqlite && inline_key) {
      def += " AUTOINCREMENT";
    }
  }
  if (inline_key && field.is_unique) {
    def += " UNIQUE";
  }
  if (auto value = default_sql(field)) {
    def += " DEFAULT ";
    def += *value;
  }
  if (field.is_not_null()) {
    def += " NOT NULL";
  }
  return def;
}

std::string SqlGenerator::create_table(const ModelDecl & model) const
{
  std::vector<std::string> lines;

  for (const FieldDecl * field : model.fields) {
    if (field->is_column()) {
      lines.push_back(column_definition(*field));
    }
  }

  for (const CompositeUniqueDecl * unique : model.combined_uniques) {
    lines.push_back(fmt::format("UNIQUE ({})", fmt::join(unique->fields, ", ")));
  }

  for (const FieldDecl * field : model.fields) {
    if (!is_dependency_edge(*field) || !field->relation->foreign_key) {
      continue;
    }
    const std::string_view fk = *field->relation->foreign_key;
    const FieldDecl * fk_column = model.find_field(fk);
    const ModelDecl * target = current_.find_model(field->type_name);
    if (fk_column == nullptr || !fk_column->is_column() || target == nullptr) {
      continue;
    }
    const FieldDecl * target_pk = target->primary_key();
    lines.push_back(fmt::format(
      "FOREIGN KEY ({}) REFERENCES {}({})", fk, target->name,
      target_pk ? target_pk->name : std::string_view("id")));
  }

  return fmt::format("CREATE TABLE {} (\n  {}\n);", model.name, fmt::join(lines, ",\n  "));
}

// ============================================================================
// Ordering
// ============================================================================

std::vector<const ModelDecl *> SqlGenerator::creation_order(
  gsl::span<const ModelDecl * const> models, bool report_cycles)
{
  std::unordered_map<std::string_view, const ModelDecl *> by_name;
  for (const ModelDecl * m : models) {
    by_name.emplace(m->name, m);
  }

  std::unordered_map<const ModelDecl *, std::vector<const ModelDecl *>> deps;
  for (const ModelDecl * m : models) {
    auto & out = deps[m];
    for (const FieldDecl * field : m->fields) {
      if (!is_dependency_edge(*field)) {
        continue;
      }
      auto it = by_name.find(field->type_name);
      if (it != by_name.end() && it->second != m) {
        out.push_back(it->second);
      }
    }
  }

  std::vector<const ModelDecl *> pending(models.begin(), models.end());
  std::vector<const ModelDecl *> order;
  std::unordered_set<const ModelDecl *> emitted;
  order.reserve(pending.size());

  const auto is_ready = [&](const ModelDecl * m) {
    const auto & d = deps[m];
    return std::all_of(
      d.begin(), d.end(), [&](const ModelDecl * dep) { return emitted.count(dep) != 0; });
  };
  const auto first_pending_dep = [&](const ModelDecl * m) -> const ModelDecl * {
    for (const ModelDecl * dep : deps[m]) {
      if (emitted.count(dep) == 0) return dep;
    }
    return nullptr;
  };

  while (!pending.empty()) {
    auto next = std::find_if(pending.begin(), pending.end(), is_ready);

    if (next == pending.end()) {
      // Every pending model waits on another one: walk unmet dependencies
      // until a model repeats, then break the cycle at its earliest member.
      std::vector<const ModelDecl *> path;
      const ModelDecl * cur = pending.front();
      while (std::find(path.begin(), path.end(), cur) == path.end()) {
        path.push_back(cur);
        cur = first_pending_dep(cur);
      }
      const std::vector<const ModelDecl *> cycle(
        std::find(path.begin(), path.end(), cur), path.end());

      next = std::find_if(pending.begin(), pending.end(), [&](const ModelDecl * m) {
        return std::find(cycle.begin(), cycle.end(), m) != cycle.end();
      });

      if (report_cycles) {
        diags_.report_warning((*next)->name_range, cycle_message(cycle), "cycle starts here")
          .with_code("G101")
          .with_help("tables in the cycle are created in declaration order");
      }
    }

    order.push_back(*next);
    emitted.insert(*next);
    pending.erase(next);
  }

  return order;
}

// ============================================================================
// Validation
// ============================================================================

bool SqlGenerator::validate()
{
  const size_t before = diags_.error_count();
  for (const ModelDecl * model : current_.models) {
    for (const FieldDecl * field : model->fields) {
      if (field->is_column() && field->default_value) {
        validate_default(*model, *field);
      }
    }
  }
  return diags_.error_count() == before;
}

void SqlGenerator::validate_default(const ModelDecl & model, const FieldDecl & field)
{
  const ScalarType type = *field.scalar;

  const auto mismatch = [&](std::string_view what) {
    diags_
      .report_error(
        field.range, fmt::format(
                       "Default {} of '{}.{}' does not match column type '{}'", what, model.name,
                       field.name, to_string(type)))
      .with_code("G001");
  };

  std::visit(
    [&](const auto & v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, FunctionCall>) {
        switch (v.function) {
          case DefaultFunction::Autoincrement:
            if (type != ScalarType::Int || field.is_array || !field.is_primary_key) {
              diags_
                .report_error(
                  field.range, fmt::format(
                                 "autoincrement() on '{}.{}' requires an int primary key",
                                 model.name, field.name))
                .with_code("G002");
            }
            return;
          case DefaultFunction::Uuid:
            if (type != ScalarType::String) {
              mismatch("uuid()");
              return;
            }
            break;
          case DefaultFunction::Now:
            if (type != ScalarType::DateTime && type != ScalarType::Date) {
              mismatch("now()");
              return;
            }
            break;
        }
        if (!default_function_sql(v.function, dialect_)) {
          diags_
            .report_error(
              field.range, fmt::format(
                             "Default {}() of '{}.{}' has no {} translation", to_string(v.function),
                             model.name, field.name, to_string(dialect_)))
            .with_code("G003")
            .with_help("choose a concrete dialect or drop the default");
        }
      } else {
        if (!literal_matches(v, field)) {
          mismatch("value");
        }
      }
    },
    *field.default_value);
}

// ============================================================================
// Join tables
// ============================================================================

std::vector<SqlGenerator::JoinTable> SqlGenerator::join_tables() const
{
  std::vector<JoinTable> joins;
  std::map<std::pair<std::string_view, std::string_view>, size_t> index;

  for (const ModelDecl * model : current_.models) {
    for (const FieldDecl * field : model->fields) {
      if (!field->has_relation(RelationKind::ManyToMany)) {
        continue;
      }
      const ModelDecl * a = model;
      const ModelDecl * b = current_.find_model(field->type_name);
      if (b == nullptr) {
        continue;
      }
      if (b->name < a->name) {
        std::swap(a, b);
      }

      const auto & explicit_name = field->relation->foreign_key;
      auto [it, inserted] = index.emplace(std::make_pair(a->name, b->name), joins.size());
      if (inserted) {
        JoinTable join;
        join.a = a;
        join.b = b;
        join.name = explicit_name ? std::string(*explicit_name)
                                  : fmt::format("_{}_{}", a->name, b->name);
        join.declared_by = field;
        joins.push_back(std::move(join));
      } else if (explicit_name && !joins[it->second].declared_by->relation->foreign_key) {
        joins[it->second].name = std::string(*explicit_name);
        joins[it->second].declared_by = field;
      }
    }
  }
  return joins;
}

std::optional<std::string> SqlGenerator::create_join_table(const JoinTable & join)
{
  const FieldDecl * pk_a = join.a->primary_key();
  const FieldDecl * pk_b = join.b->primary_key();
  if (pk_a == nullptr || pk_b == nullptr) {
    const ModelDecl * missing = pk_a ? join.b : join.a;
    diags_
      .report_error(
        join.declared_by->range,
        fmt::format(
          "Model '{}' has no primary key for join table '{}' to reference", missing->name,
          join.name))
      .with_code("G004");
    return std::nullopt;
  }

  const std::string col_a = fmt::format("A_{}", pk_a->name);
  const std::string col_b = fmt::format("B_{}", pk_b->name);
  return fmt::format(
    "CREATE TABLE {} (\n"
    "  {} {} NOT NULL REFERENCES {}({}) ON DELETE CASCADE,\n"
    "  {} {} NOT NULL REFERENCES {}({}) ON DELETE CASCADE,\n"
    "  UNIQUE ({}, {})\n"
    ");",
    join.name, col_a, storage_type(*pk_a), join.a->name, pk_a->name, col_b, storage_type(*pk_b),
    join.b->name, pk_b->name, col_a, col_b);
}

// ============================================================================
// Generation
// ============================================================================

std::optional<MigrationPlan> SqlGenerator::generate(const Schema * previous)
{
  if (!validate()) {
    return std::nullopt;
  }

  const size_t before = diags_.error_count();
  MigrationPlan plan;
  if (previous == nullptr || previous->empty()) {
    generate_fresh(plan);
  } else {
    generate_diff(*previous, plan);
  }
  if (diags_.error_count() != before) {
    return std::nullopt;
  }

  spdlog::debug(
    "generated {} {} statement(s) ({})", plan.statements.size(), to_string(dialect_),
    previous && !previous->empty() ? "diff" : "fresh");
  return plan;
}

void SqlGenerator::generate_fresh(MigrationPlan & plan)
{
  const std::vector<const ModelDecl *> models(current_.models.begin(), current_.models.end());
  for (const ModelDecl * model : creation_order(models)) {
    plan.statements.push_back(create_table(*model));
  }
  for (const JoinTable & join : join_tables()) {
    if (auto sql = create_join_table(join)) {
      plan.statements.push_back(std::move(*sql));
    }
  }
}

void SqlGenerator::generate_diff(const Schema & previous, MigrationPlan & plan)
{
  std::vector<const ModelDecl *> added;
  for (const ModelDecl * model : current_.models) {
    if (previous.find_model(model->name) == nullptr) {
      added.push_back(model);
    }
  }
  for (const ModelDecl * model : creation_order(added)) {
    plan.statements.push_back(create_table(*model));
  }

  const std::vector<JoinTable> joins = join_tables();
  for (const JoinTable & join : joins) {
    const bool a_new = previous.find_model(join.a->name) == nullptr;
    const bool b_new = previous.find_model(join.b->name) == nullptr;
    if (a_new && b_new) {
      if (auto sql = create_join_table(join)) {
        plan.statements.push_back(std::move(*sql));
      }
      continue;
    }

    const ModelDecl * prev_a = previous.find_model(join.a->name);
    const ModelDecl * prev_b = previous.find_model(join.b->name);
    const bool known = previous.find_model(join.name) != nullptr ||
                       (prev_a && has_many_to_many(*prev_a, join.b->name)) ||
                       (prev_b && has_many_to_many(*prev_b, join.a->name));
    if (!known) {
      diags_
        .report_warning(
          join.declared_by->range,
          fmt::format(
            "Join table '{}' between '{}' and '{}' is not migrated automatically", join.name,
            join.a->name, join.b->name))
        .with_code("G102")
        .with_help("create the join table manually");
    }
  }

  for (const ModelDecl * model : current_.models) {
    if (const ModelDecl * prev = previous.find_model(model->name)) {
      diff_model(*prev, *model, plan);
    }
  }

  std::vector<const ModelDecl *> removed;
  for (const ModelDecl * prev : previous.models) {
    const bool is_join = std::any_of(
      joins.begin(), joins.end(), [&](const JoinTable & j) { return j.name == prev->name; });
    if (!is_join && current_.find_model(prev->name) == nullptr) {
      removed.push_back(prev);
    }
  }
  // Referencing tables go first.
  const std::vector<const ModelDecl *> drop_order = creation_order(removed, false);
  for (auto it = drop_order.rbegin(); it != drop_order.rend(); ++it) {
    plan.statements.push_back(fmt::format("DROP TABLE {};", (*it)->name));
  }
}

void SqlGenerator::diff_model(
  const ModelDecl & prev, const ModelDecl & curr, MigrationPlan & plan) const
{
  for (const FieldDecl * field : curr.fields) {
    if (!field->is_column()) {
      continue;
    }
    const FieldDecl * old = prev.find_field(field->name);
    if (old == nullptr || !old->is_column()) {
      plan.statements.push_back(
        fmt::format("ALTER TABLE {} ADD COLUMN {};", curr.name, column_definition(*field)));
    } else {
      diff_column(curr, *old, *field, plan);
    }
  }

  for (const FieldDecl * old : prev.fields) {
    if (!old->is_column()) {
      continue;
    }
    const FieldDecl * field = curr.find_field(old->name);
    if (field == nullptr || !field->is_column()) {
      plan.statements.push_back(fmt::format("ALTER TABLE {} DROP COLUMN {};", curr.name, old->name));
    }
  }
}

void SqlGenerator::diff_column(
  const ModelDecl & model, const FieldDecl & prev, const FieldDecl & curr,
  MigrationPlan & plan) const
{
  const std::string_view table = model.name;
  const std::string_view column = curr.name;
  auto & out = plan.statements;

  const bool prev_not_null = prev.is_not_null();
  const bool curr_not_null = curr.is_not_null();
  const std::optional<std::string> prev_default = default_sql(prev);
  const std::optional<std::string> curr_default = default_sql(curr);
  const std::string prev_type = storage_type(prev);
  const std::string curr_type = storage_type(curr);

  const bool nullability_changed = prev_not_null != curr_not_null;
  const bool key_weakened = nullability_changed && !curr_not_null && prev.is_primary_key;
  const bool default_changed = prev_default != curr_default;
  const bool type_changed = prev_type != curr_type;
  const bool unique_added = curr.is_unique && !prev.is_unique;
  const bool unique_removed = prev.is_unique && !curr.is_unique;

  const auto skipped_key_warning = [&]() {
    return fmt::format(
      "-- WARNING: Attempt to DROP NOT NULL on primary key column {} skipped.", column);
  };

  switch (dialect_) {
    case Dialect::Sqlite:
      if (nullability_changed || default_changed || type_changed || unique_added) {
        out.push_back(fmt::format(
          "-- WARNING: SQLite cannot alter column {}.{} in place. Rebuild the table with: {}",
          table, column, column_definition(curr)));
      }
      break;

    case Dialect::MySql: {
      bool modified = false;
      if (key_weakened) {
        out.push_back(skipped_key_warning());
      } else if (nullability_changed || type_changed) {
        out.push_back(fmt::format(
          "ALTER TABLE {} MODIFY COLUMN {};", table, column_definition(curr, false)));
        modified = true;
      }
      if (default_changed && !modified) {
        out.push_back(
          curr_default
            ? fmt::format("ALTER TABLE {} ALTER COLUMN {} SET DEFAULT {};", table, column, *curr_default)
            : fmt::format("ALTER TABLE {} ALTER COLUMN {} DROP DEFAULT;", table, column));
      }
      if (unique_added) {
        out.push_back(fmt::format("ALTER TABLE {} ADD UNIQUE ({});", table, column));
      }
      break;
    }

    case Dialect::Postgres:
    case Dialect::Generic:
      if (nullability_changed) {
        if (curr_not_null) {
          out.push_back(fmt::format("ALTER TABLE {} ALTER COLUMN {} SET NOT NULL;", table, column));
        } else if (key_weakened) {
          out.push_back(skipped_key_warning());
        } else {
          out.push_back(fmt::format("ALTER TABLE {} ALTER COLUMN {} DROP NOT NULL;", table, column));
        }
      }
      if (default_changed) {
        out.push_back(
          curr_default
            ? fmt::format("ALTER TABLE {} ALTER COLUMN {} SET DEFAULT {};", table, column, *curr_default)
            : fmt::format("ALTER TABLE {} ALTER COLUMN {} DROP DEFAULT;", table, column));
      }
      if (type_changed) {
        const bool cast_json = dialect_ == Dialect::Postgres && curr.scalar == ScalarType::Json;
        out.push_back(
          cast_json ? fmt::format(
                        "ALTER TABLE {} ALTER COLUMN {} TYPE {} USING {}::{};", table, column,
                        curr_type, column, curr_type)
                    : fmt::format("ALTER TABLE {} ALTER COLUMN {} TYPE {};", table, column, curr_type));
      }
      if (unique_added) {
        out.push_back(fmt::format("ALTER TABLE {} ADD UNIQUE ({});", table, column));
      }
      break;
  }

  if (unique_removed) {
    out.push_back(fmt::format(
      "-- WARNING: UNIQUE constraint removal for {} not automated. Please drop constraint "
      "manually if needed.",
      column));
  }
}

}  // namespace schema_dsl
