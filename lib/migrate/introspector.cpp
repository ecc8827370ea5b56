// schema_dsl/migrate/introspector.cpp
#include "schema_dsl/migrate/introspector.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <utility>
#include <vector>

namespace schema_dsl
{

namespace
{

using catalog_detail::to_lower;

struct NativeTypeEntry
{
  std::string_view name;
  ScalarType type;
};

constexpr std::array<NativeTypeEntry, 36> k_native_types = {{
  {"int", ScalarType::Int},
  {"int2", ScalarType::Int},
  {"int4", ScalarType::Int},
  {"int8", ScalarType::Int},
  {"integer", ScalarType::Int},
  {"smallint", ScalarType::Int},
  {"mediumint", ScalarType::Int},
  {"bigint", ScalarType::Int},
  {"tinyint", ScalarType::Int},
  {"serial", ScalarType::Int},
  {"bigserial", ScalarType::Int},
  {"varchar", ScalarType::String},
  {"character varying", ScalarType::String},
  {"char", ScalarType::String},
  {"character", ScalarType::String},
  {"text", ScalarType::String},
  {"tinytext", ScalarType::String},
  {"mediumtext", ScalarType::String},
  {"longtext", ScalarType::String},
  {"uuid", ScalarType::String},
  {"bool", ScalarType::Boolean},
  {"boolean", ScalarType::Boolean},
  {"real", ScalarType::Float},
  {"float", ScalarType::Float},
  {"float4", ScalarType::Float},
  {"float8", ScalarType::Float},
  {"double", ScalarType::Float},
  {"double precision", ScalarType::Float},
  {"numeric", ScalarType::Float},
  {"decimal", ScalarType::Float},
  {"json", ScalarType::Json},
  {"jsonb", ScalarType::Json},
  {"datetime", ScalarType::DateTime},
  {"timestamptz", ScalarType::DateTime},
  {"date", ScalarType::Date},
  {"timestamp", ScalarType::DateTime},
}};

constexpr std::array<std::string_view, 9> k_now_expressions = {
  "now()",       "current_timestamp", "current_timestamp()", "datetime('now')", "localtimestamp",
  "current_date", "current_date()",   "curdate()",           "transaction_timestamp()",
};

constexpr std::array<std::string_view, 5> k_uuid_expressions = {
  "gen_random_uuid()", "uuid()", "uuid_generate_v4()", "hex(randomblob(16))",
  "lower(hex(randomblob(16)))",
};

std::string_view trim(std::string_view text)
{
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool starts_with(std::string_view text, std::string_view prefix)
{
  return text.substr(0, prefix.size()) == prefix;
}

template <size_t N>
bool contains(const std::array<std::string_view, N> & list, std::string_view value)
{
  return std::find(list.begin(), list.end(), value) != list.end();
}

/// `(expr)` -> `expr` while the outer parentheses enclose the whole text.
std::string_view strip_parentheses(std::string_view text)
{
  while (text.size() >= 2 && text.front() == '(' && text.back() == ')') {
    int depth = 0;
    bool encloses = true;
    for (size_t i = 0; i < text.size(); ++i) {
      if (text[i] == '(') ++depth;
      if (text[i] == ')') --depth;
      if (depth == 0 && i + 1 < text.size()) {
        encloses = false;
        break;
      }
    }
    if (!encloses) break;
    text = trim(text.substr(1, text.size() - 2));
  }
  return text;
}

std::optional<double> parse_number(std::string_view text)
{
  if (text.empty()) {
    return std::nullopt;
  }
  double value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

/// Content of a leading '...' literal with '' unescaped; nullopt when the
/// text is not a quoted literal optionally followed by a `::type` cast.
std::optional<std::string> quoted_content(std::string_view text)
{
  if (text.empty() || text.front() != '\'') {
    return std::nullopt;
  }
  std::string content;
  size_t i = 1;
  for (; i < text.size(); ++i) {
    if (text[i] == '\'') {
      if (i + 1 < text.size() && text[i + 1] == '\'') {
        content += '\'';
        ++i;
        continue;
      }
      break;
    }
    content += text[i];
  }
  if (i >= text.size()) {
    return std::nullopt;
  }
  const std::string_view rest = trim(text.substr(i + 1));
  if (!rest.empty() && !starts_with(rest, "::")) {
    return std::nullopt;
  }
  return content;
}

std::optional<bool> parse_bool(std::string_view lower)
{
  if (lower == "true" || lower == "t" || lower == "1" || lower == "b'1'") return true;
  if (lower == "false" || lower == "f" || lower == "0" || lower == "b'0'") return false;
  return std::nullopt;
}

bool is_text_type(ScalarType type)
{
  return type == ScalarType::String || type == ScalarType::Json || type == ScalarType::Date ||
         type == ScalarType::DateTime;
}

template <typename T>
DefaultValue literal(T value)
{
  LiteralValue lit;
  lit.value.template emplace<T>(value);
  return lit;
}

DefaultValue function(DefaultFunction f) { return FunctionCall{f}; }

// ============================================================================
// Model drafts
// ============================================================================

struct ModelDraft
{
  ModelDecl * model = nullptr;
  std::vector<FieldDecl *> fields;
  std::vector<CompositeUniqueDecl *> uniques;
  /// (column, referenced table) for single-column foreign keys.
  std::vector<std::pair<std::string_view, std::string_view>> foreign_keys;
  bool is_join_table = false;

  [[nodiscard]] FieldDecl * find_field(std::string_view name) const
  {
    const auto it = std::find_if(fields.begin(), fields.end(), [&](const FieldDecl * f) {
      return f->name == name;
    });
    return it != fields.end() ? *it : nullptr;
  }
};

FieldDecl * make_column_field(const CatalogColumn & column, const CatalogTable & table, AstContext & ast)
{
  auto * field = ast.create<FieldDecl>(ast.intern(column.name));
  const ScalarType type = map_native_type(column.is_array ? column.element_type : column.native_type);

  field->scalar = type;
  field->type_name = to_string(type);
  field->is_array = column.is_array;
  field->is_primary_key = std::find(table.primary_key.begin(), table.primary_key.end(),
                                    column.name) != table.primary_key.end();
  field->is_required = !column.nullable;

  if (column.is_identity) {
    field->default_value = function(DefaultFunction::Autoincrement);
  } else if (column.default_expr) {
    field->default_value = parse_default_expression(*column.default_expr, type, ast);
  }
  return field;
}

ModelDraft draft_model(const CatalogTable & table, AstContext & ast)
{
  ModelDraft draft;
  draft.model = ast.create<ModelDecl>(ast.intern(table.name));

  for (const CatalogColumn & column : table.columns) {
    draft.fields.push_back(make_column_field(column, table, ast));
  }

  for (const auto & unique : table.unique_constraints) {
    if (unique.size() == 1) {
      if (FieldDecl * field = draft.find_field(unique.front())) {
        field->is_unique = true;
      }
      continue;
    }
    std::vector<std::string_view> names;
    for (const std::string & name : unique) {
      names.push_back(ast.intern(name));
    }
    auto * composite = ast.create<CompositeUniqueDecl>();
    composite->fields = ast.copy_to_arena(names);
    composite->field_ranges = ast.copy_to_arena(std::vector<SourceRange>(names.size()));
    draft.uniques.push_back(composite);
  }

  std::vector<FieldDecl *> virtual_fields;
  for (const CatalogForeignKey & fk : table.foreign_keys) {
    if (fk.columns.size() != 1) {
      continue;
    }
    FieldDecl * column = draft.find_field(fk.columns.front());
    if (column == nullptr) {
      continue;
    }
    const std::string_view target = ast.intern(fk.referenced_table);
    column->relation = Relation{RelationKind::ManyToOne, column->name};
    draft.foreign_keys.emplace_back(column->name, target);

    const bool named_taken =
      draft.find_field(target) != nullptr ||
      std::any_of(virtual_fields.begin(), virtual_fields.end(), [&](const FieldDecl * f) {
        return f->name == target;
      });
    if (!named_taken) {
      auto * relation = ast.create<FieldDecl>(target);
      relation->type_name = target;
      relation->relation = Relation{RelationKind::ManyToOne, column->name};
      virtual_fields.push_back(relation);
    }
  }
  draft.fields.insert(draft.fields.end(), virtual_fields.begin(), virtual_fields.end());

  return draft;
}

bool looks_like_join_table(const ModelDraft & draft)
{
  if (draft.foreign_keys.size() != 2) {
    return false;
  }
  return std::none_of(draft.fields.begin(), draft.fields.end(), [](const FieldDecl * f) {
    return f->is_column() && !f->relation && !f->is_primary_key && f->name != "created_at" &&
           f->name != "updated_at";
  });
}

void add_many_to_many(ModelDraft & owner, const ModelDraft & other, const ModelDraft & join, AstContext & ast)
{
  const std::string name = pluralize(other.model->name);
  if (owner.find_field(name) != nullptr) {
    return;
  }
  auto * field = ast.create<FieldDecl>(ast.intern(name));
  field->type_name = other.model->name;
  field->is_array = true;
  field->relation = Relation{RelationKind::ManyToMany, join.model->name};
  owner.fields.push_back(field);
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

ScalarType map_native_type(std::string_view native_type)
{
  const std::string type = to_lower(trim(native_type));
  if (type == "tinyint(1)" || type == "bit(1)") {
    return ScalarType::Boolean;
  }

  std::string_view base = type;
  base = trim(base.substr(0, base.find('(')));
  for (const auto & entry : k_native_types) {
    if (entry.name == base) {
      return entry.type;
    }
  }
  // timestamp(3) with time zone, timestamp without time zone, ...
  if (starts_with(base, "timestamp")) {
    return ScalarType::DateTime;
  }
  return ScalarType::String;
}

std::optional<DefaultValue> parse_default_expression(
  std::string_view expr, ScalarType type, AstContext & ast)
{
  const std::string_view text = strip_parentheses(trim(expr));
  const std::string lower = to_lower(text);

  if (lower.empty() || lower == "null" || starts_with(lower, "null::")) {
    return std::nullopt;
  }
  if (starts_with(lower, "nextval(")) {
    return function(DefaultFunction::Autoincrement);
  }
  if (contains(k_now_expressions, lower) || starts_with(lower, "now()") ||
      starts_with(lower, "current_timestamp(")) {
    return function(DefaultFunction::Now);
  }
  if (contains(k_uuid_expressions, lower)) {
    return function(DefaultFunction::Uuid);
  }
  if (lower == "true" || lower == "false") {
    return literal(lower == "true");
  }

  if (auto content = quoted_content(text)) {
    if (type == ScalarType::Int || type == ScalarType::Float) {
      if (auto number = parse_number(*content)) {
        return literal(*number);
      }
    }
    if (type == ScalarType::Boolean) {
      if (auto value = parse_bool(to_lower(*content))) {
        return literal(*value);
      }
    }
    return literal(ast.intern(*content));
  }

  if (type == ScalarType::Boolean) {
    if (auto value = parse_bool(lower)) {
      return literal(*value);
    }
  }
  // MySQL reports text defaults without quotes.
  if (is_text_type(type)) {
    return literal(ast.intern(text));
  }
  if (auto number = parse_number(text)) {
    return literal(*number);
  }
  return literal(ast.intern(text));
}

std::string pluralize(std::string_view word)
{
  const std::string lower = to_lower(word);
  if (!lower.empty() && lower.back() == 'y') {
    return lower.substr(0, lower.size() - 1) + "ies";
  }
  if (!lower.empty() && lower.back() == 's') {
    return lower;
  }
  return lower + "s";
}

Schema * build_schema(const CatalogSnapshot & snapshot, AstContext & ast)
{
  std::vector<const CatalogTable *> tables;
  tables.reserve(snapshot.tables.size());
  for (const CatalogTable & table : snapshot.tables) {
    tables.push_back(&table);
  }
  std::sort(tables.begin(), tables.end(), [](const CatalogTable * a, const CatalogTable * b) {
    return a->name < b->name;
  });

  std::vector<ModelDraft> drafts;
  drafts.reserve(tables.size());
  for (const CatalogTable * table : tables) {
    drafts.push_back(draft_model(*table, ast));
  }

  const auto find_draft = [&](std::string_view name) -> ModelDraft * {
    const auto it = std::find_if(drafts.begin(), drafts.end(), [&](const ModelDraft & d) {
      return d.model->name == name;
    });
    return it != drafts.end() ? &*it : nullptr;
  };

  for (ModelDraft & join : drafts) {
    if (!looks_like_join_table(join)) {
      continue;
    }
    ModelDraft * a = find_draft(join.foreign_keys[0].second);
    ModelDraft * b = find_draft(join.foreign_keys[1].second);
    if (a == nullptr || b == nullptr || a == &join || b == &join) {
      continue;
    }
    add_many_to_many(*a, *b, join, ast);
    if (a != b) {
      add_many_to_many(*b, *a, join, ast);
    }
    join.is_join_table = true;
    spdlog::debug(
      "folded join table '{}' into {} <-> {}", join.model->name, a->model->name, b->model->name);
  }

  std::vector<ModelDecl *> models;
  for (ModelDraft & draft : drafts) {
    if (draft.is_join_table) {
      continue;
    }
    draft.model->fields = ast.copy_to_arena(draft.fields);
    draft.model->combined_uniques = ast.copy_to_arena(draft.uniques);
    models.push_back(draft.model);
  }

  auto * schema = ast.create<Schema>();
  schema->models = ast.copy_to_arena(models);
  return schema;
}

Schema * Introspector::introspect(AstContext & ast)
{
  const auto reader = make_catalog_reader(conn_.dialect());
  if (!reader) {
    throw db::DatabaseError(
      fmt::format("cannot introspect a {} connection", to_string(conn_.dialect())));
  }

  const CatalogSnapshot snapshot = reader->read(conn_);
  Schema * schema = build_schema(snapshot, ast);
  spdlog::info(
    "introspected {} model(s) from {} database", schema->models.size(),
    to_string(conn_.dialect()));
  return schema;
}

}  // namespace schema_dsl
