// test_sql_generator.cpp - DDL generation and schema diffing
//
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>

#include "schema_dsl/codegen/sql_generator.hpp"
#include "schema_dsl/test_support/parse_helpers.hpp"

using schema_dsl::Dialect;
using schema_dsl::DiagnosticBag;
using schema_dsl::MigrationPlan;
using schema_dsl::ParsedUnit;
using schema_dsl::SqlGenerator;
using schema_dsl::test_support::count_code;

namespace
{

std::unique_ptr<ParsedUnit> load(const char * src)
{
  auto unit = schema_dsl::test_support::analyze(src);
  EXPECT_FALSE(unit->diags.has_errors()) << src;
  return unit;
}

struct Generated
{
  DiagnosticBag diags;
  std::optional<MigrationPlan> plan;
};

Generated generate(const ParsedUnit & current, Dialect d, const ParsedUnit * previous = nullptr)
{
  Generated out;
  SqlGenerator gen(*current.schema, d, out.diags);
  out.plan = gen.generate(previous ? previous->schema : nullptr);
  return out;
}

size_t count_prefix(const MigrationPlan & plan, const std::string & prefix)
{
  return static_cast<size_t>(
    std::count_if(plan.statements.begin(), plan.statements.end(), [&](const std::string & s) {
      return s.rfind(prefix, 0) == 0;
    }));
}

const char * k_shop = R"(
model order {
  id int @primary_key @default(autoincrement())
  total float @required
  customer_id int @required
  customer customer @many_to_one(customer_id)
}

model customer {
  id int @primary_key @default(autoincrement())
  email string @unique @required
  orders order @one_to_many(customer_id)
}
)";

}  // namespace

// ============================================================================
// Fresh generation
// ============================================================================

TEST(SqlGenerator, CreatesReferencedTableFirst)
{
  const auto shop = load(k_shop);
  const auto out = generate(*shop, Dialect::Postgres);

  ASSERT_TRUE(out.plan.has_value());
  ASSERT_EQ(out.plan->statements.size(), 2u);
  EXPECT_EQ(
    out.plan->statements[0],
    "CREATE TABLE customer (\n"
    "  id SERIAL PRIMARY KEY,\n"
    "  email VARCHAR(255) UNIQUE NOT NULL\n"
    ");");
  EXPECT_EQ(
    out.plan->statements[1],
    "CREATE TABLE order (\n"
    "  id SERIAL PRIMARY KEY,\n"
    "  total REAL NOT NULL,\n"
    "  customer_id INTEGER NOT NULL,\n"
    "  FOREIGN KEY (customer_id) REFERENCES customer(id)\n"
    ");");
  EXPECT_TRUE(out.diags.empty());
}

TEST(SqlGenerator, RenderWrapsStatementsInTransaction)
{
  const auto unit = load("model tag {\n  id int @primary_key\n}\n");
  const auto out = generate(*unit, Dialect::Postgres);

  ASSERT_TRUE(out.plan.has_value());
  EXPECT_EQ(
    out.plan->render(),
    "BEGIN;\n"
    "CREATE TABLE tag (\n"
    "  id INTEGER PRIMARY KEY NOT NULL\n"
    ");\n"
    "COMMIT;");
}

TEST(SqlGenerator, IdentitySyntaxPerDialect)
{
  const auto unit = load("model item {\n  id int @primary_key @default(autoincrement())\n}\n");
  DiagnosticBag diags;
  const auto * id = unit->schema->models[0]->fields[0];

  EXPECT_EQ(SqlGenerator(*unit->schema, Dialect::Postgres, diags).column_definition(*id),
            "id SERIAL PRIMARY KEY");
  EXPECT_EQ(SqlGenerator(*unit->schema, Dialect::MySql, diags).column_definition(*id),
            "id INT PRIMARY KEY AUTO_INCREMENT NOT NULL");
  EXPECT_EQ(SqlGenerator(*unit->schema, Dialect::Sqlite, diags).column_definition(*id),
            "id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL");
}

TEST(SqlGenerator, NowDefaultPerDialect)
{
  const auto unit = load("model event {\n  created_at datetime @default(now())\n}\n");
  DiagnosticBag diags;
  const auto * field = unit->schema->models[0]->fields[0];

  const auto def = [&](Dialect d) {
    return SqlGenerator(*unit->schema, d, diags).column_definition(*field);
  };
  EXPECT_EQ(def(Dialect::Postgres), "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP");
  EXPECT_EQ(def(Dialect::MySql), "created_at DATETIME DEFAULT NOW()");
  EXPECT_EQ(def(Dialect::Sqlite), "created_at DATETIME DEFAULT (DATETIME('now'))");
  EXPECT_EQ(def(Dialect::Generic), "created_at DATETIME DEFAULT CURRENT_TIMESTAMP");
}

TEST(SqlGenerator, LiteralDefaults)
{
  const auto unit = load(R"(
model post {
  views int @default(0)
  ratio float @default(0.25)
  draft boolean @default(true)
  title string @default("it's")
}
)");
  DiagnosticBag diags;
  SqlGenerator gen(*unit->schema, Dialect::Postgres, diags);
  const auto & fields = unit->schema->models[0]->fields;

  EXPECT_EQ(gen.default_sql(*fields[0]), "0");
  EXPECT_EQ(gen.default_sql(*fields[1]), "0.25");
  EXPECT_EQ(gen.default_sql(*fields[2]), "true");
  EXPECT_EQ(gen.default_sql(*fields[3]), "'it''s'");
}

TEST(SqlGenerator, ArrayStoragePerDialect)
{
  const auto unit = load("model post {\n  tags string[]\n}\n");
  DiagnosticBag diags;
  const auto * tags = unit->schema->models[0]->fields[0];

  EXPECT_EQ(SqlGenerator(*unit->schema, Dialect::Postgres, diags).storage_type(*tags),
            "VARCHAR(255)[]");
  EXPECT_EQ(SqlGenerator(*unit->schema, Dialect::MySql, diags).storage_type(*tags), "JSON");
  EXPECT_EQ(SqlGenerator(*unit->schema, Dialect::Sqlite, diags).storage_type(*tags), "TEXT");
}

TEST(SqlGenerator, CompositeUniqueConstraint)
{
  const auto unit = load(R"(
model membership {
  team_id int @required
  user_id int @required
  @@unique([team_id, user_id])
}
)");
  DiagnosticBag diags;
  SqlGenerator gen(*unit->schema, Dialect::Sqlite, diags);

  EXPECT_EQ(
    gen.create_table(*unit->schema->models[0]),
    "CREATE TABLE membership (\n"
    "  team_id INTEGER NOT NULL,\n"
    "  user_id INTEGER NOT NULL,\n"
    "  UNIQUE (team_id, user_id)\n"
    ");");
}

TEST(SqlGenerator, ManyToManyCreatesOneJoinTable)
{
  const auto unit = load(R"(
model post {
  id int @primary_key
  tags tag[] @many_to_many
}
model tag {
  id int @primary_key
  posts post[] @many_to_many
}
)");
  const auto out = generate(*unit, Dialect::Postgres);

  ASSERT_TRUE(out.plan.has_value());
  ASSERT_EQ(out.plan->statements.size(), 3u);
  EXPECT_EQ(count_prefix(*out.plan, "CREATE TABLE _post_tag"), 1u);
  EXPECT_EQ(
    out.plan->statements[2],
    "CREATE TABLE _post_tag (\n"
    "  A_id INTEGER NOT NULL REFERENCES post(id) ON DELETE CASCADE,\n"
    "  B_id INTEGER NOT NULL REFERENCES tag(id) ON DELETE CASCADE,\n"
    "  UNIQUE (A_id, B_id)\n"
    ");");
}

TEST(SqlGenerator, ManyToManyExplicitJoinTableName)
{
  const auto unit = load(R"(
model tag {
  id int @primary_key
}
model post {
  id int @primary_key
  tags tag[] @many_to_many(post_tags)
}
)");
  const auto out = generate(*unit, Dialect::Sqlite);

  ASSERT_TRUE(out.plan.has_value());
  EXPECT_EQ(count_prefix(*out.plan, "CREATE TABLE post_tags"), 1u);
  // Participants are ordered by name: post is A, tag is B.
  EXPECT_NE(out.plan->statements.back().find("A_id INTEGER NOT NULL REFERENCES post(id)"),
            std::string::npos);
}

TEST(SqlGenerator, ForeignKeyCycleWarnsAndKeepsDeclarationOrder)
{
  const auto unit = load(R"(
model a {
  id int @primary_key
  b_id int
  b b @many_to_one(b_id)
}
model b {
  id int @primary_key
  a_id int
  a a @many_to_one(a_id)
}
)");
  const auto out = generate(*unit, Dialect::Postgres);

  ASSERT_TRUE(out.plan.has_value());
  const auto cycles = out.diags.with_code("G101");
  ASSERT_EQ(cycles.size(), 1u);
  EXPECT_EQ(cycles[0].message, "Foreign key cycle between models: a -> b -> a");
  EXPECT_EQ(out.plan->statements[0].rfind("CREATE TABLE a ", 0), 0u);
}

// ============================================================================
// Validation errors
// ============================================================================

TEST(SqlGenerator, DefaultTypeMismatchIsAnError)
{
  const auto unit = load("model a {\n  age int @default('old')\n}\n");
  const auto out = generate(*unit, Dialect::Postgres);

  EXPECT_FALSE(out.plan.has_value());
  EXPECT_EQ(count_code(out.diags, "G001"), 1u);
}

TEST(SqlGenerator, AutoincrementRequiresIntPrimaryKey)
{
  const auto unit = load("model a {\n  code string @default(autoincrement())\n}\n");
  const auto out = generate(*unit, Dialect::MySql);

  EXPECT_FALSE(out.plan.has_value());
  EXPECT_EQ(count_code(out.diags, "G002"), 1u);
}

TEST(SqlGenerator, UuidHasNoGenericTranslation)
{
  const auto unit = load("model a {\n  token string @default(uuid())\n}\n");

  const auto generic = generate(*unit, Dialect::Generic);
  EXPECT_FALSE(generic.plan.has_value());
  EXPECT_EQ(count_code(generic.diags, "G003"), 1u);

  const auto postgres = generate(*unit, Dialect::Postgres);
  ASSERT_TRUE(postgres.plan.has_value());
  EXPECT_NE(postgres.plan->statements[0].find("DEFAULT gen_random_uuid()"), std::string::npos);
}

TEST(SqlGenerator, ManyToManyNeedsPrimaryKeys)
{
  const auto unit = load(R"(
model post {
  id int @primary_key
  tags tag[] @many_to_many
}
model tag {
  label string
}
)");
  const auto out = generate(*unit, Dialect::Postgres);

  EXPECT_FALSE(out.plan.has_value());
  EXPECT_EQ(count_code(out.diags, "G004"), 1u);
}

// ============================================================================
// Diffing
// ============================================================================

TEST(SqlGenerator, IdenticalSchemasProduceNoChanges)
{
  const auto a = load(k_shop);
  const auto b = load(k_shop);
  const auto out = generate(*a, Dialect::Postgres, b.get());

  ASSERT_TRUE(out.plan.has_value());
  EXPECT_TRUE(out.plan->empty());
  EXPECT_EQ(out.plan->render(), "-- No changes detected.");
}

TEST(SqlGenerator, EmptyPreviousSchemaGeneratesEverything)
{
  const auto current = load(k_shop);
  const auto previous = schema_dsl::test_support::parse("// nothing yet\n");
  const auto out = generate(*current, Dialect::Postgres, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  EXPECT_EQ(count_prefix(*out.plan, "CREATE TABLE"), 2u);
}

TEST(SqlGenerator, AddedRequiredColumn)
{
  const auto previous = load("model user {\n  id int @primary_key\n}\n");
  const auto current = load("model user {\n  id int @primary_key\n  name string @required\n}\n");
  const auto out = generate(*current, Dialect::Postgres, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  ASSERT_EQ(out.plan->statements.size(), 1u);
  EXPECT_EQ(out.plan->statements[0], "ALTER TABLE user ADD COLUMN name VARCHAR(255) NOT NULL;");
}

TEST(SqlGenerator, DroppedColumnAndTable)
{
  const auto previous = load(R"(
model user {
  id int @primary_key
  legacy_flag boolean
}
model audit_log {
  id int @primary_key
}
)");
  const auto current = load("model user {\n  id int @primary_key\n}\n");
  const auto out = generate(*current, Dialect::Postgres, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  ASSERT_EQ(out.plan->statements.size(), 2u);
  EXPECT_EQ(out.plan->statements[0], "ALTER TABLE user DROP COLUMN legacy_flag;");
  EXPECT_EQ(out.plan->statements[1], "DROP TABLE audit_log;");
}

TEST(SqlGenerator, DropsReferencingTablesFirst)
{
  const auto previous = load(k_shop);
  const auto current = load("model product {\n  id int @primary_key\n}\n");
  const auto out = generate(*current, Dialect::Postgres, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  ASSERT_EQ(out.plan->statements.size(), 3u);
  EXPECT_EQ(out.plan->statements[0].rfind("CREATE TABLE product", 0), 0u);
  EXPECT_EQ(out.plan->statements[1], "DROP TABLE order;");
  EXPECT_EQ(out.plan->statements[2], "DROP TABLE customer;");
}

TEST(SqlGenerator, AlterColumnPostgres)
{
  const auto previous = load(R"(
model user {
  id int @primary_key
  name string
  score int
  status string @default('new')
  email string @unique
}
)");
  const auto current = load(R"(
model user {
  id int @primary_key
  name string @required
  score float
  status string
  email string
}
)");
  const auto out = generate(*current, Dialect::Postgres, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  const auto & s = out.plan->statements;
  ASSERT_EQ(s.size(), 4u);
  EXPECT_EQ(s[0], "ALTER TABLE user ALTER COLUMN name SET NOT NULL;");
  EXPECT_EQ(s[1], "ALTER TABLE user ALTER COLUMN score TYPE REAL;");
  EXPECT_EQ(s[2], "ALTER TABLE user ALTER COLUMN status DROP DEFAULT;");
  EXPECT_EQ(
    s[3],
    "-- WARNING: UNIQUE constraint removal for email not automated. Please drop constraint "
    "manually if needed.");
}

TEST(SqlGenerator, PrimaryKeyNullabilityIsNeverDropped)
{
  const auto previous = load("model user {\n  id int @primary_key\n}\n");
  const auto current = load("model user {\n  id int\n}\n");
  const auto out = generate(*current, Dialect::Postgres, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  ASSERT_EQ(out.plan->statements.size(), 1u);
  EXPECT_EQ(
    out.plan->statements[0],
    "-- WARNING: Attempt to DROP NOT NULL on primary key column id skipped.");
}

TEST(SqlGenerator, AlterColumnMySqlUsesModify)
{
  const auto previous = load("model user {\n  name string\n}\n");
  const auto current = load("model user {\n  name string @required @unique\n}\n");
  const auto out = generate(*current, Dialect::MySql, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  ASSERT_EQ(out.plan->statements.size(), 2u);
  EXPECT_EQ(out.plan->statements[0], "ALTER TABLE user MODIFY COLUMN name VARCHAR(255) NOT NULL;");
  EXPECT_EQ(out.plan->statements[1], "ALTER TABLE user ADD UNIQUE (name);");
}

TEST(SqlGenerator, AlterColumnSqliteEmitsRebuildWarning)
{
  const auto previous = load("model user {\n  name string\n}\n");
  const auto current = load("model user {\n  name string @required\n}\n");
  const auto out = generate(*current, Dialect::Sqlite, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  ASSERT_EQ(out.plan->statements.size(), 1u);
  EXPECT_EQ(
    out.plan->statements[0],
    "-- WARNING: SQLite cannot alter column user.name in place. Rebuild the table with: "
    "name TEXT NOT NULL");
}

TEST(SqlGenerator, ManyToManyOnExistingModelsWarns)
{
  const auto previous = load(R"(
model post {
  id int @primary_key
}
model tag {
  id int @primary_key
}
)");
  const auto current = load(R"(
model post {
  id int @primary_key
  tags tag[] @many_to_many
}
model tag {
  id int @primary_key
}
)");
  const auto out = generate(*current, Dialect::Postgres, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  EXPECT_TRUE(out.plan->empty());
  EXPECT_EQ(count_code(out.diags, "G102"), 1u);
}

TEST(SqlGenerator, ManyToManyBetweenNewModelsIsCreated)
{
  const auto previous = load("model user {\n  id int @primary_key\n}\n");
  const auto current = load(R"(
model user {
  id int @primary_key
}
model post {
  id int @primary_key
  tags tag[] @many_to_many
}
model tag {
  id int @primary_key
}
)");
  const auto out = generate(*current, Dialect::Postgres, previous.get());

  ASSERT_TRUE(out.plan.has_value());
  EXPECT_EQ(count_prefix(*out.plan, "CREATE TABLE"), 3u);
  EXPECT_EQ(count_prefix(*out.plan, "CREATE TABLE _post_tag"), 1u);
  EXPECT_TRUE(out.diags.empty());
}
