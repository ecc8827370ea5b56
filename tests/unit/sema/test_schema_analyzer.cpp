// test_schema_analyzer.cpp - Naming, uniqueness and reference checks
//
#include <gtest/gtest.h>

#include "schema_dsl/basic/source_file.hpp"
#include "schema_dsl/sema/schema_analyzer.hpp"
#include "schema_dsl/test_support/parse_helpers.hpp"

using schema_dsl::is_snake_case;
using schema_dsl::LineColumn;
using schema_dsl::test_support::analyze;
using schema_dsl::test_support::count_code;

TEST(SchemaAnalyzer, SnakeCasePredicate)
{
  EXPECT_TRUE(is_snake_case("user"));
  EXPECT_TRUE(is_snake_case("order_item"));
  EXPECT_TRUE(is_snake_case("address2"));
  EXPECT_TRUE(is_snake_case("2fa_code"));

  EXPECT_FALSE(is_snake_case(""));
  EXPECT_FALSE(is_snake_case("User"));
  EXPECT_FALSE(is_snake_case("order-item"));
  EXPECT_FALSE(is_snake_case("_private"));
  EXPECT_FALSE(is_snake_case("trailing_"));
  EXPECT_FALSE(is_snake_case("double__underscore"));
}

TEST(SchemaAnalyzer, AcceptsValidSchema)
{
  const auto unit = analyze(R"(
model customer {
  id int @primary_key
  orders order @one_to_many(customer_id)
}
model order {
  id int @primary_key
  customer_id int
  customer customer @many_to_one(customer_id)
}
)");

  EXPECT_TRUE(unit->diags.empty());
}

TEST(SchemaAnalyzer, DuplicateModelReportedOnceAtSecondDeclaration)
{
  const auto unit = analyze("model user {\n}\nmodel user {\n}\nmodel post {\n}\n");

  const auto dups = unit->diags.with_code("S001");
  ASSERT_EQ(dups.size(), 1u);
  const LineColumn where = unit->source.line_column(dups[0].primary_range().begin());
  EXPECT_EQ(where.line, 3u);
  EXPECT_EQ(where.column, 7u);
  EXPECT_TRUE(unit->diags.has_errors());
}

TEST(SchemaAnalyzer, TriplicateModelReportsEachRepeat)
{
  const auto unit = analyze("model a {\n}\nmodel a {\n}\nmodel a {\n}\n");

  EXPECT_EQ(count_code(unit->diags, "S001"), 2u);
}

TEST(SchemaAnalyzer, UppercaseModelNameIsRejected)
{
  const auto unit = analyze("model BlogPost {\n  id int\n}\n");

  EXPECT_EQ(count_code(unit->diags, "S002"), 1u);
}

TEST(SchemaAnalyzer, FieldNamingAndDuplicates)
{
  const auto unit = analyze(R"(
model user {
  id int
  firstName string
  id string
}
)");

  EXPECT_EQ(count_code(unit->diags, "S004"), 1u);
  EXPECT_EQ(count_code(unit->diags, "S003"), 1u);
}

TEST(SchemaAnalyzer, ReportsEveryProblem)
{
  const auto unit = analyze(R"(
model Bad {
  Name string
  Other int
}
)");

  EXPECT_EQ(count_code(unit->diags, "S002"), 1u);
  EXPECT_EQ(count_code(unit->diags, "S004"), 2u);
}

TEST(SchemaAnalyzer, UnknownRelationTargetWarns)
{
  const auto unit = analyze(R"(
model post {
  id int @primary_key
  owner account @many_to_one(owner_id)
  owner_id int
}
)");

  EXPECT_FALSE(unit->diags.has_errors());
  EXPECT_EQ(count_code(unit->diags, "S101"), 1u);
}

TEST(SchemaAnalyzer, MissingForeignKeyFieldWarns)
{
  const auto unit = analyze(R"(
model customer {
  id int @primary_key
  orders order @one_to_many(buyer_id)
}
model order {
  id int @primary_key
  customer customer @many_to_one(customer_id)
}
)");

  EXPECT_FALSE(unit->diags.has_errors());
  EXPECT_EQ(count_code(unit->diags, "S102"), 2u);
}

TEST(SchemaAnalyzer, ManyToManyForeignKeyNamesJoinTable)
{
  const auto unit = analyze(R"(
model post {
  id int @primary_key
  tags tag[] @many_to_many(post_tags)
}
model tag {
  id int @primary_key
}
)");

  EXPECT_TRUE(unit->diags.empty());
}

TEST(SchemaAnalyzer, CompositeUniqueUnknownFieldWarns)
{
  const auto unit = analyze(R"(
model member {
  team_id int
  user_id int
  @@unique([team_id, person_id])
}
)");

  EXPECT_FALSE(unit->diags.has_errors());
  EXPECT_EQ(count_code(unit->diags, "S103"), 1u);
}
