// test_parser.cpp - Schema parser: declarations, decorators and recovery
//
#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "schema_dsl/ast/ast.hpp"
#include "schema_dsl/test_support/parse_helpers.hpp"

using schema_dsl::DefaultFunction;
using schema_dsl::FunctionCall;
using schema_dsl::LiteralValue;
using schema_dsl::RelationKind;
using schema_dsl::ScalarType;
using schema_dsl::test_support::count_code;
using schema_dsl::test_support::parse;

namespace
{

const char * k_blog_schema = R"(
// Blog
model author {
  id int @primary_key @default(autoincrement())
  email string @unique @required
  posts post @one_to_many(author_id)
}

model post {
  id int @primary_key @default(autoincrement())
  title string @required
  views int @default(0)
  rating float @default(4.5)
  published boolean @default(false)
  status string @default('draft')
  tags string[]
  created_at datetime @default(now())
  author_id int
  author author @many_to_one(author_id)
  @@unique([title, author_id])
}
)";

}  // namespace

TEST(SyntaxParser, ParsesOneModelPerBlock)
{
  const auto unit = parse(k_blog_schema);

  EXPECT_FALSE(unit->diags.has_errors());
  ASSERT_NE(unit->schema, nullptr);
  ASSERT_EQ(unit->schema->models.size(), 2u);
  EXPECT_EQ(unit->schema->models[0]->name, "author");
  EXPECT_EQ(unit->schema->models[1]->name, "post");
  EXPECT_EQ(unit->schema->models[1]->fields.size(), 10u);
}

TEST(SyntaxParser, ReadsFieldAttributes)
{
  const auto unit = parse(k_blog_schema);
  const auto * author = unit->schema->find_model("author");
  ASSERT_NE(author, nullptr);

  const auto * id = author->find_field("id");
  ASSERT_NE(id, nullptr);
  EXPECT_EQ(id->scalar, ScalarType::Int);
  EXPECT_TRUE(id->is_primary_key);
  ASSERT_TRUE(id->default_value.has_value());
  EXPECT_TRUE(schema_dsl::is_function(*id->default_value, DefaultFunction::Autoincrement));

  const auto * email = author->find_field("email");
  ASSERT_NE(email, nullptr);
  EXPECT_TRUE(email->is_unique);
  EXPECT_TRUE(email->is_required);
  EXPECT_FALSE(email->is_primary_key);

  EXPECT_EQ(author->primary_key(), id);
}

TEST(SyntaxParser, ReadsLiteralDefaults)
{
  const auto unit = parse(k_blog_schema);
  const auto * post = unit->schema->find_model("post");
  ASSERT_NE(post, nullptr);

  const auto literal_of = [&](const char * name) {
    const auto * field = post->find_field(name);
    EXPECT_NE(field, nullptr);
    EXPECT_TRUE(field->default_value.has_value());
    return std::get<LiteralValue>(*field->default_value).value;
  };

  EXPECT_DOUBLE_EQ(std::get<double>(literal_of("views")), 0.0);
  EXPECT_DOUBLE_EQ(std::get<double>(literal_of("rating")), 4.5);
  EXPECT_EQ(std::get<bool>(literal_of("published")), false);
  EXPECT_EQ(std::get<std::string_view>(literal_of("status")), "draft");

  const auto * created = post->find_field("created_at");
  ASSERT_NE(created, nullptr);
  EXPECT_EQ(std::get<FunctionCall>(*created->default_value).function, DefaultFunction::Now);
}

TEST(SyntaxParser, ReadsRelationsAndArrays)
{
  const auto unit = parse(k_blog_schema);
  const auto * author = unit->schema->find_model("author");
  const auto * post = unit->schema->find_model("post");

  const auto * posts = author->find_field("posts");
  ASSERT_NE(posts, nullptr);
  EXPECT_FALSE(posts->is_column());
  EXPECT_EQ(posts->type_name, "post");
  ASSERT_TRUE(posts->relation.has_value());
  EXPECT_EQ(posts->relation->kind, RelationKind::OneToMany);
  EXPECT_EQ(posts->relation->foreign_key, "author_id");

  const auto * owner = post->find_field("author");
  ASSERT_NE(owner, nullptr);
  EXPECT_TRUE(owner->has_relation(RelationKind::ManyToOne));

  const auto * tags = post->find_field("tags");
  ASSERT_NE(tags, nullptr);
  EXPECT_TRUE(tags->is_array);
  EXPECT_EQ(tags->scalar, ScalarType::String);
}

TEST(SyntaxParser, ReadsCompositeUnique)
{
  const auto unit = parse(k_blog_schema);
  const auto * post = unit->schema->find_model("post");

  ASSERT_EQ(post->combined_uniques.size(), 1u);
  const auto * unique = post->combined_uniques[0];
  ASSERT_EQ(unique->fields.size(), 2u);
  EXPECT_EQ(unique->fields[0], "title");
  EXPECT_EQ(unique->fields[1], "author_id");
}

TEST(SyntaxParser, ReadsNestedJsonShape)
{
  const auto unit = parse(R"(
model product {
  id int @primary_key
  specs json { weight: number, dims?: { w: number, h: number }, colors: string[] }
  variants json[] { sku: string }
}
)");

  ASSERT_FALSE(unit->diags.has_errors());
  const auto * product = unit->schema->find_model("product");
  ASSERT_NE(product, nullptr);

  const auto * specs = product->find_field("specs");
  ASSERT_NE(specs, nullptr);
  EXPECT_EQ(specs->scalar, ScalarType::Json);
  ASSERT_NE(specs->json_shape, nullptr);
  EXPECT_FALSE(specs->json_shape->is_array);
  ASSERT_EQ(specs->json_shape->members.size(), 3u);

  const auto * dims = specs->json_shape->members[1];
  EXPECT_EQ(dims->name, "dims");
  EXPECT_TRUE(dims->is_optional);
  ASSERT_NE(dims->nested, nullptr);
  EXPECT_EQ(dims->nested->members.size(), 2u);

  const auto * colors = specs->json_shape->members[2];
  EXPECT_EQ(colors->type_name, "string");
  EXPECT_TRUE(colors->is_array);

  const auto * variants = product->find_field("variants");
  ASSERT_NE(variants, nullptr);
  ASSERT_NE(variants->json_shape, nullptr);
  EXPECT_TRUE(variants->json_shape->is_array);
}

TEST(SyntaxParser, NullUnionMarksJsonMemberOptional)
{
  const auto unit = parse(R"(
model note {
  id int @primary_key
  meta json { note: string | null, tags: string[] | null, size: number }
}

model tag {
  id int @primary_key
}
)");

  EXPECT_TRUE(unit->diags.empty());
  ASSERT_EQ(unit->schema->models.size(), 2u);

  const auto * meta = unit->schema->find_model("note")->find_field("meta");
  ASSERT_NE(meta, nullptr);
  ASSERT_NE(meta->json_shape, nullptr);
  ASSERT_EQ(meta->json_shape->members.size(), 3u);

  const auto * note = meta->json_shape->members[0];
  EXPECT_EQ(note->type_name, "string");
  EXPECT_TRUE(note->is_optional);

  const auto * tags = meta->json_shape->members[1];
  EXPECT_TRUE(tags->is_array);
  EXPECT_TRUE(tags->is_optional);

  EXPECT_FALSE(meta->json_shape->members[2]->is_optional);
}

TEST(SyntaxParser, UnrecognizedJsonShapeKeepsModel)
{
  const auto unit = parse(R"(
model player {
  id int @primary_key
  stats json { scores: Record<string, number> }
  name string
}
)");

  EXPECT_FALSE(unit->diags.has_errors());
  EXPECT_EQ(unit->diags.warning_count(), 1u);
  EXPECT_EQ(count_code(unit->diags, "P101"), 1u);

  const auto * player = unit->schema->find_model("player");
  ASSERT_NE(player, nullptr);
  EXPECT_EQ(player->fields.size(), 3u);

  const auto * stats = player->find_field("stats");
  ASSERT_NE(stats, nullptr);
  ASSERT_NE(stats->json_shape, nullptr);
  EXPECT_TRUE(stats->json_shape->members.empty());
  EXPECT_EQ(stats->json_shape->raw, "{ scores: Record<string, number> }");
}

TEST(SyntaxParser, NonNullUnionIsNotAMemberType)
{
  const auto unit = parse("model a {\n  meta json { v: string | number }\n}\n");

  EXPECT_FALSE(unit->diags.has_errors());
  EXPECT_EQ(count_code(unit->diags, "P101"), 1u);
  const auto * meta = unit->schema->find_model("a")->find_field("meta");
  ASSERT_NE(meta->json_shape, nullptr);
  EXPECT_TRUE(meta->json_shape->members.empty());
}

TEST(SyntaxParser, RecordsDeclarationPositions)
{
  const auto unit = parse("model a {\n  id int\n}\n\nmodel b {\n}\n");

  ASSERT_EQ(unit->schema->models.size(), 2u);
  EXPECT_EQ(unit->schema->models[0]->loc.line, 1u);
  EXPECT_EQ(unit->schema->models[0]->loc.column, 7u);
  EXPECT_EQ(unit->schema->models[0]->fields[0]->loc.line, 2u);
  EXPECT_EQ(unit->schema->models[1]->loc.line, 5u);
}

TEST(SyntaxParser, UnknownDecoratorIsAnError)
{
  const auto unit = parse("model a {\n  id int @index\n}\n");

  EXPECT_TRUE(unit->diags.has_errors());
  EXPECT_EQ(count_code(unit->diags, "P004"), 1u);
}

TEST(SyntaxParser, InvalidDefaultValueIsAnError)
{
  const auto unit = parse("model a {\n  id int @default(random())\n}\n");

  EXPECT_EQ(count_code(unit->diags, "P005"), 1u);
}

TEST(SyntaxParser, RecoversAtNextModel)
{
  const auto unit = parse(R"(
model broken {
  id int @default(
}

model ok {
  id int @primary_key
}
)");

  EXPECT_TRUE(unit->diags.has_errors());
  ASSERT_NE(unit->schema, nullptr);
  EXPECT_NE(unit->schema->find_model("ok"), nullptr);
}

TEST(SyntaxParser, TopLevelGarbageIsReported)
{
  const auto unit = parse("field x int\nmodel a {\n}\n");

  EXPECT_GE(count_code(unit->diags, "P002"), 1u);
  EXPECT_NE(unit->schema->find_model("a"), nullptr);
}

TEST(SyntaxParser, MissingJsonShapeIsAnError)
{
  const auto unit = parse("model a {\n  meta json\n}\n");

  EXPECT_TRUE(unit->diags.has_errors());
}

TEST(SyntaxParser, LexerWarningsDoNotBlockParsing)
{
  const auto unit = parse("model a {\n  id int #\n  name string\n}\n");

  EXPECT_FALSE(unit->diags.has_errors());
  EXPECT_EQ(count_code(unit->diags, "L001"), 1u);
  ASSERT_EQ(unit->schema->models.size(), 1u);
  EXPECT_EQ(unit->schema->models[0]->fields.size(), 2u);
}
