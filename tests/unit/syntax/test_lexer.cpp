#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/basic/source_file.hpp"
#include "schema_dsl/syntax/lexer.hpp"
#include "schema_dsl/syntax/token.hpp"

using schema_dsl::DiagnosticBag;
using schema_dsl::LineColumn;
using schema_dsl::Severity;
using schema_dsl::SourceFile;
using schema_dsl::syntax::Lexer;
using schema_dsl::syntax::Token;
using schema_dsl::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds_of(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  out.reserve(toks.size());
  for (const auto & t : toks) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, TokenizesModelWithDecorators)
{
  DiagnosticBag diags;
  Lexer lex("model user { id int @primary_key }", diags);
  const auto toks = lex.lex_all();

  const std::vector<TokenKind> expected = {
    TokenKind::KwModel,       TokenKind::Identifier, TokenKind::LBrace,
    TokenKind::Identifier,    TokenKind::PrimitiveType, TokenKind::At,
    TokenKind::Identifier,    TokenKind::RBrace,     TokenKind::Eof,
  };
  EXPECT_EQ(kinds_of(toks), expected);
  EXPECT_EQ(toks[1].text, "user");
  EXPECT_EQ(toks[4].text, "int");
  EXPECT_TRUE(diags.empty());
}

TEST(SyntaxLexer, SkipsLineAndBlockComments)
{
  DiagnosticBag diags;
  Lexer lex(
    "// header\n"
    "model /* inline */ post {\n"
    "}\n",
    diags);
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 5u);
  EXPECT_EQ(toks[0].kind, TokenKind::KwModel);
  EXPECT_EQ(toks[1].text, "post");
  EXPECT_TRUE(diags.empty());
}

TEST(SyntaxLexer, TracksLineAndColumn)
{
  DiagnosticBag diags;
  Lexer lex("model a {\n  title string\n}", diags);
  const auto toks = lex.lex_all();

  ASSERT_GE(toks.size(), 5u);
  EXPECT_EQ(toks[0].loc, (LineColumn{1, 1}));
  EXPECT_EQ(toks[3].text, "title");
  EXPECT_EQ(toks[3].loc, (LineColumn{2, 3}));
  EXPECT_EQ(toks[4].loc, (LineColumn{2, 9}));
}

TEST(SyntaxLexer, StringLiteralTextExcludesQuotes)
{
  DiagnosticBag diags;
  Lexer lex("'draft' \"it\\'s\"", diags);
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 3u);
  EXPECT_EQ(toks[0].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[0].text, "draft");
  EXPECT_EQ(toks[0].range.size(), 7u);
  EXPECT_EQ(toks[1].text, "it\\'s");
}

TEST(SyntaxLexer, NumbersIncludeSignAndFraction)
{
  DiagnosticBag diags;
  Lexer lex("42 -7 3.25", diags);
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[0].text, "42");
  EXPECT_EQ(toks[1].text, "-7");
  EXPECT_EQ(toks[2].text, "3.25");
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(toks[i].kind, TokenKind::NumberLiteral);
  }
}

TEST(SyntaxLexer, CapturesJsonBlockAfterJsonType)
{
  DiagnosticBag diags;
  Lexer lex("meta json { tags: string[], dims: { w: number } } next", diags);
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 5u);
  EXPECT_EQ(toks[1].kind, TokenKind::PrimitiveType);
  EXPECT_EQ(toks[2].kind, TokenKind::JsonBlock);
  EXPECT_EQ(toks[2].text, "{ tags: string[], dims: { w: number } }");
  EXPECT_EQ(toks[3].text, "next");
}

TEST(SyntaxLexer, CapturesJsonBlockAfterJsonArray)
{
  DiagnosticBag diags;
  Lexer lex("items json[] { sku: string }", diags);
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 6u);
  EXPECT_EQ(toks[2].kind, TokenKind::LBracket);
  EXPECT_EQ(toks[3].kind, TokenKind::RBracket);
  EXPECT_EQ(toks[4].kind, TokenKind::JsonBlock);
}

TEST(SyntaxLexer, CompositeAttributeDropsPrefix)
{
  DiagnosticBag diags;
  Lexer lex("@@unique([a, b])", diags);
  const auto toks = lex.lex_all();

  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks[0].kind, TokenKind::CompositeAttr);
  EXPECT_EQ(toks[0].text, "unique");
}

TEST(SyntaxLexer, UnexpectedCharacterWarnsWithPosition)
{
  const std::string text = "model a {\n  id int #\n}";
  SourceFile source(text);
  DiagnosticBag diags;
  Lexer lex(source.content(), diags);
  const auto toks = lex.lex_all();

  // The '#' is dropped from the stream.
  for (const auto & t : toks) {
    EXPECT_NE(t.kind, TokenKind::Unknown);
  }

  ASSERT_EQ(diags.size(), 1u);
  const auto & d = diags.all().front();
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "L001");
  EXPECT_EQ(source.line_column(d.primary_range().begin()), (LineColumn{2, 10}));
  EXPECT_FALSE(diags.has_errors());
}

TEST(SyntaxLexer, UnterminatedStringWarns)
{
  DiagnosticBag diags;
  Lexer lex("name string @default('oops\n", diags);
  (void)lex.lex_all();

  ASSERT_EQ(diags.with_code("L002").size(), 1u);
}

TEST(SyntaxLexer, MalformedNumberWarns)
{
  DiagnosticBag diags;
  Lexer lex("@default(1.)", diags);
  const auto toks = lex.lex_all();

  EXPECT_EQ(diags.with_code("L003").size(), 1u);
  for (const auto & t : toks) {
    EXPECT_NE(t.kind, TokenKind::NumberLiteral);
  }
}

TEST(SyntaxLexer, UnknownCompositeAttributeWarns)
{
  DiagnosticBag diags;
  Lexer lex("@@map(\"x\")", diags);
  (void)lex.lex_all();

  EXPECT_EQ(diags.with_code("L004").size(), 1u);
}

TEST(SyntaxLexer, UnterminatedBlockCommentWarns)
{
  DiagnosticBag diags;
  Lexer lex("model a { } /* never closed", diags);
  const auto toks = lex.lex_all();

  EXPECT_EQ(diags.with_code("L005").size(), 1u);
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, UnbalancedJsonBlockWarns)
{
  DiagnosticBag diags;
  Lexer lex("meta json { a: { b: string }", diags);
  (void)lex.lex_all();

  EXPECT_EQ(diags.with_code("L006").size(), 1u);
}

TEST(SyntaxLexer, EmptyInputYieldsOnlyEof)
{
  DiagnosticBag diags;
  Lexer lex("  \n // nothing here\n", diags);
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 1u);
  EXPECT_EQ(toks[0].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, RelationKindsAreDecoratorIdentifiers)
{
  DiagnosticBag diags;
  Lexer lex("tags tag[] @many_to_many @one_to_one(tag_id)", diags);
  const auto toks = lex.lex_all();

  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Identifier, TokenKind::LBracket, TokenKind::RBracket,
    TokenKind::At,         TokenKind::Identifier, TokenKind::At,       TokenKind::Identifier,
    TokenKind::LParen,     TokenKind::Identifier, TokenKind::RParen,   TokenKind::Eof,
  };
  EXPECT_EQ(kinds_of(toks), expected);
  EXPECT_EQ(toks[5].text, "many_to_many");
  EXPECT_EQ(toks[7].text, "one_to_one");
  EXPECT_TRUE(diags.empty());
}
