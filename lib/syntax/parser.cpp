#include "schema_dsl/syntax/parser.hpp"

#include <fmt/core.h>

#include <charconv>
#include <utility>

#include "schema_dsl/syntax/json_shape_parser.hpp"

namespace schema_dsl::syntax
{

namespace
{

std::string describe(const Token & t)
{
  if (t.kind == TokenKind::Eof) {
    return "end of input";
  }
  if (t.kind == TokenKind::CompositeAttr) {
    return fmt::format("'@@{}'", t.text);
  }
  return fmt::format("'{}'", t.text);
}

}  // namespace

Parser::Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens)
: ast_(ast), diags_(diags), tokens_(std::move(tokens))
{
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    eof.kind = TokenKind::Eof;
    const uint32_t at = tokens_.empty() ? 0 : tokens_.back().end();
    eof.range = SourceRange(at, at);
    tokens_.push_back(eof);
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::previous() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

std::optional<ParseFailure> Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return std::nullopt;
  }
  error_at(cur(), fmt::format("Expected {}, found {}", what, describe(cur())), "P001");
  return at_eof() ? ParseFailure::Schema : ParseFailure::Model;
}

void Parser::error_at(const Token & t, std::string message, std::string_view code)
{
  diags_.report_error(t.range, std::move(message)).with_code(std::string(code));
}

void Parser::synchronize_to_model()
{
  while (!at_eof() && !at(TokenKind::KwModel)) {
    advance();
  }
}

bool Parser::is_ident(std::string_view text, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == text;
}

bool Parser::is_name_token(const Token & t)
{
  // Primitive type names double as field names (e.g. `date date`).
  return t.kind == TokenKind::Identifier || t.kind == TokenKind::PrimitiveType;
}

// ============================================================================
// Schema
// ============================================================================

Schema * Parser::parse()
{
  std::vector<ModelDecl *> models;
  const uint32_t begin = cur().begin();

  while (!at_eof()) {
    const size_t before = idx_;

    if (at(TokenKind::KwModel)) {
      auto model = parse_model_definition();
      if (model) {
        models.push_back(model.value);
      } else if (model.failure == ParseFailure::Schema) {
        break;
      } else {
        synchronize_to_model();
      }
    } else {
      error_at(
        cur(), fmt::format("Unexpected token {}, expected 'model'", describe(cur())), "P002");
      synchronize_to_model();
    }

    if (idx_ == before) {
      // Recovery made no progress; drop one token so the loop terminates.
      error_at(cur(), fmt::format("Unexpected token {}", describe(cur())), "P002");
      advance();
    }
  }

  auto * schema = ast_.create<Schema>(SourceRange(begin, cur().end()));
  schema->models = ast_.copy_to_arena(models);
  return schema;
}

// ============================================================================
// Model
// ============================================================================

ParseResult<ModelDecl *> Parser::parse_model_definition()
{
  const Token & kw = advance();  // model

  if (!at(TokenKind::Identifier)) {
    error_at(cur(), fmt::format("Expected model name, found {}", describe(cur())), "P001");
    return ParseResult<ModelDecl *>::fail(at_eof() ? ParseFailure::Schema : ParseFailure::Model);
  }
  const Token & name = advance();

  if (auto f = expect(TokenKind::LBrace, "'{' after model name")) {
    return ParseResult<ModelDecl *>::fail(*f);
  }

  std::vector<FieldDecl *> fields;
  std::vector<CompositeUniqueDecl *> uniques;

  while (!at(TokenKind::RBrace)) {
    if (at_eof()) {
      error_at(
        cur(), fmt::format("Unexpected end of input inside model '{}'", name.text), "P001");
      return ParseResult<ModelDecl *>::fail(ParseFailure::Schema);
    }

    if (is_name_token(cur())) {
      auto field = parse_field_definition();
      if (!field) {
        return ParseResult<ModelDecl *>::fail(*field.failure);
      }
      fields.push_back(field.value);
      continue;
    }

    if (at(TokenKind::CompositeAttr)) {
      auto unique = parse_composite_attribute();
      if (!unique) {
        return ParseResult<ModelDecl *>::fail(*unique.failure);
      }
      if (unique.value != nullptr) {
        uniques.push_back(unique.value);
      }
      continue;
    }

    if (at(TokenKind::KwModel)) {
      // A missing '}' would otherwise swallow the next model.
      error_at(cur(), fmt::format("Expected '}}' to close model '{}'", name.text), "P001");
      return ParseResult<ModelDecl *>::fail(ParseFailure::Model);
    }

    error_at(
      cur(), fmt::format("Unexpected token {} inside model '{}'", describe(cur()), name.text),
      "P003");
    advance();
  }
  const Token & close = advance();  // }

  auto * model =
    ast_.create<ModelDecl>(ast_.intern(name.text), SourceRange(kw.begin(), close.end()), name.loc);
  model->name_range = name.range;
  model->fields = ast_.copy_to_arena(fields);
  model->combined_uniques = ast_.copy_to_arena(uniques);
  return ParseResult<ModelDecl *>::ok(model);
}

// ============================================================================
// Composite attributes
// ============================================================================

ParseResult<CompositeUniqueDecl *> Parser::parse_composite_attribute()
{
  const Token & attr = advance();

  if (attr.text != "unique") {
    diags_
      .report_error(attr.range, fmt::format("'@@{}' blocks are not supported", attr.text))
      .with_code("P006")
      .with_help("use @@unique([a, b]) for multi-column constraints");
    skip_parenthesized();
    return ParseResult<CompositeUniqueDecl *>::ok(nullptr);
  }

  if (auto f = expect(TokenKind::LParen, "'(' after '@@unique'")) {
    return ParseResult<CompositeUniqueDecl *>::fail(*f);
  }
  if (auto f = expect(TokenKind::LBracket, "'[' starting the field list")) {
    return ParseResult<CompositeUniqueDecl *>::fail(*f);
  }

  std::vector<std::string_view> names;
  std::vector<SourceRange> ranges;
  do {
    if (!is_name_token(cur())) {
      error_at(cur(), fmt::format("Expected field name, found {}", describe(cur())), "P001");
      return ParseResult<CompositeUniqueDecl *>::fail(
        at_eof() ? ParseFailure::Schema : ParseFailure::Model);
    }
    const Token & field = advance();
    names.push_back(ast_.intern(field.text));
    ranges.push_back(field.range);
  } while (match(TokenKind::Comma));

  if (auto f = expect(TokenKind::RBracket, "']' closing the field list")) {
    return ParseResult<CompositeUniqueDecl *>::fail(*f);
  }
  if (auto f = expect(TokenKind::RParen, "')' closing '@@unique'")) {
    return ParseResult<CompositeUniqueDecl *>::fail(*f);
  }

  auto * decl = ast_.create<CompositeUniqueDecl>(
    SourceRange(attr.begin(), previous().end()), attr.loc);
  decl->fields = ast_.copy_to_arena(names);
  decl->field_ranges = ast_.copy_to_arena(ranges);
  return ParseResult<CompositeUniqueDecl *>::ok(decl);
}

void Parser::skip_parenthesized()
{
  if (!at(TokenKind::LParen)) {
    return;
  }
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LParen)) {
      ++depth;
    } else if (at(TokenKind::RParen)) {
      --depth;
      if (depth == 0) {
        advance();
        return;
      }
    } else if (at(TokenKind::RBrace) || at(TokenKind::KwModel)) {
      return;
    }
    advance();
  }
}

// ============================================================================
// Fields
// ============================================================================

ParseResult<FieldDecl *> Parser::parse_field_definition()
{
  const Token & name = advance();
  auto * field = ast_.create<FieldDecl>(ast_.intern(name.text), name.range, name.loc);

  if (auto type = parse_field_type(*field); !type) {
    return ParseResult<FieldDecl *>::fail(*type.failure);
  }

  if (at(TokenKind::LBracket)) {
    advance();
    if (auto f = expect(TokenKind::RBracket, "']' after '['")) {
      return ParseResult<FieldDecl *>::fail(*f);
    }
    field->is_array = true;
  }

  while (at(TokenKind::At)) {
    if (auto deco = parse_decorator(*field); !deco) {
      return ParseResult<FieldDecl *>::fail(*deco.failure);
    }
  }

  field->range = SourceRange(name.begin(), previous().end());
  return ParseResult<FieldDecl *>::ok(field);
}

ParseResult<bool> Parser::parse_field_type(FieldDecl & field)
{
  const Token & type = cur();

  if (type.kind == TokenKind::Identifier) {
    advance();
    field.type_name = ast_.intern(type.text);
    return ParseResult<bool>::ok(true);
  }

  if (type.kind != TokenKind::PrimitiveType) {
    error_at(
      type, fmt::format("Expected type for field '{}', found {}", field.name, describe(type)),
      "P001");
    return ParseResult<bool>::fail(at_eof() ? ParseFailure::Schema : ParseFailure::Model);
  }

  advance();
  field.type_name = ast_.intern(type.text);
  field.scalar = parse_scalar_type(type.text);

  if (field.scalar != ScalarType::Json) {
    return ParseResult<bool>::ok(true);
  }

  bool shape_is_array = false;
  if (at(TokenKind::LBracket) && cur(1).kind == TokenKind::RBracket) {
    advance();
    advance();
    shape_is_array = true;
  }

  if (!at(TokenKind::JsonBlock)) {
    diags_
      .report_error(
        cur().range, fmt::format("Expected '{{' describing the shape of json field '{}'", field.name))
      .with_code("P001")
      .with_help("json fields declare their shape, e.g. `meta json { note: string }`");
    return ParseResult<bool>::fail(at_eof() ? ParseFailure::Schema : ParseFailure::Model);
  }

  JsonShapeParser shape_parser(ast_, diags_, advance());
  field.json_shape = shape_parser.parse(shape_is_array);
  return ParseResult<bool>::ok(true);
}

ParseResult<bool> Parser::parse_decorator(FieldDecl & field)
{
  advance();  // @

  if (cur().kind != TokenKind::Identifier) {
    error_at(cur(), fmt::format("Expected decorator name, found {}", describe(cur())), "P001");
    return ParseResult<bool>::fail(at_eof() ? ParseFailure::Schema : ParseFailure::Model);
  }
  const Token & name = advance();

  if (auto kind = parse_relation_kind(name.text)) {
    Relation relation;
    relation.kind = *kind;
    if (match(TokenKind::LParen)) {
      if (cur().kind != TokenKind::Identifier) {
        error_at(
          cur(), fmt::format("Expected foreign key name, found {}", describe(cur())), "P001");
        return ParseResult<bool>::fail(at_eof() ? ParseFailure::Schema : ParseFailure::Model);
      }
      relation.foreign_key = ast_.intern(advance().text);
      if (auto f = expect(TokenKind::RParen, "')' after foreign key name")) {
        return ParseResult<bool>::fail(*f);
      }
    }
    field.relation = relation;
    return ParseResult<bool>::ok(true);
  }

  if (name.text == "primary_key") {
    field.is_primary_key = true;
    return ParseResult<bool>::ok(true);
  }
  if (name.text == "unique") {
    field.is_unique = true;
    return ParseResult<bool>::ok(true);
  }
  if (name.text == "required") {
    field.is_required = true;
    return ParseResult<bool>::ok(true);
  }

  if (name.text == "default") {
    if (auto f = expect(TokenKind::LParen, "'(' after '@default'")) {
      return ParseResult<bool>::fail(*f);
    }
    auto value = parse_default_value();
    if (!value) {
      return ParseResult<bool>::fail(*value.failure);
    }
    if (auto f = expect(TokenKind::RParen, "')' closing '@default'")) {
      return ParseResult<bool>::fail(*f);
    }
    field.default_value = value.value;
    return ParseResult<bool>::ok(true);
  }

  diags_.report_error(name.range, fmt::format("Unknown decorator '@{}'", name.text))
    .with_code("P004")
    .with_help(
      "expected one of @primary_key, @unique, @required, @default(...), "
      "@one_to_many, @many_to_one, @one_to_one or @many_to_many");
  return ParseResult<bool>::fail(ParseFailure::Model);
}

ParseResult<DefaultValue> Parser::parse_default_value()
{
  const Token & t = cur();

  if (t.kind == TokenKind::NumberLiteral) {
    advance();
    double number = 0.0;
    const auto [ptr, ec] = std::from_chars(t.text.data(), t.text.data() + t.text.size(), number);
    if (ec != std::errc{} || ptr != t.text.data() + t.text.size()) {
      error_at(t, fmt::format("Invalid number literal '{}'", t.text), "P005");
      return ParseResult<DefaultValue>::fail(ParseFailure::Model);
    }
    return ParseResult<DefaultValue>::ok(LiteralValue{number});
  }

  if (t.kind == TokenKind::StringLiteral) {
    advance();
    return ParseResult<DefaultValue>::ok(LiteralValue{ast_.intern(t.text)});
  }

  if (is_ident("true", t) || is_ident("false", t)) {
    advance();
    return ParseResult<DefaultValue>::ok(LiteralValue{t.text == "true"});
  }

  if (t.kind == TokenKind::Identifier) {
    if (auto fn = parse_default_function(t.text)) {
      advance();
      if (auto f = expect(TokenKind::LParen, fmt::format("'(' after '{}'", t.text))) {
        return ParseResult<DefaultValue>::fail(*f);
      }
      if (auto f = expect(TokenKind::RParen, fmt::format("')' after '{}('", t.text))) {
        return ParseResult<DefaultValue>::fail(*f);
      }
      return ParseResult<DefaultValue>::ok(FunctionCall{*fn});
    }
  }

  diags_.report_error(t.range, fmt::format("Invalid default value {}", describe(t)))
    .with_code("P005")
    .with_help(
      "a default is a number, a string, true, false, autoincrement(), uuid() or now()");
  return ParseResult<DefaultValue>::fail(at_eof() ? ParseFailure::Schema : ParseFailure::Model);
}

}  // namespace schema_dsl::syntax
