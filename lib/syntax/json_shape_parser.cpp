#include "schema_dsl/syntax/json_shape_parser.hpp"

#include <fmt/core.h>

#include <cctype>
#include <vector>

namespace schema_dsl::syntax
{

namespace
{

bool is_name_char(char c)
{
  return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '$';
}

}  // namespace

void JsonShapeParser::advance() noexcept
{
  if (eof()) {
    return;
  }
  if (text_[pos_] == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  ++pos_;
}

void JsonShapeParser::skip_trivia() noexcept
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      advance();
    } else if (c == '/' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '/') {
      while (!eof() && peek() != '\n') {
        advance();
      }
    } else {
      return;
    }
  }
}

std::string_view JsonShapeParser::scan_name() noexcept
{
  const size_t start = pos_;
  while (!eof() && is_name_char(peek())) {
    advance();
  }
  return text_.substr(start, pos_ - start);
}

SourceRange JsonShapeParser::range_from(size_t start) const noexcept
{
  return {base_ + static_cast<uint32_t>(start), base_ + static_cast<uint32_t>(pos_)};
}

template <typename T>
ParseResult<T> JsonShapeParser::reject(std::string message)
{
  const auto at = base_ + static_cast<uint32_t>(pos_);
  problem_range_ = SourceRange(at, at + (eof() ? 0 : 1));
  problem_ = std::move(message);
  return ParseResult<T>::fail(ParseFailure::Model);
}

JsonShapeDecl * JsonShapeParser::parse(bool is_array)
{
  auto shape = parse_shape();
  if (shape) {
    skip_trivia();
    if (!eof()) {
      shape = reject<JsonShapeDecl *>("Unexpected text after json type block");
    }
  }

  if (!shape) {
    diags_.report_warning(problem_range_, problem_)
      .with_code("P101")
      .with_help(
        "members are `name: type`, `name?: type`, `name: type | null`, `name: type[]` or "
        "`name: { ... }`; the block is kept as written without member checks");
    auto * raw = ast_.create<JsonShapeDecl>(
      ast_.intern(text_), SourceRange(base_, base_ + static_cast<uint32_t>(text_.size())),
      block_loc_);
    raw->is_array = is_array;
    return raw;
  }

  shape.value->is_array = is_array;
  return shape.value;
}

ParseResult<JsonShapeDecl *> JsonShapeParser::parse_shape()
{
  const size_t start = pos_;
  const LineColumn loc = here();
  advance();  // {

  std::vector<JsonMemberDecl *> members;
  while (true) {
    skip_trivia();
    if (eof()) {
      return reject<JsonShapeDecl *>("Unclosed '{' in json type block");
    }
    if (peek() == '}') {
      advance();
      break;
    }

    auto member = parse_member();
    if (!member) {
      return ParseResult<JsonShapeDecl *>::fail(*member.failure);
    }
    members.push_back(member.value);
  }

  const SourceRange range = range_from(start);
  auto * shape = ast_.create<JsonShapeDecl>(
    ast_.intern(text_.substr(start, pos_ - start)), range, loc);
  shape->members = ast_.copy_to_arena(members);
  return ParseResult<JsonShapeDecl *>::ok(shape);
}

ParseResult<JsonMemberDecl *> JsonShapeParser::parse_member()
{
  const size_t start = pos_;
  const LineColumn loc = here();

  const std::string_view name = scan_name();
  if (name.empty()) {
    return reject<JsonMemberDecl *>(
      fmt::format("Expected member name in json type block, found '{}'", peek()));
  }
  auto * member = ast_.create<JsonMemberDecl>(ast_.intern(name), range_from(start), loc);

  skip_trivia();
  if (peek() == '?') {
    member->is_optional = true;
    advance();
    skip_trivia();
  }

  if (peek() != ':') {
    return reject<JsonMemberDecl *>(fmt::format("Expected ':' after json member '{}'", name));
  }
  advance();
  skip_trivia();

  JsonShapeDecl * nested = nullptr;
  if (peek() == '{') {
    auto shape = parse_shape();
    if (!shape) {
      return ParseResult<JsonMemberDecl *>::fail(*shape.failure);
    }
    nested = shape.value;
    member->nested = nested;
  } else {
    const std::string_view type = scan_name();
    if (type.empty()) {
      return reject<JsonMemberDecl *>(fmt::format("Expected type for json member '{}'", name));
    }
    member->type_name = ast_.intern(type);
  }

  skip_trivia();
  if (peek() == '[') {
    advance();
    skip_trivia();
    if (peek() != ']') {
      return reject<JsonMemberDecl *>(
        fmt::format("Expected ']' after '[' in json member '{}'", name));
    }
    advance();
    member->is_array = true;
    if (nested != nullptr) {
      nested->is_array = true;
    }
  }

  // `type | null` is the nullable spelling of `name?: type`.
  skip_trivia();
  if (peek() == '|') {
    advance();
    skip_trivia();
    if (scan_name() != "null") {
      return reject<JsonMemberDecl *>(
        fmt::format("Only '| null' may follow the type of json member '{}'", name));
    }
    member->is_optional = true;
  }

  skip_trivia();
  if (peek() == ',' || peek() == ';') {
    advance();
  }

  member->range = range_from(start);
  return ParseResult<JsonMemberDecl *>::ok(member);
}

}  // namespace schema_dsl::syntax
