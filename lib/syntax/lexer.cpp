#include "schema_dsl/syntax/lexer.hpp"

#include <fmt/core.h>

#include <cctype>

#include "schema_dsl/syntax/keywords.hpp"

namespace schema_dsl::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::advance(size_t n) noexcept
{
  for (size_t i = 0; i < n && pos_ < src_.size(); ++i) {
    if (src_[pos_] == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    ++pos_;
  }
}

Token Lexer::make_token(TokenKind kind, uint32_t start, LineColumn loc) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
  t.loc = loc;
  return t;
}

Token Lexer::make_unknown(uint32_t start, LineColumn loc) const noexcept
{
  return make_token(TokenKind::Unknown, start, loc);
}

void Lexer::skip_trivia()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
      continue;
    }

    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance();
      }
      continue;
    }

    if (starts_with("/*")) {
      const auto start = static_cast<uint32_t>(pos_);
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance();
      }
      if (eof()) {
        diags_.report_warning(SourceRange(start, start + 2), "Unterminated block comment")
          .with_code("L005")
          .with_help("the rest of the file was treated as a comment");
        return;
      }
      advance(2);
      continue;
    }

    break;
  }
}

Token Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  const LineColumn loc = here();
  advance();
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }

  Token t = make_token(TokenKind::Identifier, start, loc);
  if (t.text == k_model_keyword) {
    t.kind = TokenKind::KwModel;
  } else if (is_primitive_type(t.text)) {
    t.kind = TokenKind::PrimitiveType;
  }
  return t;
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  const LineColumn loc = here();

  if (peek() == '-') {
    advance();
  }
  while (!eof() && is_digit(peek())) {
    advance();
  }

  if (peek() == '.') {
    advance();
    if (!is_digit(peek())) {
      Token t = make_unknown(start, loc);
      diags_.report_warning(t.range, fmt::format("Malformed number '{}'", t.text))
        .with_code("L003")
        .with_help("a decimal point must be followed by at least one digit");
      return t;
    }
    while (!eof() && is_digit(peek())) {
      advance();
    }
  }

  return make_token(TokenKind::NumberLiteral, start, loc);
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  const LineColumn loc = here();
  const char quote = peek();
  advance();

  const auto payload_start = static_cast<uint32_t>(pos_);
  while (!eof() && peek() != quote && peek() != '\n') {
    if (peek() == '\\') {
      // Escapes are passed through as written.
      advance();
    }
    advance();
  }

  if (peek() != quote) {
    Token t = make_unknown(start, loc);
    diags_.report_warning(t.range, "Unterminated string literal", "string starts here")
      .with_code("L002");
    return t;
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance();

  Token t = make_token(TokenKind::StringLiteral, start, loc);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_composite_attribute()
{
  const auto start = static_cast<uint32_t>(pos_);
  const LineColumn loc = here();
  advance(2);  // @@

  const auto name_start = pos_;
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }
  const std::string_view name = src_.substr(name_start, pos_ - name_start);

  if (!is_composite_attribute(name)) {
    Token t = make_unknown(start, loc);
    diags_.report_warning(t.range, fmt::format("Unknown composite attribute '{}'", t.text))
      .with_code("L004")
      .with_help("supported composite attributes are @@unique, @@index and @@id");
    return t;
  }

  Token t = make_token(TokenKind::CompositeAttr, start, loc);
  t.text = name;
  return t;
}

Token Lexer::lex_json_block()
{
  const auto start = static_cast<uint32_t>(pos_);
  const LineColumn loc = here();

  int depth = 0;
  while (!eof()) {
    const char c = peek();
    advance();
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      --depth;
      if (depth == 0) {
        return make_token(TokenKind::JsonBlock, start, loc);
      }
    }
  }

  Token t = make_unknown(start, loc);
  diags_.report_warning(SourceRange(start, start + 1), "Unbalanced braces in json type block")
    .with_code("L006")
    .with_secondary_label(t.range, "block is never closed");
  return t;
}

Token Lexer::scan_token()
{
  skip_trivia();

  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    Token t;
    t.kind = TokenKind::Eof;
    t.range = SourceRange(at, at);
    t.loc = here();
    return t;
  }

  const char c = peek();
  if (json_capture_armed_ && c == '{') {
    return lex_json_block();
  }
  if (is_ident_start(static_cast<unsigned char>(c))) {
    return lex_identifier_or_keyword();
  }
  if (is_digit(c) || (c == '-' && is_digit(peek(1)))) {
    return lex_number();
  }
  if (c == '"' || c == '\'') {
    return lex_string();
  }
  if (starts_with("@@")) {
    return lex_composite_attribute();
  }

  const auto start = static_cast<uint32_t>(pos_);
  const LineColumn loc = here();
  advance();

  switch (c) {
    case '(':
      return make_token(TokenKind::LParen, start, loc);
    case ')':
      return make_token(TokenKind::RParen, start, loc);
    case '{':
      return make_token(TokenKind::LBrace, start, loc);
    case '}':
      return make_token(TokenKind::RBrace, start, loc);
    case '[':
      return make_token(TokenKind::LBracket, start, loc);
    case ']':
      return make_token(TokenKind::RBracket, start, loc);
    case ',':
      return make_token(TokenKind::Comma, start, loc);
    case ':':
      return make_token(TokenKind::Colon, start, loc);
    case '@':
      return make_token(TokenKind::At, start, loc);
    default:
      break;
  }

  Token t = make_unknown(start, loc);
  diags_.report_warning(t.range, fmt::format("Unexpected character '{}'", t.text))
    .with_code("L001");
  return t;
}

Token Lexer::next_token()
{
  Token t = scan_token();

  if (t.kind == TokenKind::PrimitiveType && t.text == "json") {
    json_capture_armed_ = true;
  } else if (t.kind != TokenKind::LBracket && t.kind != TokenKind::RBracket) {
    json_capture_armed_ = false;
  }
  return t;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    if (t.kind == TokenKind::Unknown) {
      continue;
    }
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(t);
    if (done) {
      break;
    }
  }
  return out;
}

}  // namespace schema_dsl::syntax
