#pragma once

#include <cstdint>
#include <string_view>

#include "schema_dsl/basic/source_file.hpp"

namespace schema_dsl::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,
  KwModel,
  PrimitiveType,  // text is the type name (int, string, json, ...)
  CompositeAttr,  // text is the attribute name without "@@" (unique, index, id)

  NumberLiteral,
  StringLiteral,  // text is the interior, escapes untouched
  JsonBlock,      // text is the whole captured "{...}" block

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Comma,
  Colon,
  At,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range including quotes/braces
  std::string_view text;  // slice view (for StringLiteral: interior)
  LineColumn loc;         // position of the first character

  [[nodiscard]] uint32_t begin() const noexcept { return range.begin(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.end(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::KwModel:
      return "model";
    case TokenKind::PrimitiveType:
      return "type";
    case TokenKind::CompositeAttr:
      return "composite attribute";
    case TokenKind::NumberLiteral:
      return "number";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::JsonBlock:
      return "json block";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::At:
      return "@";
  }
  return "";
}

}  // namespace schema_dsl::syntax
