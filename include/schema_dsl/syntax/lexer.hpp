#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/syntax/token.hpp"

namespace schema_dsl::syntax
{

/**
 * Hand-written scanner for schema sources.
 *
 * Lexical problems are reported as warnings (codes L001..L006) and yield
 * Unknown tokens; lex_all() drops those, so the parser never sees them.
 */
class Lexer
{
public:
  Lexer(std::string_view src, DiagnosticBag & diags) : src_(src), diags_(diags) {}

  /// Full token stream, Unknown tokens removed, terminated by Eof.
  [[nodiscard]] std::vector<Token> lex_all();

  /// Next token including Unknown ones.
  [[nodiscard]] Token next_token();

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept;

  void skip_trivia();

  [[nodiscard]] Token scan_token();

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_composite_attribute();
  [[nodiscard]] Token lex_json_block();

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start, LineColumn loc) const noexcept;
  [[nodiscard]] Token make_unknown(uint32_t start, LineColumn loc) const noexcept;

  [[nodiscard]] LineColumn here() const noexcept { return {line_, column_}; }

  std::string_view src_;
  DiagnosticBag & diags_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;
  // Set after a `json` type token; `[` and `]` keep it set.
  bool json_capture_armed_ = false;
};

}  // namespace schema_dsl::syntax
